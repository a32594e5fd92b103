#ifndef TEST_MACROS_H
#define TEST_MACROS_H

#ifdef TEST_ANCHORMAP_CUSTOM_PARALLEL
#include "custom_parallel.h"

// Forwarding to tatami and irlba before any of their headers are included.
#include "anchormap/utils/macros.hpp"
#endif

#endif
