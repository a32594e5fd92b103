#ifndef ANCHORMAP_MACROS_HPP
#define ANCHORMAP_MACROS_HPP

/**
 * @file macros.hpp
 *
 * @brief Macros for customizing the parallelization in **libanchormap**.
 *
 * @details
 * Defining `ANCHORMAP_CUSTOM_PARALLEL` replaces the default `std::thread`-based scheme used by all per-cell and per-feature loops.
 * It should name a function template that is called as `ANCHORMAP_CUSTOM_PARALLEL(fun, njobs, nthreads)`,
 * where `fun(thread, start, length)` processes the jobs in `[start, start + length)`.
 * The function may split `[0, njobs)` into any set of contiguous, non-overlapping intervals, but should only return after `fun` has been applied to all of them.
 *
 * The same scheme is forwarded to **tatami** (as `TATAMI_CUSTOM_PARALLEL`) and **irlba** (as `IRLBA_CUSTOM_PARALLEL`) unless those macros are already defined.
 * Applications should include this header before any **tatami** or **irlba** header so that every translation unit sees the same definitions.
 */

#ifdef ANCHORMAP_CUSTOM_PARALLEL

#ifndef TATAMI_CUSTOM_PARALLEL
#define TATAMI_CUSTOM_PARALLEL ANCHORMAP_CUSTOM_PARALLEL
#endif

#ifndef IRLBA_CUSTOM_PARALLEL
namespace anchormap {

template<class Function>
void irlba_parallelize_(int nthreads, Function fun) {
    ANCHORMAP_CUSTOM_PARALLEL([&](size_t, size_t f, size_t l) -> void {
        // irlba expects one job per thread, but the scheme may still merge jobs.
        for (size_t i = 0; i < l; ++i) {
            fun(f + i);
        }
    }, nthreads, nthreads);
}

}

#define IRLBA_CUSTOM_PARALLEL anchormap::irlba_parallelize_
#endif

#endif

#endif
