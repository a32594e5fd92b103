#ifndef ANCHORMAP_NEIGHBOR_LIST_HPP
#define ANCHORMAP_NEIGHBOR_LIST_HPP

#include <vector>
#include <utility>

/**
 * @file NeighborList.hpp
 *
 * @brief Type of the neighbor search results.
 */

namespace anchormap {

/**
 * Nearest neighbors for each observation.
 * Each inner vector contains the indices and distances of the neighbors of one observation, sorted by increasing distance.
 * This is the same as the output of `knncolle::Base::find_nearest_neighbors()` for each observation.
 */
typedef std::vector<std::vector<std::pair<int, double> > > NeighborList;

}

#endif
