#ifndef ANCHORMAP_FIND_ANCHOR_PAIRS_HPP
#define ANCHORMAP_FIND_ANCHOR_PAIRS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../neighbors/NeighborList.hpp"
#include "Anchor.hpp"

#include <vector>
#include <algorithm>
#include <string>

/**
 * @file FindAnchorPairs.hpp
 *
 * @brief Identify mutual nearest neighbors between two datasets.
 */

namespace anchormap {

/**
 * @brief Identify mutual nearest neighbors between two datasets.
 *
 * A reference cell and a query cell form an anchor if each is among the other's `k` nearest neighbors in the opposite dataset.
 * These mutual nearest neighbor (MNN) pairs are assumed to represent the same biological state in both datasets,
 * and are used as control points to transfer information from the reference to the query.
 */
class FindAnchorPairs {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for more details.
         */
        static constexpr int num_neighbors = 5;
    };

    /**
     * @param k Number of neighbors to use when checking for mutual neighbors.
     * Larger values will yield more anchors.
     *
     * @return A reference to this `FindAnchorPairs` object.
     */
    FindAnchorPairs& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;

public:
    /**
     * @param ref_to_query Nearest query cells for each reference cell, sorted by increasing distance.
     * @param query_to_ref Nearest reference cells for each query cell, sorted by increasing distance.
     *
     * @return Vector of anchors, each with a score of 1.
     * Anchors are ordered by the reference cell and then by the rank of the query cell among that reference cell's neighbors.
     * Only the first `set_num_neighbors()` entries of each neighbor list are considered.
     */
    std::vector<Anchor> run(const NeighborList& ref_to_query, const NeighborList& query_to_ref) const {
        if (num_neighbors < 1) {
            throw ValidationError("k_anchor", "should be positive");
        }

        size_t k = num_neighbors;
        std::vector<Anchor> output;

        for (size_t r = 0, nref = ref_to_query.size(); r < nref; ++r) {
            const auto& current = ref_to_query[r];
            auto limit = std::min(k, current.size());

            for (size_t i = 0; i < limit; ++i) {
                auto q = current[i].first;
                if (static_cast<size_t>(q) >= query_to_ref.size()) {
                    throw DataError("neighbor index " + std::to_string(q) + " is out of range for the query");
                }

                const auto& other = query_to_ref[q];
                auto olimit = std::min(k, other.size());
                for (size_t j = 0; j < olimit; ++j) {
                    if (static_cast<size_t>(other[j].first) == r) {
                        output.emplace_back(r, q, 1);
                        break;
                    }
                }
            }
        }

        return output;
    }
};

}

#endif
