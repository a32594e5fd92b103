#ifndef ANCHORMAP_SCORE_ANCHORS_HPP
#define ANCHORMAP_SCORE_ANCHORS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../neighbors/NeighborList.hpp"
#include "Anchor.hpp"

#include "tatami/tatami.hpp"

#include <vector>
#include <algorithm>
#include <cmath>
#include <limits>

/**
 * @file ScoreAnchors.hpp
 *
 * @brief Score anchors by the consistency of their neighborhoods.
 */

namespace anchormap {

/**
 * @brief Score anchors by the consistency of their neighborhoods.
 *
 * For each anchor, we define a neighborhood around the reference cell that contains the cell itself, its `k - 1` nearest reference neighbors and its `k` nearest query neighbors.
 * Similarly, the neighborhood around the query cell contains its `k` nearest reference neighbors, the cell itself and its `k - 1` nearest query neighbors.
 * The raw score is the number of cells that are shared between the two neighborhoods.
 * Anchors between cells in the same local structure will have many shared neighbors, while spurious anchors will have few.
 *
 * The raw scores are then rescaled to `[0, 1]` using the 1% and 90% quantiles of the raw scores across all anchors.
 * Scores below the lower quantile are set to zero and those above the upper quantile are set to 1.
 * Anchors with a score of zero are still reported.
 */
class ScoreAnchors {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for more details.
         */
        static constexpr int num_neighbors = 30;

        /**
         * See `set_lower_quantile()` for more details.
         */
        static constexpr double lower_quantile = 0.01;

        /**
         * See `set_upper_quantile()` for more details.
         */
        static constexpr double upper_quantile = 0.9;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param k Number of neighbors used to define each neighborhood.
     *
     * @return A reference to this `ScoreAnchors` object.
     */
    ScoreAnchors& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param q Quantile of the raw scores that is mapped to a score of zero.
     *
     * @return A reference to this `ScoreAnchors` object.
     */
    ScoreAnchors& set_lower_quantile(double q = Defaults::lower_quantile) {
        lower_quantile = q;
        return *this;
    }

    /**
     * @param q Quantile of the raw scores that is mapped to a score of 1.
     *
     * @return A reference to this `ScoreAnchors` object.
     */
    ScoreAnchors& set_upper_quantile(double q = Defaults::upper_quantile) {
        upper_quantile = q;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `ScoreAnchors` object.
     */
    ScoreAnchors& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;
    double lower_quantile = Defaults::lower_quantile;
    double upper_quantile = Defaults::upper_quantile;
    int nthreads = Defaults::num_threads;

    static void add_neighbors(const std::vector<std::pair<int, double> >& neighbors, size_t k, int offset, std::vector<int>& output) {
        auto limit = std::min(k, neighbors.size());
        for (size_t i = 0; i < limit; ++i) {
            output.push_back(neighbors[i].first + offset);
        }
    }

    static size_t count_shared(std::vector<int>& left, std::vector<int>& right) {
        std::sort(left.begin(), left.end());
        left.erase(std::unique(left.begin(), left.end()), left.end());
        std::sort(right.begin(), right.end());
        right.erase(std::unique(right.begin(), right.end()), right.end());

        size_t shared = 0;
        auto lIt = left.begin(), rIt = right.begin();
        while (lIt != left.end() && rIt != right.end()) {
            if (*lIt < *rIt) {
                ++lIt;
            } else if (*rIt < *lIt) {
                ++rIt;
            } else {
                ++shared;
                ++lIt;
                ++rIt;
            }
        }
        return shared;
    }

public:
    /**
     * Compute a quantile with linear interpolation between order statistics, i.e., type 7 in R's `quantile()`.
     *
     * @param sorted Values sorted in increasing order.
     * @param p Probability in `[0, 1]`.
     *
     * @return The quantile corresponding to `p`.
     */
    static double quantile(const std::vector<double>& sorted, double p) {
        if (sorted.empty()) {
            return std::numeric_limits<double>::quiet_NaN();
        }

        double h = (sorted.size() - 1) * p;
        size_t lo = std::floor(h);
        if (lo + 1 >= sorted.size()) {
            return sorted.back();
        }

        double frac = h - lo;
        return sorted[lo] + frac * (sorted[lo + 1] - sorted[lo]);
    }

    /**
     * Compute raw shared-neighbor counts for each anchor.
     *
     * @param anchors Vector of anchors.
     * @param ref_to_ref Nearest reference cells for each reference cell, excluding itself.
     * @param ref_to_query Nearest query cells for each reference cell.
     * @param query_to_ref Nearest reference cells for each query cell.
     * @param query_to_query Nearest query cells for each query cell, excluding itself.
     *
     * @return Number of shared neighbors for each anchor.
     */
    std::vector<double> compute_shared(
        const std::vector<Anchor>& anchors,
        const NeighborList& ref_to_ref,
        const NeighborList& ref_to_query,
        const NeighborList& query_to_ref,
        const NeighborList& query_to_query)
    const {
        if (num_neighbors < 1) {
            throw ValidationError("k_score", "should be positive");
        }

        size_t k = num_neighbors;
        int offset = ref_to_ref.size(); // query cells are numbered after the reference cells.
        size_t nanchors = anchors.size();
        std::vector<double> shared(nanchors);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<int> left, right;
            for (size_t a = start, end = start + length; a < end; ++a) {
                auto r = anchors[a].reference;
                auto q = anchors[a].query;

                left.clear();
                left.push_back(r);
                add_neighbors(ref_to_ref[r], k - 1, 0, left);
                add_neighbors(ref_to_query[r], k, offset, left);

                right.clear();
                add_neighbors(query_to_ref[q], k, 0, right);
                right.push_back(q + offset);
                add_neighbors(query_to_query[q], k - 1, offset, right);

                shared[a] = count_shared(left, right);
            }
        }, nanchors, nthreads);

        return shared;
    }

    /**
     * Rescale raw shared-neighbor counts to `[0, 1]`.
     * If the two quantiles are equal, all anchors with a positive count receive a score of 1.
     *
     * @param[in, out] scores Raw shared-neighbor counts for each anchor.
     * On output, these are replaced with the rescaled scores.
     */
    void rescale(std::vector<double>& scores) const {
        if (scores.empty()) {
            return;
        }

        auto sorted = scores;
        std::sort(sorted.begin(), sorted.end());
        double lower = quantile(sorted, lower_quantile);
        double upper = quantile(sorted, upper_quantile);

        if (upper > lower) {
            double range = upper - lower;
            for (auto& s : scores) {
                s = std::max(0.0, std::min(1.0, (s - lower) / range));
            }
        } else {
            for (auto& s : scores) {
                s = (s > 0 ? 1 : 0);
            }
        }
    }

    /**
     * @param anchors Vector of anchors, typically generated by `FindAnchorPairs`.
     * @param ref_to_ref Nearest reference cells for each reference cell, excluding itself.
     * @param ref_to_query Nearest query cells for each reference cell.
     * @param query_to_ref Nearest reference cells for each query cell.
     * @param query_to_query Nearest query cells for each query cell, excluding itself.
     *
     * @return Copy of `anchors` with the scores filled in.
     */
    std::vector<Anchor> run(
        std::vector<Anchor> anchors,
        const NeighborList& ref_to_ref,
        const NeighborList& ref_to_query,
        const NeighborList& query_to_ref,
        const NeighborList& query_to_query)
    const {
        auto scores = compute_shared(anchors, ref_to_ref, ref_to_query, query_to_ref, query_to_query);
        rescale(scores);
        for (size_t a = 0; a < anchors.size(); ++a) {
            anchors[a].score = scores[a];
        }
        return anchors;
    }
};

}

#endif
