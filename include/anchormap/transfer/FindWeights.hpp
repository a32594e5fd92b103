#ifndef ANCHORMAP_FIND_WEIGHTS_HPP
#define ANCHORMAP_FIND_WEIGHTS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../anchors/Anchor.hpp"

#include "knncolle/knncolle.hpp"
#include "tatami/tatami.hpp"

#include <vector>
#include <memory>
#include <cmath>
#include <string>

/**
 * @file FindWeights.hpp
 *
 * @brief Compute the weight of each anchor for each query cell.
 */

namespace anchormap {

/**
 * Weights of the anchors for each query cell.
 * Each inner vector contains pairs of anchor indices (i.e., positions in the vector of anchors) and their weights.
 * For each query cell, the weights sum to 1 unless all of them are zero.
 */
typedef std::vector<std::vector<std::pair<int, double> > > AnchorWeights;

/**
 * @brief Compute the weight of each anchor for each query cell.
 *
 * Each anchor is represented by the coordinates of its query cell in a "weight embedding", typically the shared space used to find the anchors.
 * For each query cell, we find its `k` nearest anchors in this embedding.
 * The raw weight of each of these anchors is defined as $(1 - d / d_k) s$, where $d$ is the distance to the anchor, $d_k$ is the distance to the `k`-th nearest anchor and $s$ is the anchor score.
 * (If $d_k$ is zero, the distance term is set to 1.)
 * The raw weight $w$ is then transformed with a Gaussian kernel, i.e., $1 - \exp(-w / (2 / \sigma)^2)$ where $\sigma$ is the bandwidth in `set_sd()`.
 * Finally, the weights are normalized to sum to 1 for each query cell.
 */
class FindWeights {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for more details.
         */
        static constexpr int num_neighbors = 50;

        /**
         * See `set_sd()` for more details.
         */
        static constexpr double sd = 1;

        /**
         * See `set_approximate()` for more details.
         */
        static constexpr bool approximate = false;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param k Number of nearest anchors to use for each query cell.
     * This should be positive and no greater than the number of anchors.
     *
     * @return A reference to this `FindWeights` object.
     */
    FindWeights& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param s Bandwidth of the Gaussian kernel.
     * Larger values increase the weight of more distant anchors relative to closer anchors.
     *
     * @return A reference to this `FindWeights` object.
     */
    FindWeights& set_sd(double s = Defaults::sd) {
        sd = s;
        return *this;
    }

    /**
     * @param a Whether approximate neighbor detection should be used.
     *
     * @return A reference to this `FindWeights` object.
     */
    FindWeights& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `FindWeights` object.
     */
    FindWeights& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;
    double sd = Defaults::sd;
    bool approximate = Defaults::approximate;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param anchors Vector of anchors.
     * Query indices should be less than `nquery`.
     * @param ndim Number of dimensions in the weight embedding.
     * @param nquery Number of query cells.
     * @param[in] query Pointer to a column-major array where each row is a dimension and each column is a query cell.
     *
     * @return Weights of the nearest anchors for each query cell, in order of increasing distance.
     */
    AnchorWeights run(const std::vector<Anchor>& anchors, int ndim, size_t nquery, const double* query) const {
        size_t nanchors = anchors.size();
        if (num_neighbors < 1 || static_cast<size_t>(num_neighbors) > nanchors) {
            throw ValidationError("k_weight", "should be positive and no greater than the number of anchors (" + std::to_string(nanchors) + ")");
        }
        if (sd <= 0) {
            throw ValidationError("sd_weight", "should be positive");
        }

        size_t stride = ndim;
        std::vector<double> coordinates(stride * nanchors);
        for (size_t a = 0; a < nanchors; ++a) {
            size_t q = anchors[a].query;
            if (q >= nquery) {
                throw DataError("anchor query index " + std::to_string(q) + " is out of range");
            }
            std::copy(query + q * stride, query + (q + 1) * stride, coordinates.data() + a * stride);
        }

        std::shared_ptr<knncolle::Base<int, double> > index;
        if (approximate) {
            index.reset(new knncolle::AnnoyEuclidean<int, double>(ndim, nanchors, coordinates.data()));
        } else {
            index.reset(new knncolle::VpTreeEuclidean<int, double>(ndim, nanchors, coordinates.data()));
        }

        const double bandwidth = std::pow(2 / sd, 2);
        AnchorWeights output(nquery);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t q = start, end = start + length; q < end; ++q) {
                auto& current = output[q];
                current = index->find_nearest_neighbors(query + q * stride, num_neighbors);

                double furthest = current.back().second;
                double total = 0;
                for (auto& c : current) {
                    double w = (furthest > 0 ? 1 - c.second / furthest : 1);
                    w *= anchors[c.first].score;
                    c.second = 1 - std::exp(-w / bandwidth);
                    total += c.second;
                }

                if (total > 0) {
                    for (auto& c : current) {
                        c.second /= total;
                    }
                }
            }
        }, nquery, nthreads);

        return output;
    }
};

}

#endif
