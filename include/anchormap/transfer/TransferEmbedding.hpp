#ifndef ANCHORMAP_TRANSFER_EMBEDDING_HPP
#define ANCHORMAP_TRANSFER_EMBEDDING_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../anchors/Anchor.hpp"
#include "FindWeights.hpp"

#include "tatami/tatami.hpp"
#include "Eigen/Dense"

#include <vector>
#include <limits>
#include <string>

/**
 * @file TransferEmbedding.hpp
 *
 * @brief Transfer continuous coordinates from the reference to the query.
 */

namespace anchormap {

/**
 * @brief Transfer continuous coordinates from the reference to the query.
 *
 * Each query cell is placed at the weighted average of the coordinates of the reference cells of its anchors.
 * This is typically used to map query cells onto a pre-existing visualization of the reference, e.g., a UMAP.
 */
class TransferEmbedding {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `TransferEmbedding` object.
     */
    TransferEmbedding& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param anchors Vector of anchors.
     * @param weights Weights of the anchors for each query cell, typically from `FindWeights`.
     * @param reference Matrix of reference coordinates where each row is a dimension and each column is a reference cell.
     *
     * @return Matrix of transferred coordinates where each row is a dimension and each column is a query cell.
     * Query cells with no non-zero weights are assigned NaN coordinates.
     */
    Eigen::MatrixXd run(const std::vector<Anchor>& anchors, const AnchorWeights& weights, const Eigen::MatrixXd& reference) const {
        size_t nref = reference.cols();
        for (const auto& a : anchors) {
            if (static_cast<size_t>(a.reference) >= nref) {
                throw DataError("anchor reference index " + std::to_string(a.reference) + " is out of range");
            }
        }

        size_t nquery = weights.size();
        Eigen::MatrixXd output = Eigen::MatrixXd::Zero(reference.rows(), nquery);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t q = start, end = start + length; q < end; ++q) {
                auto col = output.col(q);
                double total = 0;
                for (const auto& w : weights[q]) {
                    col += w.second * reference.col(anchors[w.first].reference);
                    total += w.second;
                }

                if (total > 0) {
                    col /= total;
                } else {
                    col.fill(std::numeric_limits<double>::quiet_NaN());
                }
            }
        }, nquery, nthreads);

        return output;
    }
};

}

#endif
