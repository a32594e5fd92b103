#ifndef ANCHORMAP_L2_NORMALIZE_HPP
#define ANCHORMAP_L2_NORMALIZE_HPP

#include "../utils/macros.hpp"
#include "../data/Reduction.hpp"

#include "Eigen/Dense"

#include <cmath>

/**
 * @file l2_normalize.hpp
 *
 * @brief L2-normalize the embedding of each cell.
 */

namespace anchormap {

/**
 * Scale each cell's coordinates to unit length, so that Euclidean distances between cells are monotonic with their cosine distances.
 * Cells with all-zero coordinates are left unchanged.
 *
 * @param ndim Number of dimensions.
 * @param nobs Number of cells.
 * @param[in, out] data Pointer to a column-major array where each row is a dimension and each column is a cell.
 * On output, each column is L2-normalized.
 */
inline void l2_normalize(size_t ndim, size_t nobs, double* data) {
    for (size_t c = 0; c < nobs; ++c, data += ndim) {
        double l2 = 0;
        for (size_t d = 0; d < ndim; ++d) {
            l2 += data[d] * data[d];
        }

        if (l2 > 0) {
            l2 = std::sqrt(l2);
            for (size_t d = 0; d < ndim; ++d) {
                data[d] /= l2;
            }
        }
    }
}

/**
 * @param embeddings Matrix where each row is a dimension and each column is a cell.
 *
 * @return Copy of `embeddings` where each column is L2-normalized.
 */
inline Eigen::MatrixXd l2_normalize(Eigen::MatrixXd embeddings) {
    l2_normalize(embeddings.rows(), embeddings.cols(), embeddings.data());
    return embeddings;
}

/**
 * @param reduction A reduction.
 *
 * @return Copy of `reduction` with L2-normalized embeddings.
 * All other members are unchanged.
 */
inline Reduction l2_normalize(Reduction reduction) {
    l2_normalize(reduction.embeddings.rows(), reduction.embeddings.cols(), reduction.embeddings.data());
    return reduction;
}

}

#endif
