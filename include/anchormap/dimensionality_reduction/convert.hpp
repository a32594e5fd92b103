#ifndef ANCHORMAP_PCA_CONVERT_HPP
#define ANCHORMAP_PCA_CONVERT_HPP

#include "../utils/macros.hpp"

#include <vector>

#include "tatami/tatami.hpp"
#include "Eigen/Dense"

namespace anchormap {

namespace pca_utils {

namespace extract_for_pca_internal {

template<typename T, typename IDX>
Eigen::MatrixXd dense_by_row(const tatami::Matrix<T, IDX>* mat, int nthreads) {
    size_t NR = mat->nrow(), NC = mat->ncol();
    Eigen::MatrixXd output(NC, NR); // transposed, we want our features in the columns.
    auto ptr = output.data();

    tatami::parallelize([&](size_t, IDX start, IDX length) -> void {
        auto ext = tatami::consecutive_extractor<true, false>(mat, start, length);
        for (IDX r = start, end = start + length; r < end; ++r) {
            ext->fetch_copy(r, ptr + static_cast<size_t>(r) * NC); // enforce size_t to avoid overflow issues.
        }
    }, NR, nthreads);

    return output;
}

template<typename T, typename IDX>
Eigen::MatrixXd dense_by_column(const tatami::Matrix<T, IDX>* mat, int nthreads) {
    size_t NR = mat->nrow(), NC = mat->ncol();
    Eigen::MatrixXd output(NC, NR); // transposed, we want our features in the columns.

    tatami::parallelize([&](size_t, IDX start, IDX length) -> void {
        auto ext = tatami::consecutive_extractor<false, false>(mat, 0, NC, start, length);
        std::vector<T> buffer(length);

        for (size_t c = 0; c < NC; ++c) {
            auto ptr = ext->fetch(c, buffer.data());
            for (IDX r = 0; r < length; ++r) {
                output(c, r + start) = ptr[r];
            }
        }
    }, NR, nthreads);

    return output;
}

}

/*
 * Realizes a feature-by-cell matrix into a dense cell-by-feature Eigen matrix.
 * Each column of the output is a feature, which is convenient for per-feature centering and scaling.
 */
template<typename T, typename IDX>
Eigen::MatrixXd extract_dense_for_pca(const tatami::Matrix<T, IDX>* mat, int nthreads) {
    if (mat->prefer_rows()) {
        return extract_for_pca_internal::dense_by_row(mat, nthreads);
    } else {
        return extract_for_pca_internal::dense_by_column(mat, nthreads);
    }
}

}

}

#endif
