#ifndef ANCHORMAP_PCA_UTILS_HPP
#define ANCHORMAP_PCA_UTILS_HPP

#include "../utils/macros.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

#include "tatami/tatami.hpp"
#include "Eigen/Dense"

#include "convert.hpp"

namespace anchormap {

namespace pca_utils {

inline void clean_up(size_t NC, Eigen::MatrixXd& U, Eigen::VectorXd& D) {
    auto uIt = U.data();
    auto dIt = D.data();
    for (int i = 0, iend = U.cols(); i < iend; ++i, ++dIt) {
        for (int j = 0, jend = U.rows(); j < jend; ++j, ++uIt) {
            (*uIt) *= (*dIt);
        }
    }

    for (auto& d : D) {
        d = d * d / static_cast<double>(NC - 1);
    }
    return;
}

/*
 * Converts variances to standard deviations in place, replacing zeros with 1
 * to avoid division by zero. Returns the number of features with non-zero variance.
 */
inline size_t process_scale_vector(Eigen::VectorXd& scale_v) {
    size_t nonzero = 0;
    for (auto& s : scale_v) {
        if (s > 0) {
            s = std::sqrt(s);
            ++nonzero;
        } else {
            s = 1;
        }
    }
    return nonzero;
}

inline void compute_mean_and_variance_from_dense_matrix(const Eigen::MatrixXd& emat, Eigen::VectorXd& center_v, Eigen::VectorXd& scale_v, int nthreads) {
    tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
        size_t ncells = emat.rows();
        const double* ptr = emat.data() + static_cast<size_t>(start) * ncells; // enforce size_t to avoid overflow issues.
        for (size_t c = start, end = start + length; c < end; ++c, ptr += ncells) {
            auto results = tatami::stats::variances::compute_direct(ptr, ncells);
            center_v.coeffRef(c) = results.first;
            scale_v.coeffRef(c) = results.second;
        }
    }, emat.cols(), nthreads);
}

/*
 * Values above 'clip' are capped after scaling, to avoid domination by a few
 * extreme values. This is only applied when 'scale = true'.
 */
inline void apply_center_and_scale_to_dense_matrix(Eigen::MatrixXd& emat, const Eigen::VectorXd& center_v, bool scale, const Eigen::VectorXd& scale_v, double clip, int nthreads) {
    tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
        size_t NR = emat.rows();
        double* ptr = emat.data() + static_cast<size_t>(start) * NR;
        for (size_t c = start, end = start + length; c < end; ++c, ptr += NR) {
            auto mean = center_v[c];
            for (size_t r = 0; r < NR; ++r) {
                ptr[r] -= mean;
            }

            if (scale) {
                auto sd = scale_v[c];
                for (size_t r = 0; r < NR; ++r) {
                    ptr[r] /= sd; // process_scale_vector should already protect against division by zero.
                    if (ptr[r] > clip) {
                        ptr[r] = clip;
                    }
                }
            }
        }
    }, emat.cols(), nthreads);
}

/*
 * Returns a cell-by-feature matrix of centered (and possibly scaled) values,
 * along with the mean and standard deviation of each feature.
 */
struct ScaledMatrix {
    Eigen::MatrixXd values;
    Eigen::VectorXd center, scale;
    size_t nonzero_variance = 0;
};

template<typename T, typename IDX>
ScaledMatrix scale_matrix(const tatami::Matrix<T, IDX>* mat, bool scale, double clip, int nthreads) {
    ScaledMatrix output;
    output.values = extract_dense_for_pca(mat, nthreads);

    size_t nfeatures = output.values.cols();
    output.center.resize(nfeatures);
    output.scale.resize(nfeatures);
    compute_mean_and_variance_from_dense_matrix(output.values, output.center, output.scale, nthreads);
    output.nonzero_variance = process_scale_vector(output.scale);

    apply_center_and_scale_to_dense_matrix(output.values, output.center, scale, output.scale, clip, nthreads);
    return output;
}

template<typename T, typename IDX>
Eigen::MatrixXd scale_matrix_with_known_stats(const tatami::Matrix<T, IDX>* mat, const Eigen::VectorXd& center_v, bool scale, const Eigen::VectorXd& scale_v, double clip, int nthreads) {
    auto emat = extract_dense_for_pca(mat, nthreads);
    apply_center_and_scale_to_dense_matrix(emat, center_v, scale, scale_v, clip, nthreads);
    return emat;
}

/*
 * 'scaled' is a cell-by-feature matrix while 'embeddings' is a dims-by-cell
 * matrix, so the product is a feature-by-dims matrix of projected loadings.
 */
inline Eigen::MatrixXd compute_projected_loadings(const Eigen::MatrixXd& scaled, const Eigen::MatrixXd& embeddings) {
    Eigen::MatrixXd output(scaled.cols(), embeddings.rows());
    output.noalias() = scaled.adjoint() * embeddings.adjoint();
    return output;
}

template<typename T, typename IDX>
std::shared_ptr<const tatami::Matrix<T, IDX> > subset_matrix_by_features(std::shared_ptr<const tatami::Matrix<T, IDX> > mat, std::vector<IDX> features) {
    return tatami::make_DelayedSubset<0>(std::move(mat), std::move(features));
}

}

}

#endif
