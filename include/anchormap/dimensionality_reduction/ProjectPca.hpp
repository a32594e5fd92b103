#ifndef ANCHORMAP_PROJECT_PCA_HPP
#define ANCHORMAP_PROJECT_PCA_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../data/Reduction.hpp"

#include "tatami/tatami.hpp"
#include "irlba/irlba.hpp"
#include "Eigen/Dense"

#include <vector>
#include <string>
#include <cmath>

#include "utils.hpp"

/**
 * @file ProjectPca.hpp
 *
 * @brief Fit a PCA on one dataset and project other datasets into the same space.
 */

namespace anchormap {

/**
 * @brief Fit a PCA on one dataset and project other datasets into the same space.
 *
 * This implements the "pcaproject" strategy for defining a shared space between a reference and query dataset.
 * We perform a PCA on the reference dataset after centering and scaling each feature, using [**CppIrlba**](https://github.com/LTLA/CppIrlba) for speed.
 * Scaled values are capped at `set_scale_max()` to avoid domination by a few extreme values.
 * The query dataset is then centered and scaled with the reference's means and standard deviations, and multiplied by the rotation matrix.
 * This places the query cells in the reference's low-dimensional space without any refitting.
 *
 * The same approach is used to project a full dataset onto a PCA computed from its sketch (see `SketchCells`).
 * Projection streams through the cells of the input matrix, so it can be applied to matrices that are too large to realize in memory.
 */
class ProjectPca {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_rank()` for more details.
         */
        static constexpr int rank = 30;

        /**
         * See `set_scale()` for more details.
         */
        static constexpr bool scale = true;

        /**
         * See `set_scale_max()` for more details.
         */
        static constexpr double scale_max = 10;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

private:
    int rank = Defaults::rank;
    bool scale = Defaults::scale;
    double scale_max = Defaults::scale_max;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param r Number of PCs to compute.
     * This should be smaller than the smaller dimension of the input matrix.
     *
     * @return A reference to this `ProjectPca` instance.
     */
    ProjectPca& set_rank(int r = Defaults::rank) {
        rank = r;
        return *this;
    }

    /**
     * @param s Should features be scaled to unit variance?
     * This should be `false` for SCTransform-normalized data, which is already on a common scale.
     *
     * @return A reference to this `ProjectPca` instance.
     */
    ProjectPca& set_scale(bool s = Defaults::scale) {
        scale = s;
        return *this;
    }

    /**
     * @param m Maximum value of the scaled expression values.
     * Only used if `set_scale()` is `true`.
     *
     * @return A reference to this `ProjectPca` instance.
     */
    ProjectPca& set_scale_max(double m = Defaults::scale_max) {
        scale_max = m;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `ProjectPca` instance.
     */
    ProjectPca& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * @brief Container for the fitted PCA.
     *
     * Instances should be constructed by `ProjectPca::fit()`.
     */
    struct Results {
        /**
         * Matrix of principal components.
         * Each row corresponds to a PC while each column corresponds to a cell in the input matrix.
         */
        Eigen::MatrixXd pcs;

        /**
         * Rotation matrix.
         * Each row corresponds to a feature while each column corresponds to a PC.
         */
        Eigen::MatrixXd rotation;

        /**
         * Mean of each feature.
         */
        Eigen::VectorXd center;

        /**
         * Standard deviation of each feature, used to scale the centered values.
         * This is filled with 1 if `set_scale()` is `false`, or for features with zero variance.
         */
        Eigen::VectorXd scale;

        /**
         * Standard deviation of each PC.
         */
        Eigen::VectorXd stdev;
    };

    /**
     * Fit a PCA to an input feature-by-cell matrix.
     *
     * @tparam T Floating point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param[in] mat Pointer to the input matrix.
     * Columns should contain cells while rows should contain features.
     *
     * @return A `Results` object containing the PCs and rotation matrix.
     */
    template<typename T, typename IDX>
    Results fit(const tatami::Matrix<T, IDX>* mat) const {
        size_t NR = mat->nrow(), NC = mat->ncol();
        if (rank < 1 || static_cast<size_t>(rank) >= std::min(NR, NC)) {
            throw ValidationError("npcs", "number of PCs (" + std::to_string(rank) + ") should be positive and less than the number of features (" + std::to_string(NR) + ") and cells (" + std::to_string(NC) + ")");
        }

        auto scaled = pca_utils::scale_matrix(mat, scale, scale_max, nthreads);
        if (scaled.nonzero_variance == 0) {
            throw DataError("all features have zero variance");
        }

        Results output;
        output.center = std::move(scaled.center);
        if (scale) {
            output.scale = std::move(scaled.scale);
        } else {
            output.scale = Eigen::VectorXd::Ones(NR);
        }

        irlba::EigenThreadScope t(nthreads);
        irlba::Irlba irb;
        irb.set_number(rank);
        irb.run(scaled.values, output.pcs, output.rotation, output.stdev);

        pca_utils::clean_up(NC, output.pcs, output.stdev);
        for (auto& s : output.stdev) {
            s = std::sqrt(s);
        }
        output.pcs.adjointInPlace();

        return output;
    }

    /**
     * Project a feature-by-cell matrix into the space defined by an existing PCA.
     * Each cell is centered and scaled with the supplied statistics, capped at `set_scale_max()` if `set_scale()` is `true`, and multiplied by the rotation matrix.
     *
     * @tparam T Floating point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param[in] mat Pointer to the input matrix.
     * Rows should contain the same features, in the same order, as the rows of `rotation`.
     * @param rotation Rotation matrix where each row is a feature and each column is a PC.
     * @param center Mean of each feature.
     * @param scale_v Standard deviation of each feature.
     * Ignored if `set_scale()` is `false`.
     *
     * @return Matrix of projected coordinates, where each row is a PC and each column is a cell in `mat`.
     */
    template<typename T, typename IDX>
    Eigen::MatrixXd project(const tatami::Matrix<T, IDX>* mat, const Eigen::MatrixXd& rotation, const Eigen::VectorXd& center, const Eigen::VectorXd& scale_v) const {
        size_t NR = mat->nrow(), NC = mat->ncol();
        if (static_cast<size_t>(rotation.rows()) != NR || static_cast<size_t>(center.size()) != NR || (scale && static_cast<size_t>(scale_v.size()) != NR)) {
            throw DataError("number of features in the rotation matrix and scaling vectors should be equal to the number of matrix rows");
        }

        size_t npcs = rotation.cols();
        Eigen::MatrixXd output(npcs, NC);

        tatami::parallelize([&](size_t, IDX start, IDX length) -> void {
            auto ext = tatami::consecutive_extractor<false, false>(mat, start, length);
            std::vector<T> buffer(NR);
            Eigen::VectorXd scaled(NR);

            for (IDX c = start, end = start + length; c < end; ++c) {
                auto ptr = ext->fetch(c, buffer.data());
                for (size_t r = 0; r < NR; ++r) {
                    double val = ptr[r] - center[r];
                    if (scale) {
                        val /= scale_v[r];
                        if (val > scale_max) {
                            val = scale_max;
                        }
                    }
                    scaled[r] = val;
                }
                output.col(c).noalias() = rotation.adjoint() * scaled;
            }
        }, NC, nthreads);

        return output;
    }

    /**
     * @tparam T Floating point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param[in] mat Pointer to the input matrix.
     * Rows should contain the same features, in the same order, as the matrix used in `fit()`.
     * @param fitted Results of `fit()`.
     *
     * @return Matrix of projected coordinates, where each row is a PC and each column is a cell in `mat`.
     */
    template<typename T, typename IDX>
    Eigen::MatrixXd project(const tatami::Matrix<T, IDX>* mat, const Results& fitted) const {
        return project(mat, fitted.rotation, fitted.center, fitted.scale);
    }

    /**
     * Convert the fitted PCA into a `Reduction`.
     *
     * @param fitted Results of `fit()`.
     * @param features Names of the features in the matrix used in `fit()`.
     *
     * @return A `Reduction` containing the PCs as embeddings, the rotation matrix as loadings, and the centering and scaling vectors.
     */
    static Reduction to_reduction(Results fitted, std::vector<std::string> features) {
        Reduction output;
        output.key = "PC_";
        output.embeddings = std::move(fitted.pcs);
        output.loadings = std::move(fitted.rotation);
        output.features = std::move(features);
        output.stdev = std::move(fitted.stdev);
        output.center = std::move(fitted.center);
        output.scale = std::move(fitted.scale);
        return output;
    }
};

}

#endif
