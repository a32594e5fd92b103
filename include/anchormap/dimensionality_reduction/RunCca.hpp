#ifndef ANCHORMAP_RUN_CCA_HPP
#define ANCHORMAP_RUN_CCA_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"

#include "tatami/tatami.hpp"
#include "irlba/irlba.hpp"
#include "Eigen/Dense"

#include <vector>
#include <cmath>

#include "utils.hpp"

/**
 * @file RunCca.hpp
 *
 * @brief Canonical correlation analysis between two datasets.
 */

namespace anchormap {

/**
 * @brief Canonical correlation analysis between two datasets.
 *
 * This implements the "cca" strategy for defining a shared space between a reference and query dataset.
 * Each dataset is centered and scaled separately (capping at `set_scale_max()`), after which the scaled values for each cell are standardized to a mean of zero and unit variance across features.
 * We then compute the truncated SVD of the cross-product between the two standardized matrices, i.e., a reference-by-query matrix.
 * The left singular vectors are used as the reference embeddings and the right singular vectors are used as the query embeddings.
 *
 * The sign of each singular vector pair is arbitrary, so we flip each component such that the first reference cell has a non-negative coordinate.
 * This ensures that the results are consistent across different runs.
 */
class RunCca {
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
     * @param r Number of canonical vectors to compute.
     * This should be smaller than the number of cells in either dataset.
     *
     * @return A reference to this `RunCca` instance.
     */
    RunCca& set_rank(int r = Defaults::rank) {
        rank = r;
        return *this;
    }

    /**
     * @param s Should features be scaled to unit variance within each dataset?
     *
     * @return A reference to this `RunCca` instance.
     */
    RunCca& set_scale(bool s = Defaults::scale) {
        scale = s;
        return *this;
    }

    /**
     * @param m Maximum value of the scaled expression values.
     *
     * @return A reference to this `RunCca` instance.
     */
    RunCca& set_scale_max(double m = Defaults::scale_max) {
        scale_max = m;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `RunCca` instance.
     */
    RunCca& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * @brief Container for the CCA results.
     */
    struct Results {
        /**
         * Reference embeddings, where each row is a canonical vector and each column is a reference cell.
         */
        Eigen::MatrixXd reference;

        /**
         * Query embeddings, where each row is a canonical vector and each column is a query cell.
         */
        Eigen::MatrixXd query;

        /**
         * Singular value for each canonical vector.
         */
        Eigen::VectorXd singular_values;

        /**
         * Projected loadings, where each row is a feature and each column is a canonical vector.
         * These are computed from the scaled (but not standardized) values of both datasets.
         */
        Eigen::MatrixXd projected_loadings;
    };

private:
    static void standardize_cells(Eigen::MatrixXd& emat, int nthreads) {
        // Rows are cells here, so we need a row-wise pass over a column-major matrix.
        size_t NR = emat.rows(), NC = emat.cols();
        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t r = start, end = start + length; r < end; ++r) {
                double mean = 0;
                for (size_t c = 0; c < NC; ++c) {
                    mean += emat(r, c);
                }
                mean /= NC;

                double var = 0;
                for (size_t c = 0; c < NC; ++c) {
                    auto& x = emat.coeffRef(r, c);
                    x -= mean;
                    var += x * x;
                }

                if (var > 0 && NC > 1) {
                    double sd = std::sqrt(var / (NC - 1));
                    for (size_t c = 0; c < NC; ++c) {
                        emat.coeffRef(r, c) /= sd;
                    }
                }
            }
        }, NR, nthreads);
    }

public:
    /**
     * @tparam T Floating point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param[in] ref Pointer to a feature-by-cell matrix for the reference dataset.
     * @param[in] query Pointer to a feature-by-cell matrix for the query dataset.
     * This should have the same features, in the same order, as `ref`.
     *
     * @return A `Results` object containing the embeddings for both datasets.
     */
    template<typename T, typename IDX>
    Results run(const tatami::Matrix<T, IDX>* ref, const tatami::Matrix<T, IDX>* query) const {
        if (ref->nrow() != query->nrow()) {
            throw DataError("reference and query should have the same number of features");
        }

        size_t nref = ref->ncol(), nquery = query->ncol();
        if (rank < 1 || static_cast<size_t>(rank) >= std::min(nref, nquery)) {
            throw ValidationError("dims", "number of canonical vectors (" + std::to_string(rank) + ") should be positive and less than the number of reference (" + std::to_string(nref) + ") and query cells (" + std::to_string(nquery) + ")");
        }

        auto scaled_ref = pca_utils::scale_matrix(ref, scale, scale_max, nthreads);
        auto scaled_query = pca_utils::scale_matrix(query, scale, scale_max, nthreads);
        if (scaled_ref.nonzero_variance == 0 || scaled_query.nonzero_variance == 0) {
            throw DataError("all features have zero variance in the reference or query");
        }

        Eigen::MatrixXd std_ref = scaled_ref.values;
        standardize_cells(std_ref, nthreads);
        Eigen::MatrixXd std_query = scaled_query.values;
        standardize_cells(std_query, nthreads);

        Results output;
        {
            irlba::EigenThreadScope t(nthreads);
            Eigen::MatrixXd cross(nref, nquery);
            cross.noalias() = std_ref * std_query.adjoint();

            irlba::Irlba irb;
            irb.set_number(rank);
            irb.run(cross, output.reference, output.query, output.singular_values);
        }

        // Flipping signs so that the first reference cell is non-negative in each component.
        for (int r = 0; r < rank; ++r) {
            if (output.reference(0, r) < 0) {
                output.reference.col(r) *= -1;
                output.query.col(r) *= -1;
            }
        }

        output.reference.adjointInPlace();
        output.query.adjointInPlace();

        output.projected_loadings = pca_utils::compute_projected_loadings(scaled_ref.values, output.reference);
        output.projected_loadings += pca_utils::compute_projected_loadings(scaled_query.values, output.query);
        return output;
    }
};

}

#endif
