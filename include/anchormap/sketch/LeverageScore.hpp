#ifndef ANCHORMAP_LEVERAGE_SCORE_HPP
#define ANCHORMAP_LEVERAGE_SCORE_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../dimensionality_reduction/convert.hpp"

#include "tatami/tatami.hpp"
#include "aarand/aarand.hpp"
#include "Eigen/Dense"

#include <vector>
#include <random>
#include <cmath>
#include <cstdint>

/**
 * @file LeverageScore.hpp
 *
 * @brief Approximate the statistical leverage of each cell.
 */

namespace anchormap {

/**
 * @brief Approximate the statistical leverage of each cell.
 *
 * The leverage score of a cell is the squared norm of its row in the left singular vectors of the cell-by-feature matrix.
 * Cells with high leverage are those that are poorly represented by the other cells, e.g., members of rare populations.
 * Sampling cells with probability proportional to their leverage scores yields a subset that preserves rare populations better than uniform sampling.
 *
 * To avoid a full SVD, we use the approach of Drineas et al. (2012):
 *
 * 1. Compress the cells into `set_num_sketch()` rows with a CountSketch, where each cell is added with a random sign to a randomly chosen row.
 *    This is skipped if the number of cells is already below the sketch size.
 * 2. Compute a column-pivoted QR decomposition of the sketched matrix to obtain $R$.
 * 3. Multiply $R^{-1}$ by a Gaussian Johnson-Lindenstrauss matrix with `set_num_dims()` columns.
 * 4. For each cell, compute the squared norm of its expression profile multiplied by the above matrix.
 *
 * The random numbers are generated sequentially from the seed, so the scores do not depend on the number of threads.
 */
class LeverageScore {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_sketch()` for more details.
         */
        static constexpr int num_sketch = 5000;

        /**
         * See `set_num_dims()` for more details.
         */
        static constexpr int num_dims = 50;

        /**
         * See `set_seed()` for more details.
         */
        static constexpr uint64_t seed = 123;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param n Number of rows in the CountSketch.
     *
     * @return A reference to this `LeverageScore` object.
     */
    LeverageScore& set_num_sketch(int n = Defaults::num_sketch) {
        num_sketch = n;
        return *this;
    }

    /**
     * @param n Number of columns in the Johnson-Lindenstrauss matrix.
     * Larger values improve the accuracy of the approximation at the cost of speed.
     *
     * @return A reference to this `LeverageScore` object.
     */
    LeverageScore& set_num_dims(int n = Defaults::num_dims) {
        num_dims = n;
        return *this;
    }

    /**
     * @param s Seed for the random number generator.
     *
     * @return A reference to this `LeverageScore` object.
     */
    LeverageScore& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `LeverageScore` object.
     */
    LeverageScore& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_sketch = Defaults::num_sketch;
    int num_dims = Defaults::num_dims;
    uint64_t seed = Defaults::seed;
    int nthreads = Defaults::num_threads;

    template<typename T, typename IDX>
    Eigen::MatrixXd count_sketch(const tatami::Matrix<T, IDX>* mat, std::mt19937_64& rng) const {
        size_t NR = mat->nrow();
        IDX NC = mat->ncol();

        std::vector<int> rows(NC);
        std::vector<double> signs(NC);
        for (IDX c = 0; c < NC; ++c) {
            rows[c] = aarand::discrete_uniform(rng, num_sketch);
            signs[c] = (aarand::standard_uniform(rng) < 0.5 ? -1 : 1);
        }

        // Each thread handles a block of features, so that the columns of the
        // output are written by a single thread.
        Eigen::MatrixXd output = Eigen::MatrixXd::Zero(num_sketch, NR);
        tatami::parallelize([&](size_t, IDX start, IDX length) -> void {
            std::vector<T> buffer(length);
            auto ext = tatami::consecutive_extractor<false, false>(mat, 0, NC, start, length);
            for (IDX c = 0; c < NC; ++c) {
                auto ptr = ext->fetch(c, buffer.data());
                auto row = rows[c];
                auto sign = signs[c];
                for (IDX f = 0; f < length; ++f) {
                    output(row, start + f) += sign * ptr[f];
                }
            }
        }, NR, nthreads);

        return output;
    }

    Eigen::MatrixXd compute_projection(const Eigen::MatrixXd& sketched, std::mt19937_64& rng) const {
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(sketched);
        auto rank = qr.rank();
        size_t nfeatures = sketched.cols();
        Eigen::MatrixXd output = Eigen::MatrixXd::Zero(nfeatures, num_dims);
        if (rank == 0) {
            return output;
        }

        const double scale = 1 / std::sqrt(static_cast<double>(num_dims));
        Eigen::MatrixXd jl(rank, num_dims);
        bool leftover = false;
        double spare = 0;
        for (int d = 0; d < num_dims; ++d) {
            for (decltype(rank) r = 0; r < rank; ++r) {
                if (leftover) {
                    jl(r, d) = spare * scale;
                    leftover = false;
                } else {
                    auto paired = aarand::standard_normal(rng);
                    jl(r, d) = paired.first * scale;
                    spare = paired.second;
                    leftover = true;
                }
            }
        }

        Eigen::MatrixXd solved = qr.matrixR().topLeftCorner(rank, rank).triangularView<Eigen::Upper>().solve(jl);
        const auto& perm = qr.colsPermutation().indices();
        for (decltype(rank) r = 0; r < rank; ++r) {
            output.row(perm[r]) = solved.row(r);
        }

        return output;
    }

public:
    /**
     * @tparam T Floating-point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param[in] mat Pointer to a feature-by-cell matrix of normalized expression values.
     *
     * @return Vector of length equal to the number of cells, containing the approximate leverage score of each cell.
     */
    template<typename T, typename IDX>
    std::vector<double> run(const tatami::Matrix<T, IDX>* mat) const {
        if (num_sketch < 1) {
            throw ValidationError("nsketch", "should be positive");
        }
        if (num_dims < 1) {
            throw ValidationError("ndims", "should be positive");
        }

        size_t NR = mat->nrow();
        IDX NC = mat->ncol();
        std::vector<double> output(NC);
        if (NC == 0 || NR == 0) {
            return output;
        }

        std::mt19937_64 rng(seed);
        Eigen::MatrixXd sketched;
        if (static_cast<size_t>(NC) <= static_cast<size_t>(num_sketch)) {
            sketched = pca_utils::extract_dense_for_pca(mat, nthreads);
        } else {
            sketched = count_sketch(mat, rng);
        }

        Eigen::MatrixXd projection = compute_projection(sketched, rng);

        tatami::parallelize([&](size_t, IDX start, IDX length) -> void {
            std::vector<T> buffer(NR);
            Eigen::VectorXd profile(NR);
            auto ext = tatami::consecutive_extractor<false, false>(mat, start, length);
            for (IDX c = start, end = start + length; c < end; ++c) {
                auto ptr = ext->fetch(c, buffer.data());
                std::copy(ptr, ptr + NR, profile.data());
                output[c] = (projection.adjoint() * profile).squaredNorm();
            }
        }, NC, nthreads);

        return output;
    }
};

}

#endif
