#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../utils/compare_almost_equal.h"
#include "../data/Simulator.hpp"

#include "tatami/tatami.hpp"

#include "anchormap/dimensionality_reduction/utils.hpp"
#include "anchormap/dimensionality_reduction/convert.hpp"

#include <vector>
#include <random>
#include <numeric>
#include <cmath>

class CenterScalePcaTest : public ::testing::TestWithParam<int> {};

TEST_P(CenterScalePcaTest, DenseCheck) {
    auto nthreads = GetParam();
    size_t NR = 99;
    size_t NC = 101;

    Simulator sim;
    auto mat = sim.matrix(NR, NC);
    auto extracted = anchormap::pca_utils::extract_dense_for_pca(&mat, nthreads);
    ASSERT_EQ(extracted.rows(), NC);
    ASSERT_EQ(extracted.cols(), NR);

    // Check that the mean and variance calculations are correct.
    Eigen::VectorXd center_v(NR);
    Eigen::VectorXd scale_v(NR);
    anchormap::pca_utils::compute_mean_and_variance_from_dense_matrix(extracted, center_v, scale_v, nthreads);

    auto means = tatami::row_sums(&mat);
    for (auto& x : means) {
        x /= NC;
    }
    compare_almost_equal(means, std::vector<double>(center_v.begin(), center_v.end()));

    auto refvar = tatami::row_variances(&mat);
    compare_almost_equal(refvar, std::vector<double>(scale_v.begin(), scale_v.end()));

    auto nonzero = anchormap::pca_utils::process_scale_vector(scale_v);
    EXPECT_EQ(nonzero, NR);
    for (size_t r = 0; r < NR; ++r) {
        compare_almost_equal(std::sqrt(refvar[r]), scale_v[r]);
    }

    // Check that processing works with centering only.
    {
        auto matcopy = extracted;
        anchormap::pca_utils::apply_center_and_scale_to_dense_matrix(matcopy, center_v, false, scale_v, 10, nthreads);

        Eigen::VectorXd center_v2(NR);
        Eigen::VectorXd scale_v2(NR);
        anchormap::pca_utils::compute_mean_and_variance_from_dense_matrix(matcopy, center_v2, scale_v2, nthreads);

        for (size_t r = 0; r < NR; ++r) {
            EXPECT_TRUE(std::abs(center_v2[r]) < 1e-8);
        }
        compare_almost_equal(refvar, std::vector<double>(scale_v2.begin(), scale_v2.end()));
    }

    // Check that processing works with centering and scaling, without any clipping.
    {
        auto matcopy = extracted;
        anchormap::pca_utils::apply_center_and_scale_to_dense_matrix(matcopy, center_v, true, scale_v, 1000, nthreads);

        Eigen::VectorXd center_v2(NR);
        Eigen::VectorXd scale_v2(NR);
        anchormap::pca_utils::compute_mean_and_variance_from_dense_matrix(matcopy, center_v2, scale_v2, nthreads);

        for (size_t r = 0; r < NR; ++r) {
            EXPECT_TRUE(std::abs(center_v2[r]) < 1e-8);
        }
        compare_almost_equal(std::vector<double>(NR, 1), std::vector<double>(scale_v2.begin(), scale_v2.end()));
    }
}

TEST_P(CenterScalePcaTest, Clipping) {
    auto nthreads = GetParam();
    Simulator sim;
    sim.density = 0.05;
    auto mat = sim.matrix(30, 200);

    auto scaled = anchormap::pca_utils::scale_matrix(&mat, true, 2.0, nthreads);
    EXPECT_TRUE(scaled.values.maxCoeff() <= 2.0);

    auto unscaled = anchormap::pca_utils::scale_matrix(&mat, false, 2.0, nthreads);
    EXPECT_TRUE(unscaled.values.maxCoeff() > 2.0); // no clipping without scaling.

    // Known statistics give the same result.
    auto known = anchormap::pca_utils::scale_matrix_with_known_stats(&mat, scaled.center, true, scaled.scale, 2.0, nthreads);
    EXPECT_EQ(known, scaled.values);
}

TEST_P(CenterScalePcaTest, ZeroVariance) {
    std::vector<double> values(10 * 20);
    for (size_t c = 0; c < 20; ++c) {
        values[c * 10 + 3] = c % 3; // only feature 3 varies.
    }
    tatami::DenseColumnMatrix<double, int> mat(10, 20, std::move(values));

    auto scaled = anchormap::pca_utils::scale_matrix(&mat, true, 10, GetParam());
    EXPECT_EQ(scaled.nonzero_variance, 1);
    for (size_t r = 0; r < 10; ++r) {
        if (r != 3) {
            EXPECT_EQ(scaled.scale[r], 1);
            EXPECT_EQ(scaled.values.col(r).squaredNorm(), 0);
        }
    }
}

INSTANTIATE_TEST_SUITE_P(
    CenterScale,
    CenterScalePcaTest,
    ::testing::Values(1, 3) // number of threads
);

TEST(PcaUtils, ProjectedLoadings) {
    Eigen::MatrixXd scaled(4, 3); // cells x features
    scaled << 1, 0, 2,
              0, 1, 1,
              -1, 2, 0,
              0, -3, -3;

    Eigen::MatrixXd emb(2, 4); // dims x cells
    emb << 1, 2, 3, 4,
           0, 1, 0, -1;

    auto loadings = anchormap::pca_utils::compute_projected_loadings(scaled, emb);
    ASSERT_EQ(loadings.rows(), 3);
    ASSERT_EQ(loadings.cols(), 2);

    Eigen::MatrixXd expected = scaled.adjoint() * emb.adjoint();
    EXPECT_EQ(loadings, expected);
    EXPECT_EQ(loadings(0, 0), 1 * 1 + 0 * 2 + -1 * 3 + 0 * 4);
}

TEST(PcaUtils, SubsetByFeatures) {
    Simulator sim;
    std::shared_ptr<const tatami::NumericMatrix> mat(new tatami::DenseColumnMatrix<double, int>(sim.matrix(20, 10)));
    std::vector<int> keep { 2, 5, 17 };
    auto sub = anchormap::pca_utils::subset_matrix_by_features(mat, keep);
    EXPECT_EQ(sub->nrow(), 3);
    EXPECT_EQ(sub->ncol(), 10);

    auto ext = mat->dense_row();
    auto subext = sub->dense_row();
    for (size_t i = 0; i < keep.size(); ++i) {
        EXPECT_EQ(ext->fetch(keep[i]), subext->fetch(i));
    }
}
