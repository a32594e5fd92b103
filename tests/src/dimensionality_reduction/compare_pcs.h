#ifndef COMPARE_PCS_H
#define COMPARE_PCS_H

#include "Eigen/Dense"
#include <gtest/gtest.h>
#include "../utils/compare_almost_equal.h"
#include <vector>
#include <cmath>

inline void are_pcs_centered(const Eigen::MatrixXd& pcs, double tol = 1e-8) {
    int ndims = pcs.rows(), ncells = pcs.cols();
    for (int r = 0; r < ndims; ++r) {
        auto ptr = pcs.data() + r;

        double mean = 0;
        for (int c = 0; c < ncells; ++c, ptr += ndims) {
            mean += *ptr;
        }
        mean /= ncells;

        EXPECT_TRUE(std::abs(mean) < tol);
    }
}

inline void expect_equal_vectors(const Eigen::VectorXd& left, const Eigen::VectorXd& right, double tol=1e-8) {
    ASSERT_EQ(left.size(), right.size());
    for (Eigen::Index i = 0; i < left.size(); ++i) {
        compare_almost_equal(left[i], right[i], tol);
    }
    return;
}

#endif
