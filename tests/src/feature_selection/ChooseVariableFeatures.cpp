#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "anchormap/feature_selection/ChooseVariableFeatures.hpp"
#include "../data/Simulator.hpp"

#include <vector>
#include <random>
#include <algorithm>

TEST(ChooseVariableFeatures, Statistics) {
    std::vector<double> stat { 0.5, 2.0, 1.0, 2.0, 0.1 };

    anchormap::ChooseVariableFeatures chooser;
    chooser.set_top(3);
    auto out = chooser.run(stat.size(), stat.data());
    std::vector<int> expected { 1, 3, 2 };
    EXPECT_EQ(out, expected);

    // Asking for more than are available.
    chooser.set_top(10);
    out = chooser.run(stat.size(), stat.data());
    std::vector<int> everything { 1, 3, 2, 0, 4 };
    EXPECT_EQ(out, everything);

    chooser.set_top(0);
    EXPECT_TRUE(chooser.run(stat.size(), stat.data()).empty());
}

class ChooseVariableFeaturesTest : public ::testing::TestWithParam<int> {};

TEST_P(ChooseVariableFeaturesTest, Matrix) {
    ClusteredSimulator sim;
    sim.nfeatures = 50;
    sim.markers = 5;
    auto simmed = sim.simulate(60);
    auto ds = sim.dataset(simmed, "cell");

    anchormap::ChooseVariableFeatures chooser;
    chooser.set_top(15).set_num_threads(GetParam());
    auto chosen = chooser.run(ds.matrix());
    EXPECT_EQ(chosen.size(), 15);

    // Marker features should dominate the variances.
    auto sorted = chosen;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < sorted.size(); ++i) {
        EXPECT_EQ(sorted[i], i);
    }

    auto named = chooser.run(ds);
    ASSERT_EQ(named.size(), chosen.size());
    for (size_t i = 0; i < named.size(); ++i) {
        EXPECT_EQ(named[i], ds.features()[chosen[i]]);
    }

    // Consistent with the reference calculation.
    auto vars = tatami::row_variances(ds.matrix(), 1);
    for (size_t i = 1; i < chosen.size(); ++i) {
        EXPECT_TRUE(vars[chosen[i - 1]] >= vars[chosen[i]]);
    }

    anchormap::ChooseVariableFeatures serial;
    serial.set_top(15);
    EXPECT_EQ(serial.run(ds.matrix()), chosen);
}

INSTANTIATE_TEST_SUITE_P(
    ChooseVariableFeatures,
    ChooseVariableFeaturesTest,
    ::testing::Values(1, 3)
);
