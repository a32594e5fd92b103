#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../data/Simulator.hpp"

#include "anchormap/sketch/ProjectSketchLabels.hpp"
#include "anchormap/utils/errors.hpp"

#include <vector>
#include <cmath>

class ProjectSketchLabelsTest : public ::testing::TestWithParam<int> {
protected:
    std::vector<double> sketch { 0, 1, 2, 10, 11, 12 };
    std::vector<int> labels { 0, 0, 0, 1, 1, 1 };
    std::vector<double> full { 0.5, 11.5, 5.9 };
};

TEST_P(ProjectSketchLabelsTest, Basic) {
    anchormap::ProjectSketchLabels runner;
    runner.set_num_neighbors(3).set_num_threads(GetParam());
    auto res = runner.run(1, sketch.size(), sketch.data(), labels.data(), full.size(), full.data());

    EXPECT_EQ(res.assigned, std::vector<int>({ 0, 1, 0 }));
    EXPECT_EQ(res.best_prop[0], 1);
    EXPECT_EQ(res.second_prop[0], 0);
    EXPECT_EQ(res.best_prop[1], 1);

    // Nearest neighbors are 2, 10 and 1.
    EXPECT_FLOAT_EQ(res.best_prop[2], 2.0/3);
    EXPECT_FLOAT_EQ(res.second_prop[2], 1.0/3);
}

TEST_P(ProjectSketchLabelsTest, Clamped) {
    anchormap::ProjectSketchLabels runner;
    runner.set_num_neighbors(10).set_num_threads(GetParam());
    auto res = runner.run(1, sketch.size(), sketch.data(), labels.data(), full.size(), full.data());

    // All sketch cells are used, so ties go to the first label.
    EXPECT_EQ(res.assigned, std::vector<int>({ 0, 0, 0 }));
    for (size_t i = 0; i < full.size(); ++i) {
        EXPECT_EQ(res.best_prop[i], 0.5);
        EXPECT_EQ(res.second_prop[i], 0.5);
    }
}

TEST_P(ProjectSketchLabelsTest, SingleLabel) {
    std::vector<int> single(sketch.size());
    anchormap::ProjectSketchLabels runner;
    runner.set_num_neighbors(2).set_num_threads(GetParam());
    auto res = runner.run(1, sketch.size(), sketch.data(), single.data(), full.size(), full.data());

    EXPECT_EQ(res.assigned, std::vector<int>(full.size()));
    for (size_t i = 0; i < full.size(); ++i) {
        EXPECT_EQ(res.best_prop[i], 1);
        EXPECT_TRUE(std::isnan(res.second_prop[i]));
    }
}

TEST_P(ProjectSketchLabelsTest, Clustered) {
    ClusteredSimulator sim;
    sim.nfeatures = 10;
    sim.markers = 3;
    auto simulated = sim.simulate(300);

    // Using the first 60 cells as the sketch.
    size_t nsketch = 60;
    anchormap::ProjectSketchLabels runner;
    runner.set_num_neighbors(5).set_num_threads(GetParam());
    auto res = runner.run(10, nsketch, simulated.values.data(), simulated.labels.data(), 300, simulated.values.data());

    int correct = 0;
    for (size_t c = 0; c < 300; ++c) {
        correct += (res.assigned[c] == simulated.labels[c]);
        EXPECT_TRUE(res.best_prop[c] >= res.second_prop[c]);
    }
    EXPECT_TRUE(correct >= 290);

    // Same results with an approximate search.
    runner.set_approximate(true);
    auto approx = runner.run(10, nsketch, simulated.values.data(), simulated.labels.data(), 300, simulated.values.data());
    int agree = 0;
    for (size_t c = 0; c < 300; ++c) {
        agree += (approx.assigned[c] == res.assigned[c]);
    }
    EXPECT_TRUE(agree >= 290);
}

INSTANTIATE_TEST_SUITE_P(
    ProjectSketchLabels,
    ProjectSketchLabelsTest,
    ::testing::Values(1, 3) // number of threads
);

TEST(ProjectSketchLabels, Errors) {
    std::vector<double> sketch { 0, 1, 2 };
    std::vector<double> full { 0.5 };

    anchormap::ProjectSketchLabels runner;
    runner.set_num_neighbors(0);
    std::vector<int> labels { 0, 1, 0 };
    try {
        runner.run(1, sketch.size(), sketch.data(), labels.data(), full.size(), full.data());
        FAIL() << "expected a ValidationError";
    } catch (anchormap::ValidationError& e) {
        EXPECT_EQ(e.parameter(), "num_neighbors");
    }

    runner.set_num_neighbors();
    labels[1] = -1;
    EXPECT_THROW(runner.run(1, sketch.size(), sketch.data(), labels.data(), full.size(), full.data()), anchormap::DataError);
}
