#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../utils/compare_almost_equal.h"

#include "anchormap/anchors/ScoreAnchors.hpp"
#include "anchormap/utils/errors.hpp"

#include <vector>
#include <cmath>

TEST(ScoreAnchors, Quantile) {
    std::vector<double> sorted { 1, 2, 3, 4, 5 };
    EXPECT_EQ(anchormap::ScoreAnchors::quantile(sorted, 0.5), 3);
    compare_almost_equal(anchormap::ScoreAnchors::quantile(sorted, 0.9), 4.6);
    compare_almost_equal(anchormap::ScoreAnchors::quantile(sorted, 0.01), 1.04);
    EXPECT_EQ(anchormap::ScoreAnchors::quantile(sorted, 0), 1);
    EXPECT_EQ(anchormap::ScoreAnchors::quantile(sorted, 1), 5);

    std::vector<double> single { 7 };
    EXPECT_EQ(anchormap::ScoreAnchors::quantile(single, 0.9), 7);
    EXPECT_TRUE(std::isnan(anchormap::ScoreAnchors::quantile(std::vector<double>(), 0.5)));
}

TEST(ScoreAnchors, Rescale) {
    anchormap::ScoreAnchors scorer;

    std::vector<double> scores;
    for (int i = 100; i >= 0; --i) {
        scores.push_back(i);
    }
    scorer.rescale(scores);

    // 1% quantile is 1 and 90% quantile is 90.
    EXPECT_EQ(scores[0], 1);
    compare_almost_equal(scores[10], 1);
    compare_almost_equal(scores[50], 49.0 / 89.0);
    EXPECT_EQ(scores[99], 0);
    EXPECT_EQ(scores[100], 0);

    // Equal quantiles.
    std::vector<double> same { 3, 3, 3 };
    scorer.rescale(same);
    EXPECT_EQ(same, std::vector<double>(3, 1));

    std::vector<double> zeros { 0, 0 };
    scorer.rescale(zeros);
    EXPECT_EQ(zeros, std::vector<double>(2, 0));

    std::vector<double> empty;
    scorer.rescale(empty);
    EXPECT_TRUE(empty.empty());
}

class ScoreAnchorsTest : public ::testing::TestWithParam<int> {
protected:
    void SetUp() {
        rr = anchormap::NeighborList{ { { 1, 0.1 } }, { { 0, 0.1 } } };
        rq = anchormap::NeighborList{ { { 0, 0.1 }, { 1, 0.2 } }, { { 1, 0.1 }, { 0, 0.2 } } };
        qr = anchormap::NeighborList{ { { 0, 0.1 }, { 1, 0.2 } }, { { 1, 0.1 }, { 0, 0.2 } } };
        qq = anchormap::NeighborList{ { { 1, 0.1 } }, { { 0, 0.1 } } };
        anchors = std::vector<anchormap::Anchor>{ { 0, 0, 1 }, { 0, 1, 1 }, { 1, 1, 1 } };
    }

    anchormap::NeighborList rr, rq, qr, qq;
    std::vector<anchormap::Anchor> anchors;
};

TEST_P(ScoreAnchorsTest, SharedNeighbors) {
    anchormap::ScoreAnchors scorer;
    scorer.set_num_threads(GetParam());

    scorer.set_num_neighbors(1);
    auto shared = scorer.compute_shared(anchors, rr, rq, qr, qq);
    EXPECT_EQ(shared, std::vector<double>({ 2, 0, 2 }));

    // Each neighborhood contains all cells.
    scorer.set_num_neighbors(2);
    shared = scorer.compute_shared(anchors, rr, rq, qr, qq);
    EXPECT_EQ(shared, std::vector<double>({ 4, 4, 4 }));
}

TEST_P(ScoreAnchorsTest, Scores) {
    anchormap::ScoreAnchors scorer;
    scorer.set_num_threads(GetParam()).set_num_neighbors(1);

    auto scored = scorer.run(anchors, rr, rq, qr, qq);
    ASSERT_EQ(scored.size(), 3);
    compare_almost_equal(scored[0].score, 1);
    EXPECT_EQ(scored[1].score, 0); // zero-scoring anchors are still reported.
    compare_almost_equal(scored[2].score, 1);

    for (size_t a = 0; a < anchors.size(); ++a) {
        EXPECT_EQ(scored[a].reference, anchors[a].reference);
        EXPECT_EQ(scored[a].query, anchors[a].query);
    }

    scorer.set_num_neighbors(0);
    try {
        scorer.run(anchors, rr, rq, qr, qq);
        FAIL() << "expected a ValidationError";
    } catch (anchormap::ValidationError& e) {
        EXPECT_EQ(e.parameter(), "k_score");
    }
}

INSTANTIATE_TEST_SUITE_P(
    ScoreAnchors,
    ScoreAnchorsTest,
    ::testing::Values(1, 3) // number of threads
);
