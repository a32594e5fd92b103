#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../utils/compare_almost_equal.h"

#include "anchormap/transfer/TransferLabels.hpp"
#include "anchormap/utils/errors.hpp"

#include <vector>

class TransferLabelsTest : public ::testing::TestWithParam<int> {
protected:
    void SetUp() {
        anchors = std::vector<anchormap::Anchor>{ { 0, 0, 1 }, { 1, 1, 1 }, { 2, 2, 1 } };
        labels = std::vector<int>{ 0, 1, 1 };

        weights.resize(5);
        weights[0] = { { 0, 0.7 }, { 1, 0.3 } };
        weights[1] = { { 1, 0.5 }, { 2, 0.5 } };
        // weights[2] is empty.
        weights[3] = { { 0, 0.5 }, { 1, 0.5 } };
        weights[4] = { { 0, 2 }, { 1, 2 }, { 2, 4 } };
    }

    std::vector<anchormap::Anchor> anchors;
    std::vector<int> labels;
    anchormap::AnchorWeights weights;
};

TEST_P(TransferLabelsTest, Basic) {
    anchormap::TransferLabels runner;
    runner.set_num_threads(GetParam());
    auto res = runner.run(anchors, weights, labels.size(), labels.data());

    EXPECT_EQ(res.num_labels, 2);
    EXPECT_EQ(res.predicted, std::vector<int>({ 0, 1, anchormap::TransferLabels::unassigned, 0, 1 }));
    compare_almost_equal(res.confidence[0], 0.7);
    EXPECT_EQ(res.confidence[1], 1);
    EXPECT_EQ(res.confidence[2], 0);
    EXPECT_EQ(res.confidence[3], 0.5); // ties go to the first label.
    EXPECT_EQ(res.confidence[4], 0.75);
    EXPECT_TRUE(res.scores.empty());
}

TEST_P(TransferLabelsTest, Scores) {
    anchormap::TransferLabels runner;
    runner.set_num_threads(GetParam()).set_report_scores(true);
    auto res = runner.run(anchors, weights, labels.size(), labels.data());

    ASSERT_EQ(res.scores.size(), 10);
    EXPECT_EQ(std::vector<double>(res.scores.begin(), res.scores.begin() + 2), std::vector<double>({ 0.7, 0.3 }));
    EXPECT_EQ(std::vector<double>(res.scores.begin() + 2, res.scores.begin() + 4), std::vector<double>({ 0, 1 }));
    EXPECT_EQ(std::vector<double>(res.scores.begin() + 4, res.scores.begin() + 6), std::vector<double>({ 0, 0 }));
    EXPECT_EQ(std::vector<double>(res.scores.begin() + 8, res.scores.begin() + 10), std::vector<double>({ 2, 6 }));

    // Predictions are the same as without scores.
    runner.set_report_scores(false);
    auto res2 = runner.run(anchors, weights, labels.size(), labels.data());
    EXPECT_EQ(res.predicted, res2.predicted);
    EXPECT_EQ(res.confidence, res2.confidence);
}

INSTANTIATE_TEST_SUITE_P(
    TransferLabels,
    TransferLabelsTest,
    ::testing::Values(1, 3) // number of threads
);

TEST(TransferLabels, Errors) {
    std::vector<anchormap::Anchor> anchors { { 0, 0, 1 }, { 3, 1, 1 } };
    anchormap::AnchorWeights weights(2);

    std::vector<int> labels { 0, 1, 0 };
    anchormap::TransferLabels runner;
    EXPECT_THROW(runner.run(anchors, weights, labels.size(), labels.data()), anchormap::DataError);

    anchors[1].reference = 2;
    labels[1] = -1;
    EXPECT_THROW(runner.run(anchors, weights, labels.size(), labels.data()), anchormap::DataError);

    labels[1] = 1;
    auto res = runner.run(anchors, weights, labels.size(), labels.data());
    EXPECT_EQ(res.predicted, std::vector<int>(2, anchormap::TransferLabels::unassigned));
}
