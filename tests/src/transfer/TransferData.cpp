#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../utils/compare_almost_equal.h"
#include "../data/Simulator.hpp"

#include "anchormap/anchors/FindTransferAnchors.hpp"
#include "anchormap/transfer/TransferData.hpp"
#include "anchormap/utils/errors.hpp"
#include "anchormap/utils/CancellationToken.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/ostream_sink.h"

#include <vector>
#include <string>
#include <memory>
#include <sstream>
#include <cmath>

class TransferDataTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ClusteredSimulator sim;
        auto rsim = sim.simulate(150);
        anchormap::Dataset reference = sim.dataset(rsim, "ref");

        sim.seed = 1000;
        sim.shift = 0.5;
        auto qsim = sim.simulate(100);
        anchormap::Dataset query = sim.dataset(qsim, "query");

        auto logger = std::make_shared<spdlog::logger>("quiet");
        logger->set_level(spdlog::level::off);

        anchormap::FindTransferAnchors finder;
        finder.set_npcs(10).set_dims(10).set_logger(logger);
        anchors.reset(new anchormap::AnchorSet(finder.run(reference, query)));

        const std::vector<std::string> types { "alpha", "beta", "gamma" };
        ref_labels.clear();
        for (auto l : rsim.labels) {
            ref_labels.push_back(types[l]);
        }
        query_labels.clear();
        for (auto l : qsim.labels) {
            query_labels.push_back(types[l]);
        }

        // Each cell type gets its own location in a 2-dimensional "UMAP".
        ref_umap.resize(2, 150);
        for (int c = 0; c < 150; ++c) {
            ref_umap(0, c) = rsim.labels[c] * 10;
            ref_umap(1, c) = -rsim.labels[c];
        }
    }

    static void TearDownTestSuite() {
        anchors.reset();
    }

    static std::unique_ptr<anchormap::AnchorSet> anchors;
    static std::vector<std::string> ref_labels, query_labels;
    static Eigen::MatrixXd ref_umap;

    static std::shared_ptr<spdlog::logger> quiet_logger() {
        auto logger = std::make_shared<spdlog::logger>("quiet");
        logger->set_level(spdlog::level::off);
        return logger;
    }
};

std::unique_ptr<anchormap::AnchorSet> TransferDataTest::anchors;
std::vector<std::string> TransferDataTest::ref_labels;
std::vector<std::string> TransferDataTest::query_labels;
Eigen::MatrixXd TransferDataTest::ref_umap;

TEST_F(TransferDataTest, Labels) {
    anchormap::TransferData runner;
    runner.set_logger(quiet_logger()).set_k_weight(20);
    auto res = runner.run(*anchors, { { "celltype", ref_labels } });

    ASSERT_EQ(res.labels.size(), 1);
    const auto& transferred = res.labels[0];
    EXPECT_EQ(transferred.name, "celltype");
    EXPECT_EQ(transferred.levels, std::vector<std::string>({ "alpha", "beta", "gamma" }));
    EXPECT_EQ(transferred.results.num_labels, 3);
    ASSERT_EQ(transferred.results.predicted.size(), 100);

    int correct = 0;
    for (size_t q = 0; q < 100; ++q) {
        correct += (transferred.predicted(q) == query_labels[q]);
        auto conf = transferred.results.confidence[q];
        EXPECT_TRUE(conf >= 0 && conf <= 1);
    }
    EXPECT_TRUE(correct >= 90);

    // Weights are reported for each query cell.
    ASSERT_EQ(res.weights.size(), 100);
    for (const auto& current : res.weights) {
        EXPECT_EQ(current.size(), 20);
    }
    EXPECT_TRUE(res.embeddings.empty());
}

TEST_F(TransferDataTest, Embeddings) {
    anchormap::TransferData runner;
    runner.set_logger(quiet_logger()).set_k_weight(20).set_report_scores(true);
    auto res = runner.run(*anchors, { { "celltype", ref_labels } }, { { "umap", ref_umap } });

    ASSERT_EQ(res.embeddings.size(), 1);
    const auto& transferred = res.embeddings[0];
    EXPECT_EQ(transferred.name, "umap");
    ASSERT_EQ(transferred.coordinates.rows(), 2);
    ASSERT_EQ(transferred.coordinates.cols(), 100);

    // Transferred coordinates should lie near the location of the predicted cell type.
    const auto& labels = res.labels[0];
    ASSERT_EQ(labels.results.scores.size(), 300);
    for (size_t q = 0; q < 100; ++q) {
        auto p = labels.results.predicted[q];
        if (p == anchormap::TransferLabels::unassigned) {
            continue;
        }
        auto conf = labels.results.confidence[q];
        if (conf > 0.99) {
            int type = (labels.levels[p] == "alpha" ? 0 : (labels.levels[p] == "beta" ? 1 : 2));
            EXPECT_NEAR(transferred.coordinates(0, q), type * 10, 0.1);
        }

        double total = 0;
        for (int l = 0; l < 3; ++l) {
            total += labels.results.scores[q * 3 + l];
        }
        compare_almost_equal(total, 1, 1e-6);
    }
}

TEST_F(TransferDataTest, WeightReduction) {
    anchormap::TransferData runner;
    runner.set_logger(quiet_logger()).set_k_weight(20);

    // Supplying the default embedding explicitly gives the same results.
    auto res = runner.run(*anchors, { { "celltype", ref_labels } });
    auto res2 = runner.run(*anchors, { { "celltype", ref_labels } }, {}, anchors->query_embeddings(false));
    EXPECT_EQ(res.weights, res2.weights);

    // Also works with the L2-normalized embedding.
    auto res3 = runner.run(*anchors, { { "celltype", ref_labels } }, {}, anchors->query_embeddings(true));
    EXPECT_EQ(res3.weights.size(), 100);

    try {
        runner.run(*anchors, { { "celltype", ref_labels } }, {}, Eigen::MatrixXd::Zero(10, 50));
        FAIL() << "expected a ValidationError";
    } catch (anchormap::ValidationError& e) {
        EXPECT_EQ(e.parameter(), "weight_reduction");
        EXPECT_EQ(e.stage(), "validating inputs");
    }
}

TEST_F(TransferDataTest, Errors) {
    anchormap::TransferData runner;
    runner.set_logger(quiet_logger());

    auto truncated = ref_labels;
    truncated.pop_back();
    EXPECT_THROW(runner.run(*anchors, { { "celltype", truncated } }), anchormap::DataError);
    EXPECT_THROW(runner.run(*anchors, {}, { { "umap", Eigen::MatrixXd::Zero(2, 10) } }), anchormap::DataError);

    // Empty labels cannot be distinguished from unassigned cells.
    auto blanked = ref_labels;
    blanked[5] = "";
    try {
        runner.run(*anchors, { { "celltype", blanked } });
        FAIL() << "expected a DataError";
    } catch (anchormap::DataError& e) {
        EXPECT_EQ(e.stage(), "validating inputs");
    }

    runner.set_k_weight(anchors->anchors().size() + 1);
    try {
        runner.run(*anchors, { { "celltype", ref_labels } });
        FAIL() << "expected a ValidationError";
    } catch (anchormap::ValidationError& e) {
        EXPECT_EQ(e.parameter(), "k_weight");
        EXPECT_EQ(e.stage(), "finding weights");
    }

    runner.set_k_weight().set_sd_weight(-1);
    EXPECT_THROW(runner.run(*anchors, { { "celltype", ref_labels } }), anchormap::ValidationError);
}

TEST_F(TransferDataTest, NoAnchors) {
    anchormap::AnchorSet empty(
        anchors->combined(),
        anchors->reduction(),
        anchors->matching_reduction(),
        anchors->num_dims(),
        std::vector<anchormap::Anchor>(),
        anchors->anchor_features(),
        anchors->reference_cells(),
        anchors->query_cells(),
        nullptr
    );

    anchormap::TransferData runner;
    runner.set_logger(quiet_logger());
    try {
        runner.run(empty, { { "celltype", ref_labels } });
        FAIL() << "expected a DataError";
    } catch (anchormap::DataError& e) {
        EXPECT_EQ(e.stage(), "validating inputs");
        EXPECT_NE(std::string(e.what()).find("no anchors"), std::string::npos);
    }
}

TEST_F(TransferDataTest, Logging) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);

    anchormap::TransferData runner;
    runner.set_logger(logger).set_k_weight(20);
    runner.run(*anchors, { { "celltype", ref_labels } }, { { "umap", ref_umap } });
    logger->flush();

    auto log = captured.str();
    EXPECT_NE(log.find("computing weights for " + std::to_string(anchors->anchors().size()) + " anchors"), std::string::npos);
    EXPECT_NE(log.find("transferring labels for 'celltype'"), std::string::npos);
    EXPECT_NE(log.find("transferring embedding for 'umap'"), std::string::npos);
}

TEST_F(TransferDataTest, Cancellation) {
    anchormap::CancellationToken token;
    token.cancel();

    anchormap::TransferData runner;
    runner.set_logger(quiet_logger()).set_cancellation_token(&token);
    try {
        runner.run(*anchors, { { "celltype", ref_labels } });
        FAIL() << "expected a CancelledError";
    } catch (anchormap::CancelledError& e) {
        EXPECT_EQ(e.stage(), "finding weights");
    }
}
