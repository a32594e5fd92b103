#ifndef ANCHORMAP_TRANSFER_DATA_HPP
#define ANCHORMAP_TRANSFER_DATA_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../utils/blocking.hpp"
#include "../utils/CancellationToken.hpp"
#include "../anchors/AnchorSet.hpp"
#include "FindWeights.hpp"
#include "TransferLabels.hpp"
#include "TransferEmbedding.hpp"

#include "Eigen/Dense"
#include "spdlog/spdlog.h"

#include <vector>
#include <string>
#include <memory>

/**
 * @file TransferData.hpp
 *
 * @brief Transfer labels and embeddings from the reference to the query.
 */

namespace anchormap {

/**
 * @brief Transfer labels and embeddings from the reference to the query.
 *
 * This class uses the anchors in an `AnchorSet` to transfer any number of categorical labels and continuous embeddings from the reference cells to the query cells.
 * The anchor weights are computed once with `FindWeights` and then applied to each field with `TransferLabels` or `TransferEmbedding`.
 * By default, weights are computed from the query embeddings in the shared space that was used to find the anchors,
 * but a different embedding of the query cells can be supplied via `run()`.
 */
class TransferData {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_k_weight()` for more details.
         */
        static constexpr int k_weight = FindWeights::Defaults::num_neighbors;

        /**
         * See `set_sd_weight()` for more details.
         */
        static constexpr double sd_weight = FindWeights::Defaults::sd;

        /**
         * See `set_report_scores()` for more details.
         */
        static constexpr bool report_scores = false;

        /**
         * See `set_approximate()` for more details.
         */
        static constexpr bool approximate = false;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

private:
    int k_weight = Defaults::k_weight;
    double sd_weight = Defaults::sd_weight;
    bool report_scores = Defaults::report_scores;
    bool approximate = Defaults::approximate;
    int nthreads = Defaults::num_threads;

    std::shared_ptr<spdlog::logger> logger;
    const CancellationToken* token = NULL;

public:
    /**
     * @param k Number of nearest anchors to use for each query cell, see `FindWeights::set_num_neighbors()`.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_k_weight(int k = Defaults::k_weight) {
        k_weight = k;
        return *this;
    }

    /**
     * @param s Bandwidth of the Gaussian kernel, see `FindWeights::set_sd()`.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_sd_weight(double s = Defaults::sd_weight) {
        sd_weight = s;
        return *this;
    }

    /**
     * @param r Whether to report the score of every label for each query cell, see `TransferLabels::set_report_scores()`.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_report_scores(bool r = Defaults::report_scores) {
        report_scores = r;
        return *this;
    }

    /**
     * @param a Whether to use an approximate neighbor search.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param l Logger to use for progress messages.
     * If `NULL`, the **spdlog** default logger is used.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_logger(std::shared_ptr<spdlog::logger> l = nullptr) {
        logger = std::move(l);
        return *this;
    }

    /**
     * @param t Pointer to a cancellation token, checked between each step.
     * If `NULL`, cancellation is not possible.
     *
     * @return A reference to this `TransferData` object.
     */
    TransferData& set_cancellation_token(const CancellationToken* t = NULL) {
        token = t;
        return *this;
    }

public:
    /**
     * @brief Categorical labels to be transferred.
     */
    struct LabelField {
        /**
         * Name of the field.
         */
        std::string name;

        /**
         * Label for each reference cell.
         * Labels should be non-empty, as the empty string is reserved for unassigned query cells.
         */
        std::vector<std::string> labels;
    };

    /**
     * @brief Continuous embedding to be transferred.
     */
    struct EmbeddingField {
        /**
         * Name of the field.
         */
        std::string name;

        /**
         * Matrix of coordinates where each row is a dimension and each column is a reference cell.
         */
        Eigen::MatrixXd coordinates;
    };

    /**
     * @brief Transferred labels for a single field.
     */
    struct LabelResults {
        /**
         * Name of the field.
         */
        std::string name;

        /**
         * Unique labels in the reference, in order of first appearance.
         * `TransferLabels::Results::predicted` contains indices into this vector.
         */
        std::vector<std::string> levels;

        /**
         * Results of the label transfer.
         */
        TransferLabels::Results results;

        /**
         * @param q Index of the query cell.
         * @return Predicted label for `q`, or an empty string if it was unassigned.
         */
        std::string predicted(size_t q) const {
            auto p = results.predicted[q];
            return (p == TransferLabels::unassigned ? std::string() : levels[p]);
        }
    };

    /**
     * @brief Transferred coordinates for a single field.
     */
    struct EmbeddingResults {
        /**
         * Name of the field.
         */
        std::string name;

        /**
         * Matrix of coordinates where each row is a dimension and each column is a query cell.
         */
        Eigen::MatrixXd coordinates;
    };

    /**
     * @brief Results of the transfer.
     */
    struct Results {
        /**
         * Weights of the anchors for each query cell.
         */
        AnchorWeights weights;

        /**
         * Transferred labels, in the same order as the input label fields.
         */
        std::vector<LabelResults> labels;

        /**
         * Transferred coordinates, in the same order as the input embedding fields.
         */
        std::vector<EmbeddingResults> embeddings;
    };

private:
    static void check_inputs(const AnchorSet& anchors, const std::vector<LabelField>& labels, const std::vector<EmbeddingField>& embeddings) {
        if (anchors.anchors().empty()) {
            throw DataError("no anchors available for transfer");
        }

        size_t nref = anchors.num_reference();
        for (const auto& l : labels) {
            if (l.labels.size() != nref) {
                throw DataError("length of label field '" + l.name + "' should be equal to the number of reference cells");
            }
            for (const auto& x : l.labels) {
                if (x.empty()) {
                    throw DataError("label field '" + l.name + "' should not contain empty labels");
                }
            }
        }
        for (const auto& e : embeddings) {
            if (static_cast<size_t>(e.coordinates.cols()) != nref) {
                throw DataError("number of columns in embedding field '" + e.name + "' should be equal to the number of reference cells");
            }
        }
    }

public:
    /**
     * @param anchors An `AnchorSet` generated by `FindTransferAnchors`.
     * @param labels Label fields to transfer.
     * @param embeddings Embedding fields to transfer.
     * @param weight_embedding Matrix where each row is a dimension and each column is a query cell, used to compute the anchor weights.
     *
     * @return A `Results` object containing the transferred fields.
     */
    Results run(const AnchorSet& anchors, const std::vector<LabelField>& labels, const std::vector<EmbeddingField>& embeddings, const Eigen::MatrixXd& weight_embedding) const {
        auto log = (logger ? logger : spdlog::default_logger());

        run_stage("validating inputs", [&]() -> void {
            check_inputs(anchors, labels, embeddings);
            if (static_cast<size_t>(weight_embedding.cols()) != anchors.num_query()) {
                throw ValidationError("weight_reduction", "number of columns should be equal to the number of query cells");
            }
        });

        Results output;
        const auto& anchor_table = anchors.anchors();

        check_cancelled(token, "finding weights");
        log->info("computing weights for {} anchors", anchor_table.size());
        output.weights = run_stage("finding weights", [&]() -> AnchorWeights {
            FindWeights finder;
            finder.set_num_neighbors(k_weight).set_sd(sd_weight).set_approximate(approximate).set_num_threads(nthreads);
            return finder.run(anchor_table, weight_embedding.rows(), weight_embedding.cols(), weight_embedding.data());
        });

        for (const auto& l : labels) {
            check_cancelled(token, "transferring labels");
            log->debug("transferring labels for '{}'", l.name);
            output.labels.push_back(run_stage("transferring labels", [&]() -> LabelResults {
                LabelResults current;
                current.name = l.name;
                auto fac = factorize(l.labels);
                current.levels = std::move(fac.levels);

                TransferLabels runner;
                runner.set_report_scores(report_scores).set_num_threads(nthreads);
                current.results = runner.run(anchor_table, output.weights, fac.codes.size(), fac.codes.data());
                return current;
            }));
        }

        for (const auto& e : embeddings) {
            check_cancelled(token, "transferring embeddings");
            log->debug("transferring embedding for '{}'", e.name);
            output.embeddings.push_back(run_stage("transferring embeddings", [&]() -> EmbeddingResults {
                EmbeddingResults current;
                current.name = e.name;
                TransferEmbedding runner;
                runner.set_num_threads(nthreads);
                current.coordinates = runner.run(anchor_table, output.weights, e.coordinates);
                return current;
            }));
        }

        return output;
    }

    /**
     * Transfer fields using the query embeddings of the shared space in `anchors` to compute the weights.
     *
     * @param anchors An `AnchorSet` generated by `FindTransferAnchors`.
     * @param labels Label fields to transfer.
     * @param embeddings Embedding fields to transfer.
     *
     * @return A `Results` object containing the transferred fields.
     */
    Results run(const AnchorSet& anchors, const std::vector<LabelField>& labels, const std::vector<EmbeddingField>& embeddings = {}) const {
        run_stage("validating inputs", [&]() -> void { check_inputs(anchors, labels, embeddings); });
        return run(anchors, labels, embeddings, anchors.query_embeddings(false));
    }
};

}

#endif
