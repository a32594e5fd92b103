#ifndef ANCHORMAP_TRANSFER_LABELS_HPP
#define ANCHORMAP_TRANSFER_LABELS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../anchors/Anchor.hpp"
#include "FindWeights.hpp"

#include "tatami/tatami.hpp"

#include <vector>
#include <algorithm>
#include <string>

/**
 * @file TransferLabels.hpp
 *
 * @brief Transfer categorical labels from the reference to the query.
 */

namespace anchormap {

/**
 * @brief Transfer categorical labels from the reference to the query.
 *
 * For each query cell, the score for each label is defined as the sum of the weights of the anchors whose reference cell has that label.
 * The predicted label is that with the largest score, and the confidence of the prediction is the ratio of that score to the sum of all scores.
 * Query cells with no non-zero weights are marked as `unassigned`.
 */
class TransferLabels {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_report_scores()` for more details.
         */
        static constexpr bool report_scores = false;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * Sentinel value for query cells that could not be assigned to any label.
     */
    static constexpr int unassigned = -1;

    /**
     * @param r Whether to report the score of every label for each query cell.
     *
     * @return A reference to this `TransferLabels` object.
     */
    TransferLabels& set_report_scores(bool r = Defaults::report_scores) {
        report_scores = r;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `TransferLabels` object.
     */
    TransferLabels& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    bool report_scores = Defaults::report_scores;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @brief Results of the label transfer.
     */
    struct Results {
        /**
         * Predicted label for each query cell, or `unassigned`.
         */
        std::vector<int> predicted;

        /**
         * Confidence of the prediction for each query cell, in $[0, 1]$.
         * This is zero for `unassigned` cells.
         */
        std::vector<double> confidence;

        /**
         * Column-major matrix of label scores, where each row is a label and each column is a query cell.
         * Only filled if `set_report_scores()` is `true`.
         */
        std::vector<double> scores;

        /**
         * Number of labels.
         */
        int num_labels = 0;
    };

    /**
     * @param anchors Vector of anchors.
     * @param weights Weights of the anchors for each query cell, typically from `FindWeights`.
     * @param nref Number of reference cells.
     * @param[in] labels Pointer to an array of length `nref`, containing the label for each reference cell.
     * Labels should be integers in $[0, N)$ where $N$ is the number of labels.
     *
     * @return A `Results` object containing the predicted labels.
     */
    Results run(const std::vector<Anchor>& anchors, const AnchorWeights& weights, size_t nref, const int* labels) const {
        int nlabels = 0;
        for (size_t r = 0; r < nref; ++r) {
            if (labels[r] < 0) {
                throw DataError("labels should be non-negative integers");
            }
            nlabels = std::max(nlabels, labels[r] + 1);
        }

        for (const auto& a : anchors) {
            if (static_cast<size_t>(a.reference) >= nref) {
                throw DataError("anchor reference index " + std::to_string(a.reference) + " is out of range");
            }
        }

        size_t nquery = weights.size();
        Results output;
        output.num_labels = nlabels;
        output.predicted.resize(nquery, unassigned);
        output.confidence.resize(nquery);
        if (report_scores) {
            output.scores.resize(static_cast<size_t>(nlabels) * nquery);
        }

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<double> buffer(nlabels);
            for (size_t q = start, end = start + length; q < end; ++q) {
                std::fill(buffer.begin(), buffer.end(), 0);
                double total = 0;
                for (const auto& w : weights[q]) {
                    buffer[labels[anchors[w.first].reference]] += w.second;
                    total += w.second;
                }

                if (total > 0) {
                    int best = 0;
                    for (int l = 1; l < nlabels; ++l) {
                        if (buffer[l] > buffer[best]) {
                            best = l;
                        }
                    }
                    output.predicted[q] = best;
                    output.confidence[q] = buffer[best] / total;
                }

                if (report_scores) {
                    std::copy(buffer.begin(), buffer.end(), output.scores.begin() + q * static_cast<size_t>(nlabels));
                }
            }
        }, nquery, nthreads);

        return output;
    }
};

}

#endif
