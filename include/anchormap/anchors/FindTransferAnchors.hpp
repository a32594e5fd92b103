#ifndef ANCHORMAP_FIND_TRANSFER_ANCHORS_HPP
#define ANCHORMAP_FIND_TRANSFER_ANCHORS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../utils/CancellationToken.hpp"
#include "../data/Dataset.hpp"
#include "../data/Reduction.hpp"
#include "../feature_selection/ChooseVariableFeatures.hpp"
#include "../dimensionality_reduction/ProjectPca.hpp"
#include "../dimensionality_reduction/RunCca.hpp"
#include "../dimensionality_reduction/l2_normalize.hpp"
#include "../dimensionality_reduction/utils.hpp"
#include "../neighbors/FindNeighbors.hpp"
#include "FindAnchorPairs.hpp"
#include "ScoreAnchors.hpp"
#include "FilterAnchors.hpp"
#include "top_dim_features.hpp"
#include "AnchorSet.hpp"

#include "tatami/tatami.hpp"
#include "Eigen/Dense"
#include "spdlog/spdlog.h"

#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include <unordered_set>
#include <unordered_map>

/**
 * @file FindTransferAnchors.hpp
 *
 * @brief Find anchors between a reference and query dataset.
 */

namespace anchormap {

/**
 * Strategy for defining a shared low-dimensional space between the reference and query datasets.
 *
 * - `PCA_PROJECT`: fit a PCA on the reference and project the query onto the reference PCs, see `ProjectPca`.
 * - `CCA`: canonical correlation analysis between the reference and query, see `RunCca`.
 */
enum class SharedSpace : char { PCA_PROJECT, CCA };

/**
 * @brief Find anchors between a reference and query dataset.
 *
 * This class sequences the steps required to identify anchors for transferring information from a reference dataset to a query dataset.
 *
 * 1. The anchor features are chosen from the variable features of the reference, restricted to those that are also present in the query.
 * 2. The reference and query are placed into a shared low-dimensional space with `ProjectPca` or `RunCca`, followed by `l2_normalize()` if requested.
 * 3. Nearest neighbors are found within and between the two datasets using `FindNeighbors`.
 * 4. Mutual nearest neighbors are identified as anchors by `FindAnchorPairs`, and scored by `ScoreAnchors`.
 * 5. Anchors that are not supported by the original expression values are removed by `FilterAnchors`.
 *
 * All parameters are validated before any computation is performed.
 * Errors from each step are rethrown with the name of the step, see `run_stage()`.
 * Progress is reported through the **spdlog** logger in `set_logger()`, along with a warning if the filtering neighborhood needs to be clamped.
 */
class FindTransferAnchors {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_normalization_method()` for more details.
         */
        static constexpr NormalizationMethod normalization_method = NormalizationMethod::LOG_NORMALIZE;

        /**
         * See `set_reduction()` for more details.
         */
        static constexpr SharedSpace reduction = SharedSpace::PCA_PROJECT;

        /**
         * See `set_project_query()` for more details.
         */
        static constexpr bool project_query = false;

        /**
         * See `set_npcs()` for more details.
         */
        static constexpr int npcs = 30;

        /**
         * See `set_dims()` for more details.
         */
        static constexpr int dims = 30;

        /**
         * See `set_l2_norm()` for more details.
         */
        static constexpr bool l2_norm = true;

        /**
         * See `set_k_anchor()` for more details.
         */
        static constexpr int k_anchor = 5;

        /**
         * See `set_k_score()` for more details.
         */
        static constexpr int k_score = 30;

        /**
         * See `set_k_filter()` for more details.
         */
        static constexpr int k_filter = 200;

        /**
         * See `set_max_features()` for more details.
         */
        static constexpr int max_features = 200;

        /**
         * See `set_num_variable_features()` for more details.
         */
        static constexpr size_t num_variable_features = 2000;

        /**
         * See `set_scale_max()` for more details.
         */
        static constexpr double scale_max = 10;

        /**
         * See `set_approximate()` for more details.
         */
        static constexpr bool approximate = false;

        /**
         * See `set_return_neighbors()` for more details.
         */
        static constexpr bool return_neighbors = false;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

private:
    NormalizationMethod normalization_method = Defaults::normalization_method;
    SharedSpace reduction = Defaults::reduction;
    bool project_query = Defaults::project_query;
    int npcs = Defaults::npcs;
    int dims = Defaults::dims;
    bool l2_norm = Defaults::l2_norm;
    int k_anchor = Defaults::k_anchor;
    int k_score = Defaults::k_score;
    int k_filter = Defaults::k_filter;
    int max_features = Defaults::max_features;
    size_t num_variable_features = Defaults::num_variable_features;
    double scale_max = Defaults::scale_max;
    bool approximate = Defaults::approximate;
    bool return_neighbors = Defaults::return_neighbors;
    int nthreads = Defaults::num_threads;

    std::vector<std::string> features;
    std::string reference_assay, query_assay;
    std::string reference_reduction, reference_neighbors;

    std::shared_ptr<spdlog::logger> logger;
    const CancellationToken* token = NULL;

public:
    /**
     * @param n Normalization method used for both the reference and query.
     * Both datasets must have been normalized with this method.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_normalization_method(NormalizationMethod n = Defaults::normalization_method) {
        normalization_method = n;
        return *this;
    }

    /**
     * @param r Strategy for defining the shared space.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_reduction(SharedSpace r = Defaults::reduction) {
        reduction = r;
        return *this;
    }

    /**
     * @param p Whether to fit the PCA on the query and project the reference, instead of the other way around.
     * This is only supported for `SharedSpace::PCA_PROJECT`.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_project_query(bool p = Defaults::project_query) {
        project_query = p;
        return *this;
    }

    /**
     * @param n Number of PCs to compute for `SharedSpace::PCA_PROJECT`.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_npcs(int n = Defaults::npcs) {
        npcs = n;
        return *this;
    }

    /**
     * @param d Number of leading dimensions of the shared space to use for neighbor searches.
     * For `SharedSpace::PCA_PROJECT`, this should be no greater than `set_npcs()`.
     * For `SharedSpace::CCA`, this is the number of canonical vectors to compute.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_dims(int d = Defaults::dims) {
        dims = d;
        return *this;
    }

    /**
     * @param l Whether to L2-normalize the embeddings before neighbor searches.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_l2_norm(bool l = Defaults::l2_norm) {
        l2_norm = l;
        return *this;
    }

    /**
     * @param k Number of neighbors to use when identifying anchors, see `FindAnchorPairs`.
     * This should be positive and less than the number of cells in each dataset.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_k_anchor(int k = Defaults::k_anchor) {
        k_anchor = k;
        return *this;
    }

    /**
     * @param k Number of neighbors to use when scoring anchors, see `ScoreAnchors`.
     * This should be positive and less than the number of cells in each dataset.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_k_score(int k = Defaults::k_score) {
        k_score = k;
        return *this;
    }

    /**
     * @param k Number of neighbors to use when filtering anchors, see `FilterAnchors`.
     * Values less than 1 disable filtering.
     * Values larger than the number of cells in either dataset are clamped with a warning.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_k_filter(int k = Defaults::k_filter) {
        k_filter = k;
        return *this;
    }

    /**
     * @param m Maximum number of features to use when filtering anchors, see `top_dim_features()`.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_max_features(int m = Defaults::max_features) {
        max_features = m;
        return *this;
    }

    /**
     * @param n Number of variable features to choose with `ChooseVariableFeatures`,
     * if no anchor features are supplied in `set_features()` and the relevant dataset has no variable features.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_num_variable_features(size_t n = Defaults::num_variable_features) {
        num_variable_features = n;
        return *this;
    }

    /**
     * @param m Maximum value of the scaled expression values prior to the PCA or CCA.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_scale_max(double m = Defaults::scale_max) {
        scale_max = m;
        return *this;
    }

    /**
     * @param a Whether to use an approximate neighbor search.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param r Whether to store the neighbor lists in the output `AnchorSet`.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_return_neighbors(bool r = Defaults::return_neighbors) {
        return_neighbors = r;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param f Names of the anchor features.
     * Features that are not present in both datasets are ignored.
     * If empty, the anchor features are chosen from the variable features of the reference (or the query, if `set_project_query()` is `true`).
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_features(std::vector<std::string> f = {}) {
        features = std::move(f);
        return *this;
    }

    /**
     * @param a Expected assay of the reference dataset.
     * If empty, no check is performed.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_reference_assay(std::string a = "") {
        reference_assay = std::move(a);
        return *this;
    }

    /**
     * @param a Expected assay of the query dataset.
     * If empty, no check is performed.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_query_assay(std::string a = "") {
        query_assay = std::move(a);
        return *this;
    }

    /**
     * @param r Name of a precomputed PCA in the reference dataset, to be used instead of fitting a new PCA.
     * This should contain loadings for the anchor features; anchor features without loadings are ignored.
     * If the reduction does not contain centering and scaling vectors, these are computed from the reference.
     * Only supported for `SharedSpace::PCA_PROJECT` without query projection.
     * If empty, a new PCA is fitted.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_reference_reduction(std::string r = "") {
        reference_reduction = std::move(r);
        return *this;
    }

    /**
     * @param n Name of a precomputed neighbor list in the reference dataset, to be used instead of searching for reference neighbors in the shared space.
     * This should contain at least `max(k_anchor, k_score)` neighbors for each reference cell, excluding the cell itself.
     * Only supported without query projection.
     * If empty, the reference neighbors are found from the shared space.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_reference_neighbors(std::string n = "") {
        reference_neighbors = std::move(n);
        return *this;
    }

    /**
     * @param l Logger to use for progress messages and warnings.
     * If `NULL`, the **spdlog** default logger is used.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_logger(std::shared_ptr<spdlog::logger> l = nullptr) {
        logger = std::move(l);
        return *this;
    }

    /**
     * @param t Pointer to a cancellation token, checked between each step.
     * This should remain valid for the duration of `run()`.
     * If `NULL`, cancellation is not possible.
     *
     * @return A reference to this `FindTransferAnchors` object.
     */
    FindTransferAnchors& set_cancellation_token(const CancellationToken* t = NULL) {
        token = t;
        return *this;
    }

private:
    struct SharedEmbedding {
        Eigen::MatrixXd reference, query; // dims x cells.
        Eigen::MatrixXd loadings, projected_loadings;
        Eigen::VectorXd stdev, center, scale;
    };

    static std::vector<int> find_rows(const Dataset& dataset, const std::vector<std::string>& names) {
        std::vector<int> output;
        output.reserve(names.size());
        for (const auto& n : names) {
            output.push_back(dataset.find_feature(n));
        }
        return output;
    }

    int max_k() const {
        return std::max(k_anchor, k_score);
    }

    void validate(const Dataset& reference, const Dataset& query) const {
        if (!reference_assay.empty() && reference_assay != reference.assay()) {
            throw ValidationError("reference_assay", "assay '" + reference_assay + "' is not present in the reference");
        }
        if (!query_assay.empty() && query_assay != query.assay()) {
            throw ValidationError("query_assay", "assay '" + query_assay + "' is not present in the query");
        }

        if (reference.normalization() != normalization_method || query.normalization() != normalization_method) {
            throw ValidationError("normalization_method", "reference and query must both be normalized with the requested method");
        }

        if (reduction == SharedSpace::CCA) {
            if (project_query) {
                throw ValidationError("reduction", "'cca' cannot be used with query projection");
            }
            if (!reference_reduction.empty()) {
                throw ValidationError("reference_reduction", "a precomputed reference reduction cannot be used with 'cca'");
            }
        }

        if (npcs < 1) {
            throw ValidationError("npcs", "number of PCs should be positive");
        }
        if (dims < 1) {
            throw ValidationError("dims", "number of dimensions should be positive");
        }

        if (!reference_reduction.empty()) {
            if (project_query) {
                throw ValidationError("reference_reduction", "a precomputed reference reduction cannot be used with query projection");
            }
            const auto& red = reference.reduction(reference_reduction, "reference_reduction");
            if (red.loadings.size() == 0 || static_cast<size_t>(red.loadings.rows()) != red.features.size()) {
                throw ValidationError("reference_reduction", "reduction '" + reference_reduction + "' should contain loadings for its features");
            }
            if (red.loadings.cols() != red.embeddings.rows()) {
                throw ValidationError("reference_reduction", "number of loading columns (" + std::to_string(red.loadings.cols()) + ") should be equal to the number of dimensions (" + std::to_string(red.embeddings.rows()) + ") in '" + reference_reduction + "'");
            }
            if (static_cast<size_t>(dims) > red.num_dims()) {
                throw ValidationError("dims", "number of dimensions (" + std::to_string(dims) + ") exceeds the number of dimensions in '" + reference_reduction + "' (" + std::to_string(red.num_dims()) + ")");
            }
        } else if (reduction == SharedSpace::PCA_PROJECT) {
            if (dims > npcs) {
                throw ValidationError("dims", "number of dimensions (" + std::to_string(dims) + ") exceeds the number of PCs (" + std::to_string(npcs) + ")");
            }

            // The feature count is only an upper bound here, as the anchor
            // features are not yet known.
            const Dataset& fitted = (project_query ? query : reference);
            size_t limit = std::min(fitted.num_cells(), std::min(reference.num_features(), query.num_features()));
            if (static_cast<size_t>(npcs) >= limit) {
                throw ValidationError("npcs", "number of PCs (" + std::to_string(npcs) + ") should be less than the number of features and cells (" + std::to_string(limit) + ")");
            }
        }

        int ncells = std::min(reference.num_cells(), query.num_cells());
        if (reduction == SharedSpace::CCA && dims >= ncells) {
            throw ValidationError("dims", "number of canonical vectors (" + std::to_string(dims) + ") should be less than the number of cells in each dataset (" + std::to_string(ncells) + ")");
        }

        if (k_anchor < 1 || k_anchor >= ncells) {
            throw ValidationError("k_anchor", "should be positive and less than the number of cells in each dataset (" + std::to_string(ncells) + ")");
        }
        if (k_score < 1 || k_score >= ncells) {
            throw ValidationError("k_score", "should be positive and less than the number of cells in each dataset (" + std::to_string(ncells) + ")");
        }

        if (!reference_neighbors.empty()) {
            if (project_query) {
                throw ValidationError("reference_neighbors", "precomputed reference neighbors cannot be used with query projection");
            }
            const auto& nn = reference.neighbors(reference_neighbors, "reference_neighbors");
            check_neighbor_list(nn, reference.num_cells(), max_k(), "reference_neighbors");
        }
    }

    std::vector<std::string> choose_features(const Dataset& reference, const Dataset& query, spdlog::logger* log) const {
        const Dataset& primary = (project_query ? query : reference);
        const Dataset& secondary = (project_query ? reference : query);

        std::vector<std::string> candidates;
        if (!features.empty()) {
            candidates = features;
        } else if (!primary.variable_features().empty()) {
            candidates = primary.variable_features();
        } else {
            log->info("no variable features available, choosing the top {} features by variance", num_variable_features);
            ChooseVariableFeatures chooser;
            chooser.set_top(num_variable_features).set_num_threads(nthreads);
            candidates = chooser.run(primary);
        }

        std::unordered_set<std::string> with_loadings;
        if (!reference_reduction.empty()) {
            const auto& red = reference.reduction(reference_reduction, "reference_reduction");
            with_loadings.insert(red.features.begin(), red.features.end());
        }

        std::vector<std::string> output;
        std::unordered_set<std::string> used;
        for (const auto& c : candidates) {
            if (primary.find_feature(c) < 0 || secondary.find_feature(c) < 0) {
                continue;
            }
            if (!reference_reduction.empty() && with_loadings.find(c) == with_loadings.end()) {
                continue;
            }
            if (used.insert(c).second) {
                output.push_back(c);
            }
        }

        if (output.empty()) {
            throw ValidationError("features", "no anchor features are present in both the reference and query");
        }
        return output;
    }

    SharedEmbedding project_pca(
        const Dataset& reference,
        const std::vector<std::string>& anchor_features,
        const std::shared_ptr<const tatami::NumericMatrix>& ref_sub,
        const std::shared_ptr<const tatami::NumericMatrix>& query_sub)
    const {
        bool do_scale = (normalization_method == NormalizationMethod::LOG_NORMALIZE);
        ProjectPca runner;
        runner.set_rank(npcs).set_scale(do_scale).set_scale_max(scale_max).set_num_threads(nthreads);

        const auto& fitted_sub = (project_query ? query_sub : ref_sub);
        const auto& other_sub = (project_query ? ref_sub : query_sub);

        SharedEmbedding output;
        Eigen::MatrixXd fitted_emb;

        if (!reference_reduction.empty()) {
            const auto& red = reference.reduction(reference_reduction, "reference_reduction");
            std::unordered_map<std::string, int> mapping;
            for (size_t f = 0; f < red.features.size(); ++f) {
                mapping[red.features[f]] = f;
            }

            size_t nfeatures = anchor_features.size();
            bool has_stats = (static_cast<size_t>(red.center.size()) == red.features.size() && static_cast<size_t>(red.scale.size()) == red.features.size());
            output.loadings.resize(nfeatures, red.loadings.cols());
            output.center.resize(nfeatures);
            output.scale.resize(nfeatures);

            for (size_t f = 0; f < nfeatures; ++f) {
                auto row = mapping[anchor_features[f]];
                output.loadings.row(f) = red.loadings.row(row);
                if (has_stats) {
                    output.center[f] = red.center[row];
                    output.scale[f] = red.scale[row];
                }
            }

            if (!has_stats) {
                auto stats = pca_utils::scale_matrix(fitted_sub.get(), do_scale, scale_max, nthreads);
                output.center = std::move(stats.center);
                if (do_scale) {
                    output.scale = std::move(stats.scale);
                } else {
                    output.scale = Eigen::VectorXd::Ones(nfeatures);
                }
            }

            fitted_emb = red.embeddings;
            output.stdev = red.stdev;
        } else {
            auto fit = runner.fit(fitted_sub.get());
            output.loadings = std::move(fit.rotation);
            output.center = std::move(fit.center);
            output.scale = std::move(fit.scale);
            output.stdev = std::move(fit.stdev);
            fitted_emb = std::move(fit.pcs);
        }

        Eigen::MatrixXd other_emb = runner.project(other_sub.get(), output.loadings, output.center, output.scale);

        auto scaled_fitted = pca_utils::scale_matrix_with_known_stats(fitted_sub.get(), output.center, do_scale, output.scale, scale_max, nthreads);
        output.projected_loadings = pca_utils::compute_projected_loadings(scaled_fitted, fitted_emb);
        auto scaled_other = pca_utils::scale_matrix_with_known_stats(other_sub.get(), output.center, do_scale, output.scale, scale_max, nthreads);
        output.projected_loadings += pca_utils::compute_projected_loadings(scaled_other, other_emb);

        if (project_query) {
            output.reference = std::move(other_emb);
            output.query = std::move(fitted_emb);
        } else {
            output.reference = std::move(fitted_emb);
            output.query = std::move(other_emb);
        }
        return output;
    }

    SharedEmbedding project_cca(const std::shared_ptr<const tatami::NumericMatrix>& ref_sub, const std::shared_ptr<const tatami::NumericMatrix>& query_sub) const {
        RunCca runner;
        runner.set_rank(dims).set_scale(normalization_method == NormalizationMethod::LOG_NORMALIZE).set_scale_max(scale_max).set_num_threads(nthreads);
        auto res = runner.run(ref_sub.get(), query_sub.get());

        SharedEmbedding output;
        output.reference = std::move(res.reference);
        output.query = std::move(res.query);
        output.projected_loadings = std::move(res.projected_loadings);
        return output;
    }

    MatchingNeighbors find_neighbors(const Dataset& reference, const Eigen::MatrixXd& matching, size_t nref, size_t nquery) const {
        Eigen::MatrixXd ref_match = matching.block(0, 0, dims, nref);
        Eigen::MatrixXd query_match = matching.block(0, nref, dims, nquery);

        FindNeighbors finder;
        finder.set_num_neighbors(max_k()).set_approximate(approximate).set_num_threads(nthreads);
        auto ref_index = finder.build(dims, nref, ref_match.data());
        auto query_index = finder.build(dims, nquery, query_match.data());

        MatchingNeighbors output;
        if (reference_neighbors.empty()) {
            output.ref_to_ref = finder.run(ref_index.get());
        } else {
            output.ref_to_ref = truncate_neighbors(reference.neighbors(reference_neighbors, "reference_neighbors"), max_k());
        }
        output.query_to_query = finder.run(query_index.get());
        output.ref_to_query = finder.run(query_index.get(), nref, ref_match.data());
        output.query_to_ref = finder.run(ref_index.get(), nquery, query_match.data());
        return output;
    }

    std::vector<Anchor> filter_anchors(
        std::vector<Anchor> anchors,
        const Dataset& reference,
        const Dataset& query,
        const std::vector<std::string>& anchor_features,
        const Eigen::MatrixXd& projected_loadings,
        spdlog::logger* log)
    const {
        TopDimFeaturesParameters params;
        params.max_features = max_features;
        auto top = top_dim_features(projected_loadings, dims, params);
        if (top.empty()) {
            log->warn("no features available for filtering anchors, retaining all anchors");
            return anchors;
        }

        std::vector<std::string> filter_features;
        filter_features.reserve(top.size());
        for (auto t : top) {
            filter_features.push_back(anchor_features[t]);
        }
        log->debug("filtering anchors with {} features", filter_features.size());

        auto ref_filter = pca_utils::subset_matrix_by_features(reference.matrix_ptr(), find_rows(reference, filter_features));
        auto query_filter = pca_utils::subset_matrix_by_features(query.matrix_ptr(), find_rows(query, filter_features));

        FilterAnchors filter;
        filter.set_num_neighbors(k_filter).set_approximate(approximate).set_num_threads(nthreads);
        auto res = filter.run(anchors, ref_filter.get(), query_filter.get());

        if (res.clamped) {
            log->warn("'k_filter' ({}) is larger than the number of cells in the smaller dataset, using {} instead", k_filter, res.num_neighbors);
        }
        return std::move(res.anchors);
    }

public:
    /**
     * @param reference The reference dataset.
     * @param query The query dataset.
     *
     * @return An `AnchorSet` containing the anchors between `reference` and `query`.
     */
    AnchorSet run(const Dataset& reference, const Dataset& query) const {
        auto log = (logger ? logger : spdlog::default_logger());

        run_stage("validating parameters", [&]() -> void { validate(reference, query); });
        size_t nref = reference.num_cells(), nquery = query.num_cells();

        check_cancelled(token, "selecting features");
        auto anchor_features = run_stage("selecting features", [&]() -> std::vector<std::string> { return choose_features(reference, query, log.get()); });
        log->info("using {} anchor features", anchor_features.size());

        auto ref_sub = pca_utils::subset_matrix_by_features(reference.matrix_ptr(), find_rows(reference, anchor_features));
        auto query_sub = pca_utils::subset_matrix_by_features(query.matrix_ptr(), find_rows(query, anchor_features));

        check_cancelled(token, "projecting");
        std::string reduction_name = (reduction == SharedSpace::CCA ? "cca" : "pcaproject");
        log->info("projecting cells into the shared '{}' space", reduction_name);
        auto shared = run_stage("projecting", [&]() -> SharedEmbedding {
            if (reduction == SharedSpace::CCA) {
                return project_cca(ref_sub, query_sub);
            } else {
                return project_pca(reference, anchor_features, ref_sub, query_sub);
            }
        });

        Reduction base;
        base.key = (reduction == SharedSpace::CCA ? "CC_" : "ProjectPC_");
        base.embeddings.resize(shared.reference.rows(), nref + nquery);
        base.embeddings.leftCols(nref) = shared.reference;
        base.embeddings.rightCols(nquery) = shared.query;
        base.loadings = std::move(shared.loadings);
        if (base.loadings.size()) {
            base.features = anchor_features;
            base.center = std::move(shared.center);
            base.scale = std::move(shared.scale);
        }
        base.projected_loadings = std::move(shared.projected_loadings);
        base.projected_features = anchor_features;
        base.stdev = std::move(shared.stdev);

        std::string matching_name = reduction_name;
        Reduction normalized;
        if (l2_norm) {
            normalized = l2_normalize(base);
            matching_name += ".l2";
        }
        const Eigen::MatrixXd& matching = (l2_norm ? normalized.embeddings : base.embeddings);

        check_cancelled(token, "finding neighbors");
        log->debug("finding {} nearest neighbors in {} dimensions", max_k(), dims);
        auto neighbors = run_stage("finding neighbors", [&]() -> MatchingNeighbors { return find_neighbors(reference, matching, nref, nquery); });

        check_cancelled(token, "finding anchors");
        auto anchors = run_stage("finding anchors", [&]() -> std::vector<Anchor> {
            FindAnchorPairs finder;
            finder.set_num_neighbors(k_anchor);
            return finder.run(neighbors.ref_to_query, neighbors.query_to_ref);
        });
        log->info("found {} anchors", anchors.size());

        check_cancelled(token, "scoring anchors");
        anchors = run_stage("scoring anchors", [&]() -> std::vector<Anchor> {
            ScoreAnchors scorer;
            scorer.set_num_neighbors(k_score).set_num_threads(nthreads);
            return scorer.run(std::move(anchors), neighbors.ref_to_ref, neighbors.ref_to_query, neighbors.query_to_ref, neighbors.query_to_query);
        });

        if (k_filter > 0) {
            check_cancelled(token, "filtering anchors");
            anchors = run_stage("filtering anchors", [&]() -> std::vector<Anchor> {
                return filter_anchors(std::move(anchors), reference, query, anchor_features, base.projected_loadings, log.get());
            });
            log->info("retained {} anchors after filtering", anchors.size());
        }

        // Assembling the combined dataset.
        std::vector<std::shared_ptr<const tatami::NumericMatrix> > pieces{ ref_sub, query_sub };
        std::shared_ptr<const tatami::NumericMatrix> bound = tatami::make_DelayedBind<1>(std::move(pieces));

        std::vector<std::string> combined_cells;
        combined_cells.reserve(nref + nquery);
        for (const auto& c : reference.cells()) {
            combined_cells.push_back(c + "_reference");
        }
        for (const auto& c : query.cells()) {
            combined_cells.push_back(c + "_query");
        }

        Dataset combined(std::move(bound), anchor_features, std::move(combined_cells), reference.options());
        combined = combined.with_reduction(reduction_name, std::move(base));
        if (l2_norm) {
            combined = combined.with_reduction(matching_name, std::move(normalized));
        }

        std::shared_ptr<const MatchingNeighbors> kept;
        if (return_neighbors) {
            kept = std::make_shared<const MatchingNeighbors>(std::move(neighbors));
        }

        return AnchorSet(
            std::move(combined),
            std::move(reduction_name),
            std::move(matching_name),
            dims,
            std::move(anchors),
            std::move(anchor_features),
            reference.cells(),
            query.cells(),
            std::move(kept)
        );
    }
};

}

#endif
