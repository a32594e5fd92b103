#ifndef ANCHORMAP_FILTER_ANCHORS_HPP
#define ANCHORMAP_FILTER_ANCHORS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../dimensionality_reduction/convert.hpp"
#include "../dimensionality_reduction/l2_normalize.hpp"
#include "Anchor.hpp"

#include "knncolle/knncolle.hpp"
#include "tatami/tatami.hpp"
#include "Eigen/Dense"

#include <vector>
#include <memory>
#include <algorithm>
#include <unordered_map>

/**
 * @file FilterAnchors.hpp
 *
 * @brief Remove anchors that are not supported by the original expression values.
 */

namespace anchormap {

/**
 * @brief Remove anchors that are not supported by the original expression values.
 *
 * Anchors are identified in a low-dimensional shared space, which may introduce spurious correspondences that are artifacts of the projection.
 * To protect against this, we compute cosine distances between reference and query cells using their normalized expression values for a set of informative features (see `top_dim_features()`).
 * An anchor is retained only if its query cell is among the `k` nearest query cells of its reference cell, and its reference cell is among the `k` nearest reference cells of its query cell.
 *
 * If `k` is larger than the number of cells in either dataset, it is clamped to the smaller of the two dataset sizes.
 * This is reported in `Results::clamped` so that the caller can emit a warning.
 */
class FilterAnchors {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for more details.
         */
        static constexpr int num_neighbors = 200;

        /**
         * See `set_approximate()` for more details.
         */
        static constexpr bool approximate = false;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param k Number of neighbors to use for filtering.
     * Values less than 1 disable the filter, in which case all anchors are retained.
     *
     * @return A reference to this `FilterAnchors` object.
     */
    FilterAnchors& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param a Whether approximate neighbor detection should be used.
     *
     * @return A reference to this `FilterAnchors` object.
     */
    FilterAnchors& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `FilterAnchors` object.
     */
    FilterAnchors& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;
    bool approximate = Defaults::approximate;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @brief Results of the filtering.
     */
    struct Results {
        /**
         * Anchors that passed the filter, in the same order as the input.
         */
        std::vector<Anchor> anchors;

        /**
         * Number of neighbors that was actually used for filtering.
         */
        int num_neighbors = 0;

        /**
         * Whether the requested number of neighbors was clamped to the number of available cells.
         */
        bool clamped = false;
    };

private:
    template<class Extract_>
    std::unordered_map<int, std::vector<int> > search(const knncolle::Base<int, double>* index, const std::vector<int>& cells, int k, Extract_ extract) const {
        std::vector<std::vector<int> > found(cells.size());
        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t i = start, end = start + length; i < end; ++i) {
                auto neighbors = index->find_nearest_neighbors(extract(cells[i]), k);
                auto& current = found[i];
                current.reserve(neighbors.size());
                for (const auto& n : neighbors) {
                    current.push_back(n.first);
                }
                std::sort(current.begin(), current.end());
            }
        }, cells.size(), nthreads);

        std::unordered_map<int, std::vector<int> > output;
        for (size_t i = 0; i < cells.size(); ++i) {
            output[cells[i]] = std::move(found[i]);
        }
        return output;
    }

    static std::vector<int> unique_cells(const std::vector<Anchor>& anchors, bool reference) {
        std::vector<int> output;
        output.reserve(anchors.size());
        for (const auto& a : anchors) {
            output.push_back(reference ? a.reference : a.query);
        }
        std::sort(output.begin(), output.end());
        output.erase(std::unique(output.begin(), output.end()), output.end());
        return output;
    }

public:
    /**
     * @param anchors Vector of anchors.
     * @param ndim Number of features.
     * @param nref Number of reference cells.
     * @param[in] ref Pointer to a column-major array where each row is a feature and each column is a reference cell.
     * Each column should already be L2-normalized.
     * @param nquery Number of query cells.
     * @param[in] query Pointer to a column-major array where each row is a feature and each column is a query cell.
     * Each column should already be L2-normalized.
     *
     * @return A `Results` object containing the filtered anchors.
     */
    Results run(const std::vector<Anchor>& anchors, int ndim, size_t nref, const double* ref, size_t nquery, const double* query) const {
        Results output;
        output.num_neighbors = num_neighbors;
        int available = std::min(nref, nquery);
        if (output.num_neighbors > available) {
            output.num_neighbors = available;
            output.clamped = true;
        }

        if (output.num_neighbors < 1) {
            output.anchors = anchors;
            return output;
        }
        if (anchors.empty()) {
            return output;
        }

        std::shared_ptr<knncolle::Base<int, double> > ref_index, query_index;
        if (approximate) {
            ref_index.reset(new knncolle::AnnoyEuclidean<int, double>(ndim, nref, ref));
            query_index.reset(new knncolle::AnnoyEuclidean<int, double>(ndim, nquery, query));
        } else {
            ref_index.reset(new knncolle::VpTreeEuclidean<int, double>(ndim, nref, ref));
            query_index.reset(new knncolle::VpTreeEuclidean<int, double>(ndim, nquery, query));
        }

        size_t stride = ndim;
        auto ref_cells = unique_cells(anchors, true);
        auto ref_to_query = search(query_index.get(), ref_cells, output.num_neighbors, [&](int r) -> const double* { return ref + r * stride; });
        auto query_cells = unique_cells(anchors, false);
        auto query_to_ref = search(ref_index.get(), query_cells, output.num_neighbors, [&](int q) -> const double* { return query + q * stride; });

        for (const auto& a : anchors) {
            const auto& rq = ref_to_query[a.reference];
            if (!std::binary_search(rq.begin(), rq.end(), a.query)) {
                continue;
            }
            const auto& qr = query_to_ref[a.query];
            if (!std::binary_search(qr.begin(), qr.end(), a.reference)) {
                continue;
            }
            output.anchors.push_back(a);
        }

        return output;
    }

    /**
     * @tparam T Floating point type for the data.
     * @tparam IDX Integer type for the indices.
     *
     * @param anchors Vector of anchors.
     * @param[in] ref Pointer to a feature-by-cell matrix of normalized expression values for the reference.
     * This should only contain the features to be used for filtering.
     * @param[in] query Pointer to a feature-by-cell matrix of normalized expression values for the query.
     * This should contain the same features as `ref`, in the same order.
     *
     * @return A `Results` object containing the filtered anchors.
     */
    template<typename T, typename IDX>
    Results run(const std::vector<Anchor>& anchors, const tatami::Matrix<T, IDX>* ref, const tatami::Matrix<T, IDX>* query) const {
        if (ref->nrow() != query->nrow()) {
            throw DataError("reference and query should have the same number of features");
        }

        // Extraction gives us cells in the rows, so we transpose to get cells in the columns.
        Eigen::MatrixXd ref_data = pca_utils::extract_dense_for_pca(ref, nthreads).adjoint();
        l2_normalize(ref_data.rows(), ref_data.cols(), ref_data.data());
        Eigen::MatrixXd query_data = pca_utils::extract_dense_for_pca(query, nthreads).adjoint();
        l2_normalize(query_data.rows(), query_data.cols(), query_data.data());

        return run(anchors, ref->nrow(), ref_data.cols(), ref_data.data(), query_data.cols(), query_data.data());
    }
};

}

#endif
