#ifndef ANCHORMAP_FIND_NEIGHBORS_HPP
#define ANCHORMAP_FIND_NEIGHBORS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "NeighborList.hpp"

#include "knncolle/knncolle.hpp"
#include "tatami/tatami.hpp"

#include <vector>
#include <algorithm>
#include <memory>
#include <string>

/**
 * @file FindNeighbors.hpp
 *
 * @brief Find nearest neighbors within or across embeddings.
 */

namespace anchormap {

/**
 * @brief Find nearest neighbors within or across embeddings.
 *
 * This wraps the [**knncolle**](https://github.com/LTLA/knncolle) library to find the nearest neighbors of each cell,
 * either among the other cells of the same embedding or among the cells of another embedding in the same space.
 * An exact search uses vantage point trees while an approximate search uses Annoy.
 * Cosine distances can be obtained by L2-normalizing the embeddings beforehand, see `l2_normalize()`.
 */
class FindNeighbors {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for more details.
         */
        static constexpr int num_neighbors = 30;

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
     * @param k Number of neighbors to find for each cell.
     *
     * @return A reference to this `FindNeighbors` object.
     */
    FindNeighbors& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param a Whether approximate neighbor detection should be used.
     *
     * @return A reference to this `FindNeighbors` object.
     */
    FindNeighbors& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `FindNeighbors` object.
     */
    FindNeighbors& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;
    bool approximate = Defaults::approximate;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param ndim Number of dimensions.
     * @param nobs Number of cells.
     * @param[in] data Pointer to a column-major array where each row is a dimension and each column is a cell.
     * This should remain valid for the lifetime of the returned index.
     *
     * @return Pointer to a search index over the cells in `data`.
     */
    std::shared_ptr<knncolle::Base<int, double> > build(int ndim, size_t nobs, const double* data) const {
        std::shared_ptr<knncolle::Base<int, double> > ptr;
        if (approximate) {
            ptr.reset(new knncolle::AnnoyEuclidean<int, double>(ndim, nobs, data));
        } else {
            ptr.reset(new knncolle::VpTreeEuclidean<int, double>(ndim, nobs, data));
        }
        return ptr;
    }

    /**
     * Find the nearest neighbors of each cell among the other cells in the same index.
     * The cell itself is not reported as its own neighbor.
     *
     * @param index Pointer to a search index.
     *
     * @return Neighbors for each cell in `index`.
     */
    NeighborList run(const knncolle::Base<int, double>* index) const {
        size_t nobs = index->nobs();
        NeighborList output(nobs);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t i = start, end = start + length; i < end; ++i) {
                output[i] = index->find_nearest_neighbors(i, num_neighbors);
            }
        }, nobs, nthreads);

        return output;
    }

    /**
     * Find the nearest neighbors of each query cell among the cells in the index.
     *
     * @param index Pointer to a search index.
     * @param nquery Number of query cells.
     * @param[in] query Pointer to a column-major array where each row is a dimension and each column is a query cell.
     * This should have the same number of dimensions as the cells in `index`.
     *
     * @return Neighbors for each query cell, with indices referring to cells in `index`.
     */
    NeighborList run(const knncolle::Base<int, double>* index, size_t nquery, const double* query) const {
        size_t ndim = index->ndim();
        NeighborList output(nquery);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t i = start, end = start + length; i < end; ++i) {
                output[i] = index->find_nearest_neighbors(query + i * ndim, num_neighbors);
            }
        }, nquery, nthreads);

        return output;
    }

    /**
     * @param ndim Number of dimensions.
     * @param nobs Number of cells.
     * @param[in] data Pointer to a column-major array where each row is a dimension and each column is a cell.
     *
     * @return Neighbors for each cell in `data`, excluding itself.
     */
    NeighborList run(int ndim, size_t nobs, const double* data) const {
        auto index = build(ndim, nobs, data);
        return run(index.get());
    }

    /**
     * @param ndim Number of dimensions.
     * @param nobs Number of cells in the searched embedding.
     * @param[in] data Pointer to a column-major array where each row is a dimension and each column is a cell.
     * @param nquery Number of query cells.
     * @param[in] query Pointer to a column-major array where each row is a dimension and each column is a query cell.
     *
     * @return Neighbors in `data` for each cell in `query`.
     */
    NeighborList run(int ndim, size_t nobs, const double* data, size_t nquery, const double* query) const {
        auto index = build(ndim, nobs, data);
        return run(index.get(), nquery, query);
    }
};

/**
 * Check that a precomputed neighbor list is suitable for a search with `k` neighbors.
 *
 * @param neighbors Precomputed neighbors for each cell.
 * @param nobs Expected number of cells.
 * @param k Number of neighbors required for each cell.
 * @param parameter Name of the parameter that supplied `neighbors`, for use in error messages.
 *
 * A `ValidationError` is thrown if `neighbors` does not have one entry per cell, or if any cell has fewer than `k` neighbors.
 */
inline void check_neighbor_list(const NeighborList& neighbors, size_t nobs, size_t k, const std::string& parameter) {
    if (neighbors.size() != nobs) {
        throw ValidationError(parameter, "number of cells (" + std::to_string(neighbors.size()) + ") should be equal to " + std::to_string(nobs));
    }
    for (const auto& current : neighbors) {
        if (current.size() < k) {
            throw ValidationError(parameter, "each cell should have at least " + std::to_string(k) + " neighbors");
        }
    }
}

/**
 * Truncate each cell's neighbors to the nearest `k`.
 *
 * @param neighbors Neighbors for each cell, sorted by increasing distance.
 * @param k Number of neighbors to retain.
 *
 * @return Copy of `neighbors` with at most `k` neighbors for each cell.
 */
inline NeighborList truncate_neighbors(const NeighborList& neighbors, size_t k) {
    NeighborList output;
    output.reserve(neighbors.size());
    for (const auto& current : neighbors) {
        auto last = current.begin() + std::min(k, current.size());
        output.emplace_back(current.begin(), last);
    }
    return output;
}

}

#endif
