#ifndef ANCHORMAP_SKETCH_CELLS_HPP
#define ANCHORMAP_SKETCH_CELLS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../utils/blocking.hpp"
#include "../data/Dataset.hpp"
#include "../dimensionality_reduction/utils.hpp"
#include "LeverageScore.hpp"

#include "tatami/tatami.hpp"
#include "aarand/aarand.hpp"

#include <vector>
#include <random>
#include <algorithm>
#include <numeric>
#include <limits>
#include <cmath>
#include <cstdint>
#include <string>

/**
 * @file SketchCells.hpp
 *
 * @brief Select a representative subset of cells.
 */

namespace anchormap {

/**
 * Strategy for choosing the cells in a sketch.
 *
 * - `LEVERAGE`: sample without replacement with probability proportional to the leverage score of each cell, see `LeverageScore`.
 * - `UNIFORM`: sample without replacement with equal probability for each cell.
 */
enum class SketchMethod : char { LEVERAGE, UNIFORM };

/**
 * @brief Select a representative subset of cells.
 *
 * This class chooses a "sketch" of a large dataset, i.e., a subset of cells that can be held in memory and used for expensive analyses.
 * The results can then be propagated back to the full dataset, e.g., with `ProjectPca::project()` and `ProjectSketchLabels`.
 * Weighted sampling without replacement is performed with the exponential keys of Efraimidis and Spirakis (2006),
 * where each cell receives a key of $\log(u) / w$ for a uniform random $u$ and weight $w$, and the cells with the largest keys are chosen.
 */
class SketchCells {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_method()` for more details.
         */
        static constexpr SketchMethod method = SketchMethod::LEVERAGE;

        /**
         * See `set_num_cells()` for more details.
         */
        static constexpr int num_cells = 5000;

        /**
         * See `set_seed()` for more details.
         */
        static constexpr uint64_t seed = 123;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param m Sampling strategy.
     *
     * @return A reference to this `SketchCells` object.
     */
    SketchCells& set_method(SketchMethod m = Defaults::method) {
        method = m;
        return *this;
    }

    /**
     * @param n Number of cells to sample.
     * In the blocked case, this number of cells is sampled from each block.
     *
     * @return A reference to this `SketchCells` object.
     */
    SketchCells& set_num_cells(int n = Defaults::num_cells) {
        num_cells = n;
        return *this;
    }

    /**
     * @param s Seed for the random number generator.
     * This is also used for the leverage score calculation.
     *
     * @return A reference to this `SketchCells` object.
     */
    SketchCells& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `SketchCells` object.
     */
    SketchCells& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @return Parameters for the leverage score calculation, to be modified by the caller.
     * The seed and number of threads are overridden by `set_seed()` and `set_num_threads()`.
     */
    LeverageScore& leverage_parameters() {
        return leverage;
    }

private:
    SketchMethod method = Defaults::method;
    int num_cells = Defaults::num_cells;
    uint64_t seed = Defaults::seed;
    int nthreads = Defaults::num_threads;
    LeverageScore leverage;

    void check_num_cells(size_t available) const {
        if (num_cells < 0 || static_cast<size_t>(num_cells) > available) {
            throw ValidationError("num_cells", "cannot sample " + std::to_string(num_cells) + " cells from " + std::to_string(available) + " cells");
        }
    }

    std::vector<int> sample(const std::vector<int>& candidates, const double* weights, std::mt19937_64& rng) const {
        std::vector<int> chosen;
        size_t n = candidates.size();

        if (method == SketchMethod::UNIFORM) {
            std::vector<int> positions(num_cells);
            aarand::sample(n, num_cells, positions.begin(), rng);
            chosen.reserve(num_cells);
            for (auto p : positions) {
                chosen.push_back(candidates[p]);
            }
            return chosen;
        }

        std::vector<double> keys(n);
        for (size_t i = 0; i < n; ++i) {
            double u = aarand::standard_uniform(rng);
            double w = weights[candidates[i]];
            if (w > 0) {
                keys[i] = std::log(u) / w;
            } else {
                keys[i] = -std::numeric_limits<double>::infinity();
            }
        }

        std::vector<int> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int l, int r) -> bool { return keys[l] > keys[r]; });

        chosen.reserve(num_cells);
        for (int i = 0; i < num_cells; ++i) {
            chosen.push_back(candidates[order[i]]);
        }
        return chosen;
    }

public:
    /**
     * @param ncells Number of cells.
     * @param[in] weights Pointer to an array of length `ncells` containing non-negative sampling weights, e.g., leverage scores.
     * Ignored if the method is `SketchMethod::UNIFORM`.
     *
     * @return Sorted indices of the sampled cells.
     */
    std::vector<int> run(size_t ncells, const double* weights) const {
        check_num_cells(ncells);
        std::vector<int> candidates(ncells);
        std::iota(candidates.begin(), candidates.end(), 0);

        std::mt19937_64 rng(seed);
        auto chosen = sample(candidates, weights, rng);
        std::sort(chosen.begin(), chosen.end());
        return chosen;
    }

    /**
     * @tparam Block_ Integer type for the block assignments.
     *
     * @param ncells Number of cells.
     * @param[in] weights Pointer to an array of length `ncells` containing non-negative sampling weights.
     * Ignored if the method is `SketchMethod::UNIFORM`.
     * @param[in] block Pointer to an array of length `ncells` containing the block assignment for each cell.
     * Block identifiers should be integers in $[0, B)$ where $B$ is the number of blocks.
     *
     * @return Sorted indices of the sampled cells, containing `set_num_cells()` cells from each block.
     */
    template<typename Block_>
    std::vector<int> run(size_t ncells, const double* weights, const Block_* block) const {
        auto block_size = tabulate_ids(ncells, block);
        std::vector<std::vector<int> > by_block(block_size.size());
        for (size_t b = 0; b < block_size.size(); ++b) {
            check_num_cells(block_size[b]);
            by_block[b].reserve(block_size[b]);
        }
        for (size_t c = 0; c < ncells; ++c) {
            by_block[block[c]].push_back(c);
        }

        std::mt19937_64 rng(seed);
        std::vector<int> chosen;
        for (const auto& candidates : by_block) {
            auto current = sample(candidates, weights, rng);
            chosen.insert(chosen.end(), current.begin(), current.end());
        }

        std::sort(chosen.begin(), chosen.end());
        return chosen;
    }

public:
    /**
     * @brief A sketch of a dataset.
     */
    struct Sketch {
        /**
         * Sorted indices of the sampled cells in the original dataset.
         */
        std::vector<int> indices;

        /**
         * Leverage score of each cell in the original dataset.
         * Empty if the method is `SketchMethod::UNIFORM`.
         */
        std::vector<double> leverage;

        /**
         * In-memory dataset containing only the sampled cells.
         */
        Dataset dataset;
    };

private:
    std::vector<double> compute_leverage(const Dataset& dataset) const {
        if (method != SketchMethod::LEVERAGE) {
            return std::vector<double>();
        }

        auto mat = dataset.matrix_ptr();
        const auto& hvgs = dataset.variable_features();
        if (!hvgs.empty()) {
            std::vector<int> rows;
            rows.reserve(hvgs.size());
            for (const auto& h : hvgs) {
                rows.push_back(dataset.find_feature(h));
            }
            std::sort(rows.begin(), rows.end());
            mat = pca_utils::subset_matrix_by_features(std::move(mat), std::move(rows));
        }

        auto copy = leverage;
        copy.set_seed(seed).set_num_threads(nthreads);
        return copy.run(mat.get());
    }

public:
    /**
     * Sample cells from a dataset.
     * Leverage scores are computed from the variable features of `dataset` if present, otherwise all features are used.
     *
     * @param dataset The dataset to sketch.
     * This is not modified.
     *
     * @return A `Sketch` of the dataset.
     */
    Sketch run(const Dataset& dataset) const {
        auto scores = compute_leverage(dataset);
        auto chosen = run(dataset.num_cells(), scores.data());
        auto subset = dataset.subset_cells(chosen, nthreads);
        return Sketch{ std::move(chosen), std::move(scores), std::move(subset) };
    }

    /**
     * Sample cells from each block of a dataset.
     *
     * @tparam Block_ Integer type for the block assignments.
     *
     * @param dataset The dataset to sketch.
     * @param[in] block Pointer to an array of length equal to the number of cells in `dataset`, containing the block assignment for each cell.
     *
     * @return A `Sketch` of the dataset with `set_num_cells()` cells from each block.
     */
    template<typename Block_>
    Sketch run(const Dataset& dataset, const Block_* block) const {
        auto scores = compute_leverage(dataset);
        auto chosen = run(dataset.num_cells(), scores.data(), block);
        auto subset = dataset.subset_cells(chosen, nthreads);
        return Sketch{ std::move(chosen), std::move(scores), std::move(subset) };
    }
};

}

#endif
