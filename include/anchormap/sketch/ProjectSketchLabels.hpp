#ifndef ANCHORMAP_PROJECT_SKETCH_LABELS_HPP
#define ANCHORMAP_PROJECT_SKETCH_LABELS_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"

#include "knncolle/knncolle.hpp"
#include "tatami/tatami.hpp"

#include <vector>
#include <memory>
#include <algorithm>
#include <limits>
#include <tuple>

/**
 * @file ProjectSketchLabels.hpp
 *
 * @brief Extend labels from a sketch to the full dataset.
 */

namespace anchormap {

/**
 * @brief Extend labels from a sketch to the full dataset.
 *
 * This class assigns each cell in the full dataset to the most frequent label among its nearest neighbors in the sketch.
 * The sketch is usually generated by `SketchCells`, and the labels are obtained from some expensive analysis of the sketch, e.g., clustering or `TransferData`.
 * Both the sketch and the full dataset should be represented in the same low-dimensional space,
 * typically by fitting `ProjectPca` on the sketch and then projecting the full dataset onto the sketch's PCs.
 *
 * This favors abundant labels that are more likely to achieve a majority.
 * The proportions of neighbors supporting the best and second-best labels can be used to flag ambiguous assignments.
 */
class ProjectSketchLabels {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for details.
         */
        static constexpr int num_neighbors = 20;

        /**
         * See `set_approximate()` for details.
         */
        static constexpr bool approximate = false;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

    /**
     * @param k Number of neighbors to use for assigning a label.
     * Smaller values focus more on the local neighborhood around each cell, while larger values focus on the behavior of the bulk of each label.
     *
     * @return A reference to this `ProjectSketchLabels` object.
     */
    ProjectSketchLabels& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param a Whether approximate neighbor detection should be used.
     *
     * @return A reference to this `ProjectSketchLabels` object.
     */
    ProjectSketchLabels& set_approximate(bool a = Defaults::approximate) {
        approximate = a;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `ProjectSketchLabels` object.
     */
    ProjectSketchLabels& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

private:
    int num_neighbors = Defaults::num_neighbors;
    bool approximate = Defaults::approximate;
    int nthreads = Defaults::num_threads;

    static std::tuple<int, double, double> assign(const std::vector<std::pair<int, double> >& neighbors, const int* labels, int nlabels, int* buffer) {
        std::fill(buffer, buffer + nlabels, 0);
        for (const auto& n : neighbors) {
            ++(buffer[labels[n.first]]);
        }

        int best = 0, second = 0;
        bool no_second = true;
        for (int l = 1; l < nlabels; ++l) {
            if (buffer[best] < buffer[l]) {
                second = best;
                best = l;
                no_second = false;
            } else if (no_second || buffer[second] < buffer[l]) {
                second = l;
                no_second = false;
            }
        }

        double best_prop = static_cast<double>(buffer[best]) / neighbors.size();
        double second_prop = (nlabels > 1 ? static_cast<double>(buffer[second]) / neighbors.size() : std::numeric_limits<double>::quiet_NaN());
        return std::make_tuple(best, best_prop, second_prop);
    }

public:
    /**
     * @brief Results of the label projection.
     */
    struct Results {
        /**
         * @cond
         */
        Results(size_t n) : assigned(n), best_prop(n), second_prop(n) {}
        /**
         * @endcond
         */

        /**
         * Assigned label for each cell in the full dataset.
         */
        std::vector<int> assigned;

        /**
         * Proportion of neighbors supporting each cell's assignment in `assigned`.
         */
        std::vector<double> best_prop;

        /**
         * Proportion of neighbors supporting the second-most frequent label for each cell.
         * This is NaN if there is only one label.
         */
        std::vector<double> second_prop;
    };

    /**
     * @param index Neighbor search index constructed from the sketch embedding.
     * @param[in] labels Pointer to an array of length equal to the number of cells in the sketch, containing the label for each cell.
     * Labels should be integers in $[0, N)$ where $N$ is the number of labels.
     * @param nfull Number of cells in the full dataset.
     * @param[in] full Pointer to a column-major array where each row is a dimension and each column is a cell in the full dataset.
     *
     * @return A `Results` object containing the assigned labels.
     */
    Results run(const knncolle::Base<int, double>* index, const int* labels, size_t nfull, const double* full) const {
        size_t nsketch = index->nobs();
        if (nsketch == 0) {
            throw DataError("sketch should contain at least one cell");
        }
        if (num_neighbors < 1) {
            throw ValidationError("num_neighbors", "should be positive");
        }

        int nlabels = 0;
        for (size_t s = 0; s < nsketch; ++s) {
            if (labels[s] < 0) {
                throw DataError("labels should be non-negative integers");
            }
            nlabels = std::max(nlabels, labels[s] + 1);
        }

        Results output(nfull);
        size_t ndim = index->ndim();
        int k = std::min(static_cast<size_t>(num_neighbors), nsketch);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<int> buffer(nlabels);
            for (size_t o = start, end = start + length; o < end; ++o) {
                auto neighbors = index->find_nearest_neighbors(full + o * ndim, k);
                auto details = assign(neighbors, labels, nlabels, buffer.data());
                output.assigned[o] = std::get<0>(details);
                output.best_prop[o] = std::get<1>(details);
                output.second_prop[o] = std::get<2>(details);
            }
        }, nfull, nthreads);

        return output;
    }

    /**
     * @param ndim Number of dimensions.
     * @param nsketch Number of cells in the sketch.
     * @param[in] sketch Pointer to a column-major array where each row is a dimension and each column is a sketch cell.
     * @param[in] labels Pointer to an array of length `nsketch`, containing the label for each sketch cell.
     * @param nfull Number of cells in the full dataset.
     * @param[in] full Pointer to a column-major array where each row is a dimension and each column is a cell in the full dataset.
     * This should be in the same space as `sketch`.
     *
     * @return A `Results` object containing the assigned labels.
     */
    Results run(int ndim, size_t nsketch, const double* sketch, const int* labels, size_t nfull, const double* full) const {
        std::shared_ptr<knncolle::Base<int, double> > ptr;
        if (approximate) {
            ptr.reset(new knncolle::AnnoyEuclidean<int, double>(ndim, nsketch, sketch));
        } else {
            ptr.reset(new knncolle::VpTreeEuclidean<int, double>(ndim, nsketch, sketch));
        }
        return run(ptr.get(), labels, nfull, full);
    }
};

}

#endif
