#ifndef ANCHORMAP_CHOOSE_VARIABLE_FEATURES_HPP
#define ANCHORMAP_CHOOSE_VARIABLE_FEATURES_HPP

#include "../utils/macros.hpp"
#include "../data/Dataset.hpp"

#include "tatami/tatami.hpp"

#include <vector>
#include <string>
#include <algorithm>
#include <numeric>

/**
 * @file ChooseVariableFeatures.hpp
 *
 * @brief Choose variable features to use for anchor finding.
 */

namespace anchormap {

/**
 * @brief Choose the most variable features in a dataset.
 *
 * This is done by selecting the `top` number of features with the largest variances in the normalized expression values.
 * It is used by `FindTransferAnchors` when no variable features are available for the reference (or query, when projecting the query).
 */
class ChooseVariableFeatures {
public:
    /**
     * @brief Default paramater settings.
     */
    struct Defaults {
        /**
         * See `set_top()` for more details.
         */
        static constexpr size_t top = 2000;

        /**
         * See `set_num_threads()` for more details.
         */
        static constexpr int num_threads = 1;
    };

private:
    size_t top = Defaults::top;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param t The number of top features to choose.
     *
     * @return A reference to this `ChooseVariableFeatures` object.
     */
    ChooseVariableFeatures& set_top(size_t t = Defaults::top) {
        top = t;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     *
     * @return A reference to this `ChooseVariableFeatures` object.
     */
    ChooseVariableFeatures& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * @tparam V Type of the variance statistic.
     *
     * @param n Number of features.
     * @param[in] statistic Pointer to an array of length `n` containing the per-feature variance statistics.
     *
     * @return Indices of the top features, ordered by decreasing `statistic`.
     * Ties are broken by the feature index.
     */
    template<typename V>
    std::vector<int> run(size_t n, const V* statistic) const {
        std::vector<int> collected(n);
        std::iota(collected.begin(), collected.end(), 0);
        std::stable_sort(collected.begin(), collected.end(), [&](int l, int r) -> bool { return statistic[l] > statistic[r]; });
        collected.resize(std::min(n, top));
        return collected;
    }

    /**
     * @tparam T Type of the matrix data.
     * @tparam IDX Integer type for the matrix indices.
     *
     * @param mat Pointer to a feature-by-cell matrix of normalized expression values.
     *
     * @return Row indices of the top features, ordered by decreasing variance.
     */
    template<typename T, typename IDX>
    std::vector<int> run(const tatami::Matrix<T, IDX>* mat) const {
        auto variances = tatami::row_variances(mat, nthreads);
        return run(variances.size(), variances.data());
    }

    /**
     * @param dataset A dataset.
     *
     * @return Names of the top features, ordered by decreasing variance.
     */
    std::vector<std::string> run(const Dataset& dataset) const {
        auto chosen = run(dataset.matrix());
        const auto& names = dataset.features();

        std::vector<std::string> output;
        output.reserve(chosen.size());
        for (auto c : chosen) {
            output.push_back(names[c]);
        }
        return output;
    }
};

}

#endif
