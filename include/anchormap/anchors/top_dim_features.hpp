#ifndef ANCHORMAP_TOP_DIM_FEATURES_HPP
#define ANCHORMAP_TOP_DIM_FEATURES_HPP

#include "../utils/macros.hpp"

#include "Eigen/Dense"

#include <vector>
#include <algorithm>
#include <numeric>
#include <cmath>

/**
 * @file top_dim_features.hpp
 *
 * @brief Choose the features that drive each dimension of an embedding.
 */

namespace anchormap {

/**
 * @brief Parameters for `top_dim_features()`.
 */
struct TopDimFeaturesParameters {
    /**
     * Maximum number of features to consider for each dimension.
     */
    int features_per_dim = 100;

    /**
     * Upper bound on the total number of features to return.
     * This is increased to twice the number of dimensions if it is smaller.
     */
    int max_features = 200;
};

/**
 * @cond
 */
namespace top_dim_features_internal {

inline void add_balanced(const std::vector<int>& order, int nfeatures, std::vector<char>& used, std::vector<int>& output) {
    // Splitting evenly between the largest positive and negative loadings,
    // rounding half to even when the number is odd.
    size_t num = std::nearbyint(nfeatures / 2.0);
    num = std::min(num, order.size());

    for (size_t i = 0; i < num; ++i) {
        auto f = order[i];
        if (!used[f]) {
            used[f] = 1;
            output.push_back(f);
        }
    }

    for (size_t i = 0; i < num; ++i) {
        auto f = order[order.size() - i - 1];
        if (!used[f]) {
            used[f] = 1;
            output.push_back(f);
        }
    }
}

}
/**
 * @endcond
 */

/**
 * Choose the features with the largest positive and negative loadings in each of the first `ndims` dimensions of an embedding.
 * For a given number of features per dimension, we take the union of the top features across all dimensions.
 * We then choose the largest number of features per dimension for which the size of the union is still below `TopDimFeaturesParameters::max_features`.
 * This yields a set of features that captures the structure in each dimension while keeping the set small enough for efficient distance calculations.
 *
 * @param loadings Matrix of (projected) loadings where each row is a feature and each column is a dimension.
 * @param ndims Number of leading dimensions to use.
 * @param params Further parameters.
 *
 * @return Row indices of the chosen features.
 * Features are reported in order of dimension, and within each dimension, in order of decreasing positive loading followed by decreasing negative loading.
 */
inline std::vector<int> top_dim_features(const Eigen::MatrixXd& loadings, int ndims, const TopDimFeaturesParameters& params = TopDimFeaturesParameters()) {
    int nfeatures = loadings.rows();
    ndims = std::min(ndims, static_cast<int>(loadings.cols()));

    // Always allow at least one feature from each end of each dimension.
    size_t max_features = std::max(params.max_features, 2 * ndims);

    std::vector<std::vector<int> > orders(ndims);
    for (int d = 0; d < ndims; ++d) {
        auto& current = orders[d];
        current.resize(nfeatures);
        std::iota(current.begin(), current.end(), 0);
        std::stable_sort(current.begin(), current.end(), [&](int l, int r) -> bool { return loadings(l, d) > loadings(r, d); });
    }

    std::vector<char> used(nfeatures);
    std::vector<int> collected;

    int best_per_dim = 1;
    size_t best_total = 0;
    for (int y = 1; y <= params.features_per_dim; ++y) {
        std::fill(used.begin(), used.end(), 0);
        collected.clear();
        for (int d = 0; d < ndims; ++d) {
            top_dim_features_internal::add_balanced(orders[d], y, used, collected);
        }

        auto total = collected.size();
        if (total >= max_features) {
            break; // totals are non-decreasing with 'y'.
        }
        if (total > best_total) {
            best_total = total;
            best_per_dim = y;
        }
    }

    std::fill(used.begin(), used.end(), 0);
    collected.clear();
    for (int d = 0; d < ndims; ++d) {
        top_dim_features_internal::add_balanced(orders[d], best_per_dim, used, collected);
    }

    return collected;
}

}

#endif
