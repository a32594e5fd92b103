#ifndef ANCHORMAP_REDUCTION_HPP
#define ANCHORMAP_REDUCTION_HPP

#include "../utils/macros.hpp"

#include "Eigen/Dense"

#include <string>
#include <vector>

/**
 * @file Reduction.hpp
 *
 * @brief Low-dimensional embedding of a dataset.
 */

namespace anchormap {

/**
 * @brief Low-dimensional embedding of the cells in a dataset.
 *
 * Embeddings are stored in column-major layout with dimensions in the rows and cells in the columns,
 * consistent with the output of `ProjectPca` and the expectations of the neighbor search classes.
 * All other members are optional and may be empty.
 */
struct Reduction {
    /**
     * Prefix for the dimension names, e.g., `"PC_"` to generate `"PC_1"`, `"PC_2"`, etc.
     */
    std::string key = "PC_";

    /**
     * Embedding matrix, where each row is a dimension and each column is a cell.
     */
    Eigen::MatrixXd embeddings;

    /**
     * Loadings, where each row is a feature and each column is a dimension.
     * Rows correspond to entries of `features`.
     */
    Eigen::MatrixXd loadings;

    /**
     * Projected loadings, where each row is a feature and each column is a dimension.
     * These are obtained by multiplying the scaled expression values with the embeddings,
     * and may be computed for more features than those used to define the embedding.
     * Rows correspond to entries of `projected_features`.
     */
    Eigen::MatrixXd projected_loadings;

    /**
     * Names of the features in the rows of `loadings`.
     */
    std::vector<std::string> features;

    /**
     * Names of the features in the rows of `projected_loadings`.
     */
    std::vector<std::string> projected_features;

    /**
     * Standard deviation of each dimension.
     */
    Eigen::VectorXd stdev;

    /**
     * Mean used to center each feature in `features` before computing the embeddings.
     */
    Eigen::VectorXd center;

    /**
     * Scaling factor used to divide each centered feature in `features`.
     */
    Eigen::VectorXd scale;

    /**
     * @return Number of dimensions.
     */
    size_t num_dims() const {
        return embeddings.rows();
    }

    /**
     * @return Number of cells.
     */
    size_t num_cells() const {
        return embeddings.cols();
    }

    /**
     * @return Names of the dimensions, formed by appending the 1-based index of each dimension to `key`.
     */
    std::vector<std::string> dim_names() const {
        std::vector<std::string> output;
        output.reserve(num_dims());
        for (size_t d = 0; d < num_dims(); ++d) {
            output.push_back(key + std::to_string(d + 1));
        }
        return output;
    }
};

}

#endif
