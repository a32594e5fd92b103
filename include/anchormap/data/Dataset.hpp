#ifndef ANCHORMAP_DATASET_HPP
#define ANCHORMAP_DATASET_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../neighbors/NeighborList.hpp"
#include "Reduction.hpp"

#include "tatami/tatami.hpp"

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <unordered_set>

/**
 * @file Dataset.hpp
 *
 * @brief Immutable single-cell dataset.
 */

namespace anchormap {

/**
 * Normalization strategy used to generate the expression values of a dataset.
 *
 * - `LOG_NORMALIZE`: log-transformed normalized counts.
 *   Features are centered and scaled to unit variance before projection.
 * - `SCT`: residuals from a regularized negative binomial model.
 *   These are already on a common scale, so features are only centered before projection.
 */
enum class NormalizationMethod : char { LOG_NORMALIZE, SCT };

/**
 * @brief Immutable feature-by-cell dataset.
 *
 * This wraps a `tatami::Matrix` of normalized expression values along with the names of the features and cells.
 * The matrix may be dense, sparse or backed by some external storage, as long as it implements the **tatami** interface.
 * Each dataset may also carry a list of variable features, named `Reduction`s and named `NeighborList`s.
 *
 * A dataset is never modified after construction.
 * Methods like `with_reduction()` return a new dataset that shares the matrix and all other members with the original.
 */
class Dataset {
public:
    /**
     * @brief Options for constructing a `Dataset`.
     */
    struct Options {
        /**
         * Name of the assay, used to check that the expected data were supplied to `FindTransferAnchors`.
         */
        std::string assay = "RNA";

        /**
         * Normalization method used to generate the matrix.
         */
        NormalizationMethod normalization = NormalizationMethod::LOG_NORMALIZE;
    };

public:
    /**
     * @param matrix Pointer to a matrix of normalized expression values, where rows are features and columns are cells.
     * @param features Unique names of the features, of length equal to the number of rows in `matrix`.
     * @param cells Unique names of the cells, of length equal to the number of columns in `matrix`.
     * @param options Further options.
     */
    Dataset(std::shared_ptr<const tatami::NumericMatrix> matrix, std::vector<std::string> features, std::vector<std::string> cells, Options options = Options()) :
        mat(std::move(matrix)),
        feature_names(std::make_shared<const std::vector<std::string> >(std::move(features))),
        cell_names(std::make_shared<const std::vector<std::string> >(std::move(cells))),
        opts(std::move(options))
    {
        if (!mat) {
            throw DataError("matrix should not be null");
        }
        if (static_cast<size_t>(mat->nrow()) != feature_names->size()) {
            throw DataError("number of feature names (" + std::to_string(feature_names->size()) + ") should be equal to the number of matrix rows (" + std::to_string(mat->nrow()) + ")");
        }
        if (static_cast<size_t>(mat->ncol()) != cell_names->size()) {
            throw DataError("number of cell names (" + std::to_string(cell_names->size()) + ") should be equal to the number of matrix columns (" + std::to_string(mat->ncol()) + ")");
        }

        auto mapping = std::make_shared<std::unordered_map<std::string, int> >();
        for (size_t f = 0; f < feature_names->size(); ++f) {
            if (!mapping->emplace((*feature_names)[f], f).second) {
                throw DataError("duplicated feature name '" + (*feature_names)[f] + "'");
            }
        }
        feature_map = std::move(mapping);

        std::unordered_set<std::string> used;
        for (const auto& c : *cell_names) {
            if (!used.insert(c).second) {
                throw DataError("duplicated cell name '" + c + "'");
            }
        }
    }

private:
    std::shared_ptr<const tatami::NumericMatrix> mat;
    std::shared_ptr<const std::vector<std::string> > feature_names, cell_names;
    std::shared_ptr<const std::unordered_map<std::string, int> > feature_map;
    Options opts;

    std::vector<std::string> var_features;
    std::vector<std::pair<std::string, std::shared_ptr<const Reduction> > > reductions;
    std::vector<std::pair<std::string, std::shared_ptr<const NeighborList> > > neighbor_lists;

public:
    /**
     * @return Pointer to the matrix of expression values.
     */
    const tatami::NumericMatrix* matrix() const {
        return mat.get();
    }

    /**
     * @return Shared pointer to the matrix of expression values.
     */
    const std::shared_ptr<const tatami::NumericMatrix>& matrix_ptr() const {
        return mat;
    }

    /**
     * @return Number of features.
     */
    size_t num_features() const {
        return feature_names->size();
    }

    /**
     * @return Number of cells.
     */
    size_t num_cells() const {
        return cell_names->size();
    }

    /**
     * @return Names of the features.
     */
    const std::vector<std::string>& features() const {
        return *feature_names;
    }

    /**
     * @return Names of the cells.
     */
    const std::vector<std::string>& cells() const {
        return *cell_names;
    }

    /**
     * @return Name of the assay.
     */
    const std::string& assay() const {
        return opts.assay;
    }

    /**
     * @return Normalization method.
     */
    NormalizationMethod normalization() const {
        return opts.normalization;
    }

    /**
     * @return Options used to construct this dataset.
     */
    const Options& options() const {
        return opts;
    }

    /**
     * @param name Name of a feature.
     * @return Row index of the feature, or -1 if it is not present.
     */
    int find_feature(const std::string& name) const {
        auto it = feature_map->find(name);
        return (it == feature_map->end() ? -1 : it->second);
    }

    /**
     * @return Names of the variable features, ordered by decreasing variability.
     * This may be empty if no variable features were supplied.
     */
    const std::vector<std::string>& variable_features() const {
        return var_features;
    }

public:
    /**
     * @param name Name of the reduction.
     * @return Whether the reduction is present.
     */
    bool has_reduction(const std::string& name) const {
        for (const auto& r : reductions) {
            if (r.first == name) {
                return true;
            }
        }
        return false;
    }

    /**
     * @param name Name of the reduction.
     * @param parameter Name of the parameter that supplied `name`, used in the error message.
     * @return The requested reduction.
     * A `ValidationError` is thrown if no reduction exists with this name.
     */
    const Reduction& reduction(const std::string& name, const std::string& parameter = "reduction") const {
        for (const auto& r : reductions) {
            if (r.first == name) {
                return *(r.second);
            }
        }
        throw ValidationError(parameter, "no reduction named '" + name + "'");
    }

    /**
     * @return Names of all reductions, in the order in which they were added.
     */
    std::vector<std::string> reduction_names() const {
        std::vector<std::string> output;
        output.reserve(reductions.size());
        for (const auto& r : reductions) {
            output.push_back(r.first);
        }
        return output;
    }

    /**
     * @param name Name of the neighbor list.
     * @return Whether the neighbor list is present.
     */
    bool has_neighbors(const std::string& name) const {
        for (const auto& n : neighbor_lists) {
            if (n.first == name) {
                return true;
            }
        }
        return false;
    }

    /**
     * @param name Name of the neighbor list.
     * @param parameter Name of the parameter that supplied `name`, used in the error message.
     * @return The requested neighbor list.
     * A `ValidationError` is thrown if no neighbor list exists with this name.
     */
    const NeighborList& neighbors(const std::string& name, const std::string& parameter = "neighbors") const {
        for (const auto& n : neighbor_lists) {
            if (n.first == name) {
                return *(n.second);
            }
        }
        throw ValidationError(parameter, "no neighbors named '" + name + "'");
    }

public:
    /**
     * @param name Name of the reduction.
     * If a reduction already exists with this name, it is replaced.
     * @param reduction The reduction to add.
     * This should have one column per cell in `embeddings`.
     *
     * @return A new dataset containing the reduction.
     */
    Dataset with_reduction(const std::string& name, Reduction reduction) const {
        if (reduction.num_cells() != num_cells()) {
            throw DataError("number of cells in reduction '" + name + "' (" + std::to_string(reduction.num_cells()) + ") should be equal to the number of cells in the dataset (" + std::to_string(num_cells()) + ")");
        }

        Dataset output = *this;
        auto ptr = std::make_shared<const Reduction>(std::move(reduction));
        for (auto& r : output.reductions) {
            if (r.first == name) {
                r.second = std::move(ptr);
                return output;
            }
        }

        output.reductions.emplace_back(name, std::move(ptr));
        return output;
    }

    /**
     * @param features Names of the variable features, ordered by decreasing variability.
     * All names should be present in `features()`.
     *
     * @return A new dataset with the specified variable features.
     */
    Dataset with_variable_features(std::vector<std::string> features) const {
        for (const auto& f : features) {
            if (find_feature(f) < 0) {
                throw DataError("variable feature '" + f + "' is not present in the dataset");
            }
        }

        Dataset output = *this;
        output.var_features = std::move(features);
        return output;
    }

    /**
     * @param name Name of the neighbor list.
     * If a list already exists with this name, it is replaced.
     * @param neighbors Nearest neighbors for each cell in this dataset, excluding the cell itself.
     *
     * @return A new dataset containing the neighbor list.
     */
    Dataset with_neighbors(const std::string& name, NeighborList neighbors) const {
        if (neighbors.size() != num_cells()) {
            throw DataError("number of cells in neighbor list '" + name + "' (" + std::to_string(neighbors.size()) + ") should be equal to the number of cells in the dataset (" + std::to_string(num_cells()) + ")");
        }

        Dataset output = *this;
        auto ptr = std::make_shared<const NeighborList>(std::move(neighbors));
        for (auto& n : output.neighbor_lists) {
            if (n.first == name) {
                n.second = std::move(ptr);
                return output;
            }
        }

        output.neighbor_lists.emplace_back(name, std::move(ptr));
        return output;
    }

    /**
     * Create a new dataset containing a subset of the cells.
     * The expression values for the selected cells are realized into an in-memory compressed sparse column matrix,
     * so that the new dataset no longer depends on the storage of the original matrix.
     * Reductions are subsetted to the same cells, while neighbor lists are discarded as their indices are no longer valid.
     *
     * @param indices Sorted and unique column indices of the cells to retain.
     * @param nthreads Number of threads to use for realizing the matrix.
     *
     * @return A new dataset containing only the specified cells.
     */
    Dataset subset_cells(const std::vector<int>& indices, int nthreads = 1) const {
        int NC = num_cells();
        for (size_t i = 0; i < indices.size(); ++i) {
            if (indices[i] < 0 || indices[i] >= NC) {
                throw DataError("cell index " + std::to_string(indices[i]) + " is out of range");
            }
            if (i && indices[i] <= indices[i - 1]) {
                throw DataError("cell indices should be sorted and unique");
            }
        }

        auto subsetted = tatami::make_DelayedSubset<1>(mat, indices);
        std::shared_ptr<const tatami::NumericMatrix> realized = tatami::convert_to_sparse<double, int>(subsetted.get(), false, nthreads);

        std::vector<std::string> subcells;
        subcells.reserve(indices.size());
        for (auto i : indices) {
            subcells.push_back((*cell_names)[i]);
        }

        Dataset output(std::move(realized), *feature_names, std::move(subcells), opts);
        output.var_features = var_features;

        for (const auto& r : reductions) {
            Reduction copy = *(r.second);
            Eigen::MatrixXd subemb(copy.embeddings.rows(), indices.size());
            for (size_t i = 0; i < indices.size(); ++i) {
                subemb.col(i) = copy.embeddings.col(indices[i]);
            }
            copy.embeddings = std::move(subemb);
            output.reductions.emplace_back(r.first, std::make_shared<const Reduction>(std::move(copy)));
        }

        return output;
    }
};

}

#endif
