#ifndef ANCHORMAP_ANCHOR_SET_HPP
#define ANCHORMAP_ANCHOR_SET_HPP

#include "../utils/macros.hpp"
#include "../utils/errors.hpp"
#include "../data/Dataset.hpp"
#include "../neighbors/NeighborList.hpp"
#include "Anchor.hpp"

#include "Eigen/Dense"

#include <vector>
#include <string>
#include <memory>

/**
 * @file AnchorSet.hpp
 *
 * @brief Anchors between a reference and query dataset.
 */

namespace anchormap {

/**
 * @brief Neighbor lists used to identify and score anchors.
 *
 * All indices refer to cells within the respective dataset, i.e., query indices start from zero.
 */
struct MatchingNeighbors {
    /**
     * Nearest reference cells for each reference cell, excluding itself.
     */
    NeighborList ref_to_ref;

    /**
     * Nearest query cells for each reference cell.
     */
    NeighborList ref_to_query;

    /**
     * Nearest reference cells for each query cell.
     */
    NeighborList query_to_ref;

    /**
     * Nearest query cells for each query cell, excluding itself.
     */
    NeighborList query_to_query;
};

/**
 * @brief Anchors between a reference and query dataset.
 *
 * This is the output of `FindTransferAnchors` and the input to `TransferData`.
 * It contains a combined dataset with all reference cells followed by all query cells, restricted to the anchor features.
 * Reference cells are suffixed with `"_reference"` and query cells with `"_query"` in the combined dataset.
 * The combined dataset also contains the shared-space embedding used for anchor finding,
 * along with its L2-normalized variant (named with the `".l2"` suffix) if L2 normalization was performed.
 *
 * Instances are never modified after construction, so they can be safely shared between multiple concurrent `TransferData` calls.
 */
class AnchorSet {
public:
    /**
     * @cond
     */
    AnchorSet(
        Dataset combined,
        std::string reduction,
        std::string matching_reduction,
        int ndims,
        std::vector<Anchor> anchors,
        std::vector<std::string> anchor_features,
        std::vector<std::string> reference_cells,
        std::vector<std::string> query_cells,
        std::shared_ptr<const MatchingNeighbors> neighbors
    ) :
        comb(std::move(combined)),
        red(std::move(reduction)),
        matching(std::move(matching_reduction)),
        dims(ndims),
        anchor_table(std::move(anchors)),
        features(std::move(anchor_features)),
        ref_cells(std::move(reference_cells)),
        query_cells_(std::move(query_cells)),
        nn(std::move(neighbors))
    {
        if (ref_cells.size() + query_cells_.size() != comb.num_cells()) {
            throw DataError("number of reference and query cells should sum to the number of cells in the combined dataset");
        }
    }
    /**
     * @endcond
     */

private:
    Dataset comb;
    std::string red, matching;
    int dims;
    std::vector<Anchor> anchor_table;
    std::vector<std::string> features;
    std::vector<std::string> ref_cells, query_cells_;
    std::shared_ptr<const MatchingNeighbors> nn;

public:
    /**
     * @return Combined dataset containing the reference and query cells, restricted to the anchor features.
     */
    const Dataset& combined() const {
        return comb;
    }

    /**
     * @return Name of the shared-space reduction in `combined()`, e.g., `"pcaproject"` or `"cca"`.
     */
    const std::string& reduction() const {
        return red;
    }

    /**
     * @return Name of the reduction in `combined()` that was used for neighbor searches.
     * This is the `".l2"` variant of `reduction()` if L2 normalization was performed.
     */
    const std::string& matching_reduction() const {
        return matching;
    }

    /**
     * @return Number of leading dimensions of the reduction that were used for neighbor searches.
     */
    int num_dims() const {
        return dims;
    }

    /**
     * @return Anchors between the reference and query cells.
     * This may be empty if no anchors survived filtering.
     */
    const std::vector<Anchor>& anchors() const {
        return anchor_table;
    }

    /**
     * @return Names of the anchor features.
     */
    const std::vector<std::string>& anchor_features() const {
        return features;
    }

    /**
     * @return Original names of the reference cells.
     */
    const std::vector<std::string>& reference_cells() const {
        return ref_cells;
    }

    /**
     * @return Original names of the query cells.
     */
    const std::vector<std::string>& query_cells() const {
        return query_cells_;
    }

    /**
     * @return Number of reference cells.
     */
    size_t num_reference() const {
        return ref_cells.size();
    }

    /**
     * @return Number of query cells.
     */
    size_t num_query() const {
        return query_cells_.size();
    }

    /**
     * @return Pointer to the neighbor lists used to find and score anchors.
     * This is `NULL` if neighbors were not requested in `FindTransferAnchors::set_return_neighbors()`.
     */
    const MatchingNeighbors* neighbors() const {
        return nn.get();
    }

    /**
     * @param l2 Whether to use the L2-normalized embeddings.
     * If no L2 normalization was performed, this has no effect.
     *
     * @return Embeddings of the query cells in the first `num_dims()` dimensions of the shared space.
     * Each row is a dimension and each column is a query cell.
     */
    Eigen::MatrixXd query_embeddings(bool l2 = false) const {
        const auto& emb = comb.reduction(l2 ? matching : red).embeddings;
        return emb.block(0, ref_cells.size(), dims, query_cells_.size());
    }

    /**
     * @param l2 Whether to use the L2-normalized embeddings.
     * If no L2 normalization was performed, this has no effect.
     *
     * @return Embeddings of the reference cells in the first `num_dims()` dimensions of the shared space.
     * Each row is a dimension and each column is a reference cell.
     */
    Eigen::MatrixXd reference_embeddings(bool l2 = false) const {
        const auto& emb = comb.reduction(l2 ? matching : red).embeddings;
        return emb.block(0, 0, dims, ref_cells.size());
    }
};

}

#endif
