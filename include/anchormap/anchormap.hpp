#ifndef ANCHORMAP_ANCHORMAP_HPP
#define ANCHORMAP_ANCHORMAP_HPP

#include "utils/macros.hpp"
#include "utils/errors.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/blocking.hpp"

#include "data/Dataset.hpp"
#include "data/Reduction.hpp"

#include "feature_selection/ChooseVariableFeatures.hpp"

#include "dimensionality_reduction/ProjectPca.hpp"
#include "dimensionality_reduction/RunCca.hpp"
#include "dimensionality_reduction/l2_normalize.hpp"

#include "neighbors/FindNeighbors.hpp"

#include "anchors/FindAnchorPairs.hpp"
#include "anchors/ScoreAnchors.hpp"
#include "anchors/FilterAnchors.hpp"
#include "anchors/top_dim_features.hpp"
#include "anchors/FindTransferAnchors.hpp"

#include "transfer/FindWeights.hpp"
#include "transfer/TransferLabels.hpp"
#include "transfer/TransferEmbedding.hpp"
#include "transfer/TransferData.hpp"

#include "sketch/LeverageScore.hpp"
#include "sketch/SketchCells.hpp"
#include "sketch/ProjectSketchLabels.hpp"

/**
 * @file anchormap.hpp
 * @brief Umbrella header for all **libanchormap** functionality.
 */

/**
 * @namespace anchormap
 * @brief Anchor-based mapping of single-cell query datasets onto references.
 */
namespace anchormap {}

#endif
