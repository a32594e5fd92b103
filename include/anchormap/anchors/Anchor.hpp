#ifndef ANCHORMAP_ANCHOR_HPP
#define ANCHORMAP_ANCHOR_HPP

/**
 * @file Anchor.hpp
 *
 * @brief Pair of corresponding cells across datasets.
 */

namespace anchormap {

/**
 * @brief Pair of corresponding cells in the reference and query datasets.
 */
struct Anchor {
    /**
     * @cond
     */
    Anchor() = default;

    Anchor(int r, int q, double s) : reference(r), query(q), score(s) {}
    /**
     * @endcond
     */

    /**
     * Index of the reference cell, in `[0, N)` where `N` is the number of reference cells.
     */
    int reference = 0;

    /**
     * Index of the query cell, in `[0, M)` where `M` is the number of query cells.
     */
    int query = 0;

    /**
     * Score of the anchor, in `[0, 1]`.
     * Larger values indicate that the anchor is supported by the neighborhoods of its cells.
     */
    double score = 0;
};

/**
 * @cond
 */
inline bool operator==(const Anchor& left, const Anchor& right) {
    return left.reference == right.reference && left.query == right.query && left.score == right.score;
}
/**
 * @endcond
 */

}

#endif
