#ifndef ANCHORMAP_UTILS_BLOCKING_HPP
#define ANCHORMAP_UTILS_BLOCKING_HPP

#include "macros.hpp"
#include "errors.hpp"

#include <vector>
#include <string>
#include <algorithm>
#include <unordered_map>

/**
 * @file blocking.hpp
 * @brief Utilities for handling blocks and labels of cells.
 */

namespace anchormap {

/**
 * Count the number of unique 0-based IDs, e.g., for block or label assignments.
 * All IDs are assumed to be integers in `[0, x)` where `x` is the return value of this function.
 *
 * @tparam Id_ Integer type for the IDs.
 *
 * @param length Length of the array in `ids`.
 * @param[in] ids Pointer to an array containing 0-based IDs of some kind.
 *
 * @return Number of IDs, or 0 if `length = 0`.
 */
template<typename Id_>
size_t count_ids(size_t length, const Id_* ids) {
    if (!length) {
        return 0;
    } else {
        return static_cast<size_t>(*std::max_element(ids, ids + length)) + 1;
    }
}

/**
 * Count the frequency of 0-based IDs, e.g., for block or label assignments.
 * All IDs are assumed to be integers in `[0, x)` where `x` is the number of unique IDs.
 *
 * @tparam Output_ Numeric type for the output frequencies.
 * @tparam Id_ Integer type for the IDs.
 *
 * @param length Length of the array in `ids`.
 * @param[in] ids Pointer to an array containing 0-based IDs of some kind.
 * @param allow_zeros Whether to throw an error if frequencies of zero are detected.
 *
 * @return Vector of length equal to the number of IDs, containing the frequency of each ID.
 * A `DataError` is raised if an ID has zero frequency and `allow_zeros = false`.
 */
template<typename Output_ = int, typename Id_>
std::vector<Output_> tabulate_ids(size_t length, const Id_* ids, bool allow_zeros = false) {
    size_t nids = count_ids(length, ids);

    std::vector<Output_> ids_size(nids);
    for (size_t j = 0; j < length; ++j) {
        ++ids_size[ids[j]];
    }

    if (!allow_zeros) {
        for (auto b : ids_size) {
            if (b == 0) {
                throw DataError("IDs must be 0-based and consecutive with no empty blocks");
            }
        }
    }

    return ids_size;
}

/**
 * @brief Integer codes for a vector of string labels.
 */
struct Factor {
    /**
     * Integer code for each entry of the input vector.
     * Codes are 0-based indices into `levels`.
     */
    std::vector<int> codes;

    /**
     * Unique labels, in order of their first appearance in the input vector.
     */
    std::vector<std::string> levels;
};

/**
 * Convert string labels into 0-based integer codes, e.g., for use in `TransferLabels`.
 *
 * @param labels Vector of labels.
 *
 * @return A `Factor` containing the codes and the unique levels.
 */
inline Factor factorize(const std::vector<std::string>& labels) {
    Factor output;
    output.codes.reserve(labels.size());

    std::unordered_map<std::string, int> mapping;
    for (const auto& l : labels) {
        auto it = mapping.find(l);
        if (it == mapping.end()) {
            int code = output.levels.size();
            mapping[l] = code;
            output.levels.push_back(l);
            output.codes.push_back(code);
        } else {
            output.codes.push_back(it->second);
        }
    }

    return output;
}

}

#endif
