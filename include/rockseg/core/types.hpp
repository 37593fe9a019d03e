/**
 * @file types.hpp
 * @brief Common type definitions for the rockseg pipeline
 *
 * Result codes, point labels and the generation-tagged stage values that
 * index into a point cloud.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace core {

/**
 * @brief Result codes carried by every rockseg exception
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_EMPTY_INPUT,              ///< Index or reconstruction given zero points
    ERROR_INVALID_SEED,             ///< Seed index out of bounds or seed set empty
    ERROR_DEGENERATE_GEOMETRY,      ///< Zero-length direction, all-zero normals
    ERROR_STAGE_ORDER,              ///< Stage invoked before its prerequisite
    ERROR_EXTERNAL_COMPONENT,       ///< Segmenter or reconstructor reported an error
    ERROR_CANCELLED,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO
};

/**
 * @brief Per-point semantic label
 */
enum class Label : int8_t {
    UNLABELED = -1,
    PEDESTAL = 0,
    ROCK = 1
};

/**
 * @brief Generation number of a point set
 *
 * Every time the working cloud is replaced (load, downsample, augmentation)
 * it receives a new generation. Values that index into a cloud remember the
 * generation they were computed against.
 */
using Generation = uint64_t;

/**
 * @brief Working cloud paired with its generation
 */
struct CloudHandle {
    std::shared_ptr<const open3d::geometry::PointCloud> cloud;
    Generation generation = 0;

    bool valid() const { return static_cast<bool>(cloud); }
    size_t size() const;
};

/**
 * @brief Rock and pedestal seed indices
 */
struct SeedSet {
    std::vector<size_t> rock;
    std::vector<size_t> pedestal;
    Generation generation = 0;
};

/**
 * @brief Per-point labels for one cloud generation
 */
struct LabelArray {
    std::vector<Label> labels;
    Generation generation = 0;

    size_t size() const { return labels.size(); }
    size_t count(Label label) const;
};

/**
 * @brief Per-point basal flag for one cloud generation
 */
struct BasalMask {
    std::vector<bool> mask;
    Generation generation = 0;

    size_t size() const { return mask.size(); }
    size_t count() const;
    std::vector<size_t> indices() const;
};

std::string labelToString(Label label);

} // namespace core
} // namespace rockseg
