#pragma once

#include "rockseg/core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace pointcloud {

/**
 * @brief Default seeds derived from geometry alone
 */
struct DefaultSeeds {
    size_t rockSeed = 0;        // Highest and most central point (apex)
    size_t pedestalSeed = 0;    // Lowest point

    std::string toString() const;
};

/**
 * @brief Seed heuristics for rock / pedestal segmentation
 *
 * The rock seed maximizes z - |xy - c| where c is the xy center of the
 * axis-aligned bounding box; the pedestal seed minimizes z. Ties resolve to
 * the first index.
 */
class SeedHeuristic {
public:
    /**
     * @throws core::EmptyInputException for an empty cloud
     */
    static DefaultSeeds compute(const open3d::geometry::PointCloud& cloud);

    /**
     * @brief Check a seed set against a cloud of @p cloudSize points
     * @throws core::InvalidSeedException if either list is empty or an index is out of range
     */
    static void validate(const core::SeedSet& seeds, size_t cloudSize);

    /**
     * @brief Parse a comma separated index list such as "12,40, 7"
     * @throws core::InvalidSeedException for an empty list or a token that is not an index
     */
    static std::vector<size_t> parseIndexList(const std::string& text);

    /**
     * @brief Move seeds picked on @p source onto their nearest points of @p target
     *
     * Used when seeds were picked on the full cloud and the pipeline runs on a
     * downsampled copy. Duplicates collapse, first occurrence order is kept.
     * @throws core::InvalidSeedException if an index is out of range for @p source
     * @throws core::EmptyInputException if @p target is empty
     */
    static std::vector<size_t> transfer(const open3d::geometry::PointCloud& source,
                                        const std::vector<size_t>& indices,
                                        const open3d::geometry::PointCloud& target);
};

} // namespace pointcloud
} // namespace rockseg
