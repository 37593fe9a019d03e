#pragma once

#include <Eigen/Core>

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
namespace io {

/**
 * @brief Point cloud read from a LAS file
 */
struct LoadedCloud {
    std::shared_ptr<open3d::geometry::PointCloud> cloud;   // Recentered positions, colors in [0,1]
    Eigen::Vector3d recentering = Eigen::Vector3d::Zero();  // Per-axis mean subtracted on import
    std::vector<uint16_t> intensity;    // One value per point, zero when absent
    bool hasColor = false;
};

/**
 * @brief Flat per-point records written to a LAS file
 *
 * Positions are written as given; callers add back any recentering.
 */
struct PointRecordSet {
    std::vector<Eigen::Vector3d> points;
    std::vector<Eigen::Vector3d> colors;    // [0,1], empty or one per point
    std::vector<uint16_t> intensity;        // Empty or one per point

    size_t size() const { return points.size(); }
    bool validate() const;
};

/**
 * @brief LAS 1.2 persistence through PDAL
 *
 * Files are written with point format 3 (position, intensity, 16-bit RGB).
 * Colors are scaled between [0,1] and [0,65535].
 */
class LasIO {
public:
    /**
     * @brief Read @p filename and optionally subtract the per-axis mean
     * @throws core::FileException (ERROR_FILE_NOT_FOUND, ERROR_FILE_IO)
     * @throws core::EmptyInputException if the file holds no point
     */
    static LoadedCloud read(const std::string& filename, bool recenter = true);

    /**
     * @throws core::InvalidParameterException if channel lengths differ
     * @throws core::FileException (ERROR_FILE_IO) if PDAL fails
     */
    static void write(const std::string& filename, const PointRecordSet& records);

    static constexpr double kColorScale = 65535.0;
};

} // namespace io
} // namespace rockseg
