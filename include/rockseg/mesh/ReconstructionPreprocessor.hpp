#pragma once

#include "rockseg/mesh/SurfaceReconstructor.hpp"

#include <memory>
#include <string>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace mesh {

/**
 * @brief Normal estimation and filtering settings
 */
struct PreprocessSettings {
    double normalRadius = 0.1;          // Hybrid search radius for normal estimation
    int maxNeighbors = 30;              // Hybrid search neighbor cap
    int orientationK = 30;              // Neighbors for tangent-plane orientation
    double minNormalMagnitude = 1e-6;   // Normals shorter than this are dropped

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Oriented cloud ready for surface reconstruction
 */
struct PreprocessedCloud {
    std::shared_ptr<open3d::geometry::PointCloud> cloud;  // points_ and normals_ have equal length
    size_t inputPoints = 0;
    size_t droppedPoints = 0;           // Removed for a degenerate normal
};

/**
 * @brief Prepares a boundary-filled cloud for Poisson reconstruction
 *
 * 1. estimate normals (hybrid radius / neighbor search)
 * 2. orient them consistently by tangent-plane propagation
 * 3. drop points whose normal is shorter than minNormalMagnitude
 * 4. invert every surviving normal
 * 5. hand the result to a SurfaceReconstructor
 */
class ReconstructionPreprocessor {
public:
    explicit ReconstructionPreprocessor(const PreprocessSettings& settings = {});

    /**
     * @brief Steps 1-2 on a copy of @p cloud
     * @throws core::EmptyInputException for an empty cloud
     * @throws core::ExternalComponentException if Open3D fails
     */
    std::shared_ptr<open3d::geometry::PointCloud> estimateNormals(
        const open3d::geometry::PointCloud& cloud) const;

    /**
     * @brief Steps 3-4 on a cloud that already carries normals
     *
     * Points and normals are kept or dropped together.
     * @throws core::InvalidParameterException if the normal count differs from the point count
     */
    static PreprocessedCloud filterAndInvert(const open3d::geometry::PointCloud& withNormals,
                                             double minNormalMagnitude);

    /**
     * @brief Step 5
     * @throws core::EmptyInputException if no point survived, without calling @p reconstructor
     */
    ReconstructedMesh submit(const PreprocessedCloud& prepared,
                             SurfaceReconstructor& reconstructor,
                             const PoissonSettings& poisson) const;

    /**
     * @brief Steps 1-5
     */
    ReconstructedMesh run(const open3d::geometry::PointCloud& cloud,
                          SurfaceReconstructor& reconstructor,
                          const PoissonSettings& poisson) const;

    const PreprocessSettings& settings() const { return settings_; }

private:
    PreprocessSettings settings_;
};

} // namespace mesh
} // namespace rockseg
