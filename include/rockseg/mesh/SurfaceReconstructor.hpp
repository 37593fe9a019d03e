#pragma once

#include <memory>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
class TriangleMesh;
}
}

namespace rockseg {
namespace mesh {

/**
 * @brief Poisson surface reconstruction configuration
 */
struct PoissonSettings {
    int octreeDepth = 8;                    // Octree depth (5-14, higher = more detail)
    double width = 0.0;                     // Finest cell width, 0 = derived from depth
    double scale = 1.1;                     // Ratio between reconstruction cube and bounding cube
    bool linearFit = false;                 // Use linear interpolation
    bool cropLowDensity = false;            // Remove low-density vertices
    double densityQuantile = 0.01;          // Density quantile for cropping

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Reconstructed mesh and its per-vertex densities
 *
 * Immutable once produced. densities[i] belongs to mesh->vertices_[i].
 */
struct ReconstructedMesh {
    std::shared_ptr<const open3d::geometry::TriangleMesh> mesh;
    std::vector<double> densities;
    size_t inputPoints = 0;
    size_t croppedVertices = 0;
    double reconstructionTimeMs = 0.0;

    size_t vertexCount() const;
    size_t triangleCount() const;
    std::string toString() const;
};

/**
 * @brief Oriented point cloud to triangle mesh
 *
 * Implementations receive points with unit-length, consistently oriented
 * normals and must either return a mesh or throw.
 */
class SurfaceReconstructor {
public:
    virtual ~SurfaceReconstructor() = default;

    /**
     * @brief Reconstruct a surface from @p oriented
     * @param oriented Points with normals, never empty
     * @param settings Reconstruction settings
     * @throws core::ExternalComponentException if reconstruction fails
     */
    virtual ReconstructedMesh reconstruct(const open3d::geometry::PointCloud& oriented,
                                          const PoissonSettings& settings) = 0;

    virtual std::string name() const = 0;
};

} // namespace mesh
} // namespace rockseg
