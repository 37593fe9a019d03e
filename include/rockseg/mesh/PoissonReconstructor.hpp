#pragma once

#include "rockseg/mesh/SurfaceReconstructor.hpp"

#include <functional>
#include <memory>
#include <string>

namespace rockseg {
namespace mesh {

/**
 * @brief Screened Poisson reconstruction backed by Open3D
 *
 * Wraps open3d::geometry::TriangleMesh::CreateFromPointCloudPoisson. The
 * input normals are used as given; estimation and orientation happen in
 * ReconstructionPreprocessor. Optionally crops vertices whose density falls
 * below the configured quantile.
 */
class PoissonReconstructor : public SurfaceReconstructor {
public:
    PoissonReconstructor();
    ~PoissonReconstructor() override;

    /**
     * @throws core::EmptyInputException if @p oriented has no points
     * @throws core::InvalidParameterException on invalid settings or missing normals
     * @throws core::ExternalComponentException if Open3D fails or returns an empty mesh
     */
    ReconstructedMesh reconstruct(const open3d::geometry::PointCloud& oriented,
                                  const PoissonSettings& settings) override;

    std::string name() const override { return "PoissonReconstructor"; }

    /**
     * @brief Set progress callback for long operations
     * @param callback Function called with progress (0-100)
     */
    void setProgressCallback(std::function<void(int)> callback);

    /**
     * @brief Get last error message
     */
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;

    PoissonReconstructor(const PoissonReconstructor&) = delete;
    PoissonReconstructor& operator=(const PoissonReconstructor&) = delete;
};

} // namespace mesh
} // namespace rockseg
