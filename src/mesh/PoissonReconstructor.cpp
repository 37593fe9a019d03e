#include "rockseg/mesh/PoissonReconstructor.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/PointCloud.h>
#include <open3d/geometry/TriangleMesh.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace rockseg {
namespace mesh {

// PoissonSettings implementation
bool PoissonSettings::validate() const {
    if (octreeDepth < 5 || octreeDepth > 14) return false;
    if (width < 0.0) return false;
    if (scale <= 0.0) return false;
    if (densityQuantile < 0.0 || densityQuantile > 1.0) return false;
    return true;
}

std::string PoissonSettings::toString() const {
    std::stringstream ss;
    ss << "Poisson Reconstruction Settings:\n";
    ss << "  Octree depth: " << octreeDepth;
    ss << "\n  Width: " << width;
    ss << "\n  Scale: " << scale;
    ss << "\n  Linear fit: " << (linearFit ? "Yes" : "No");
    ss << "\n  Crop low density: " << (cropLowDensity ? "Yes" : "No");
    if (cropLowDensity) {
        ss << "\n  Density quantile: " << densityQuantile;
    }
    return ss.str();
}

// ReconstructedMesh implementation
size_t ReconstructedMesh::vertexCount() const {
    return mesh ? mesh->vertices_.size() : 0;
}

size_t ReconstructedMesh::triangleCount() const {
    return mesh ? mesh->triangles_.size() : 0;
}

std::string ReconstructedMesh::toString() const {
    std::stringstream ss;
    ss << "Reconstructed Mesh:\n";
    ss << "  Input points: " << inputPoints << "\n";
    ss << "  Vertices: " << vertexCount() << "\n";
    ss << "  Triangles: " << triangleCount() << "\n";
    ss << "  Cropped vertices: " << croppedVertices << "\n";
    ss << "  Reconstruction time: " << std::fixed << std::setprecision(2) << reconstructionTimeMs << " ms";
    return ss.str();
}

// PoissonReconstructor::Impl
class PoissonReconstructor::Impl {
public:
    std::string lastError;
    std::function<void(int)> progressCallback;

    void updateProgress(int progress) {
        if (progressCallback) {
            progressCallback(progress);
        }
    }

    // Drops vertices below the density quantile, keeping densities aligned
    size_t cropLowDensity(open3d::geometry::TriangleMesh& mesh,
                          std::vector<double>& densities,
                          double quantile) {
        if (densities.empty() || densities.size() != mesh.vertices_.size()) {
            return 0;
        }

        std::vector<double> sorted(densities);
        std::sort(sorted.begin(), sorted.end());
        size_t thresholdIdx = static_cast<size_t>(static_cast<double>(sorted.size()) * quantile);
        thresholdIdx = std::min(thresholdIdx, sorted.size() - 1);
        const double threshold = sorted[thresholdIdx];

        std::vector<bool> removeMask(densities.size(), false);
        std::vector<double> kept;
        kept.reserve(densities.size());
        size_t removed = 0;
        for (size_t i = 0; i < densities.size(); ++i) {
            if (densities[i] < threshold) {
                removeMask[i] = true;
                ++removed;
            } else {
                kept.push_back(densities[i]);
            }
        }

        if (removed > 0) {
            mesh.RemoveVerticesByMask(removeMask);
            densities.swap(kept);
        }
        return removed;
    }
};

PoissonReconstructor::PoissonReconstructor() : pImpl(std::make_unique<Impl>()) {}
PoissonReconstructor::~PoissonReconstructor() = default;

ReconstructedMesh PoissonReconstructor::reconstruct(const open3d::geometry::PointCloud& oriented,
                                                    const PoissonSettings& settings) {
    if (!settings.validate()) {
        pImpl->lastError = "Invalid Poisson settings";
        ROCKSEG_THROW(core::InvalidParameterException, pImpl->lastError + ":\n" + settings.toString());
    }

    if (oriented.points_.empty()) {
        pImpl->lastError = "Empty point cloud";
        ROCKSEG_THROW(core::EmptyInputException, pImpl->lastError);
    }

    if (!oriented.HasNormals()) {
        pImpl->lastError = "Point cloud has no normals";
        ROCKSEG_THROW(core::InvalidParameterException, pImpl->lastError);
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    ReconstructedMesh result;
    result.inputPoints = oriented.points_.size();

    std::shared_ptr<open3d::geometry::TriangleMesh> mesh;
    std::vector<double> densities;

    try {
        pImpl->updateProgress(10);

        LOG_INFO("[PoissonReconstructor] Reconstructing surface from " +
                 std::to_string(result.inputPoints) + " points (depth=" +
                 std::to_string(settings.octreeDepth) + ")...");

        std::tie(mesh, densities) = open3d::geometry::TriangleMesh::CreateFromPointCloudPoisson(
            oriented,
            static_cast<size_t>(settings.octreeDepth),
            static_cast<float>(settings.width),
            static_cast<float>(settings.scale),
            settings.linearFit
        );
    } catch (const std::exception& e) {
        pImpl->lastError = "Poisson reconstruction exception: " + std::string(e.what());
        ROCKSEG_THROW(core::ExternalComponentException, pImpl->lastError);
    }

    if (!mesh || mesh->vertices_.empty()) {
        pImpl->lastError = "Poisson reconstruction failed to produce mesh";
        ROCKSEG_THROW(core::ExternalComponentException, pImpl->lastError);
    }

    pImpl->updateProgress(70);

    if (settings.cropLowDensity) {
        LOG_DEBUG("[PoissonReconstructor] Cropping low-density regions...");
        result.croppedVertices = pImpl->cropLowDensity(*mesh, densities, settings.densityQuantile);
        pImpl->updateProgress(85);
    }

    mesh->ComputeVertexNormals();

    result.mesh = mesh;
    result.densities = std::move(densities);

    auto endTime = std::chrono::high_resolution_clock::now();
    result.reconstructionTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    ROCKSEG_LOG_INFO("PoissonReconstructor") << "Reconstruction complete: "
                                             << result.vertexCount() << " vertices, "
                                             << result.triangleCount() << " triangles ("
                                             << result.reconstructionTimeMs << " ms)";

    pImpl->updateProgress(100);
    pImpl->lastError.clear();
    return result;
}

void PoissonReconstructor::setProgressCallback(std::function<void(int)> callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string PoissonReconstructor::getLastError() const {
    return pImpl->lastError;
}

} // namespace mesh
} // namespace rockseg
