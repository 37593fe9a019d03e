#include "rockseg/mesh/ReconstructionPreprocessor.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/KDTreeSearchParam.h>
#include <open3d/geometry/PointCloud.h>

#include <sstream>

namespace rockseg {
namespace mesh {

bool PreprocessSettings::validate() const {
    if (normalRadius <= 0.0) return false;
    if (maxNeighbors < 3) return false;
    if (orientationK < 3) return false;
    if (minNormalMagnitude < 0.0) return false;
    return true;
}

std::string PreprocessSettings::toString() const {
    std::stringstream ss;
    ss << "Reconstruction Preprocess Settings:\n";
    ss << "  Normal radius: " << normalRadius << "\n";
    ss << "  Max neighbors: " << maxNeighbors << "\n";
    ss << "  Orientation k: " << orientationK << "\n";
    ss << "  Min normal magnitude: " << minNormalMagnitude;
    return ss.str();
}

ReconstructionPreprocessor::ReconstructionPreprocessor(const PreprocessSettings& settings)
    : settings_(settings) {}

std::shared_ptr<open3d::geometry::PointCloud> ReconstructionPreprocessor::estimateNormals(
    const open3d::geometry::PointCloud& cloud) const {

    if (!settings_.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException, "Invalid preprocess settings:\n" + settings_.toString());
    }
    if (cloud.points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Cannot estimate normals of an empty cloud");
    }

    // Copy point cloud to ensure we don't modify input
    auto working = std::make_shared<open3d::geometry::PointCloud>(cloud);
    working->normals_.clear();

    try {
        LOG_DEBUG("[ReconstructionPreprocessor] Estimating normals (radius=" +
                  std::to_string(settings_.normalRadius) + ", max_nn=" +
                  std::to_string(settings_.maxNeighbors) + ")...");
        working->EstimateNormals(
            open3d::geometry::KDTreeSearchParamHybrid(settings_.normalRadius, settings_.maxNeighbors));

        LOG_DEBUG("[ReconstructionPreprocessor] Orienting normals (k=" +
                  std::to_string(settings_.orientationK) + ")...");
        working->OrientNormalsConsistentTangentPlane(static_cast<size_t>(settings_.orientationK));
    } catch (const std::exception& e) {
        ROCKSEG_THROW(core::ExternalComponentException,
                      "Normal estimation failed: " + std::string(e.what()));
    }

    return working;
}

PreprocessedCloud ReconstructionPreprocessor::filterAndInvert(
    const open3d::geometry::PointCloud& withNormals,
    double minNormalMagnitude) {

    const auto& points = withNormals.points_;
    const auto& normals = withNormals.normals_;
    if (normals.size() != points.size()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Normal count " + std::to_string(normals.size()) +
                      " does not match point count " + std::to_string(points.size()));
    }

    PreprocessedCloud result;
    result.inputPoints = points.size();
    result.cloud = std::make_shared<open3d::geometry::PointCloud>();
    result.cloud->points_.reserve(points.size());
    result.cloud->normals_.reserve(points.size());

    for (size_t i = 0; i < points.size(); ++i) {
        if (normals[i].norm() < minNormalMagnitude) {
            ++result.droppedPoints;
            continue;
        }
        result.cloud->points_.push_back(points[i]);
        result.cloud->normals_.push_back(-normals[i]);
    }

    if (result.droppedPoints > 0) {
        LOG_DEBUG("[ReconstructionPreprocessor] Dropped " + std::to_string(result.droppedPoints) +
                  " points with degenerate normals");
    }
    return result;
}

ReconstructedMesh ReconstructionPreprocessor::submit(const PreprocessedCloud& prepared,
                                                     SurfaceReconstructor& reconstructor,
                                                     const PoissonSettings& poisson) const {
    if (!prepared.cloud || prepared.cloud->points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException,
                      "No point with a valid normal is left for reconstruction (" +
                      std::to_string(prepared.inputPoints) + " input points)");
    }

    ROCKSEG_LOG_INFO("ReconstructionPreprocessor") << "Submitting " << prepared.cloud->points_.size()
                                                   << " oriented points to " << reconstructor.name();
    return reconstructor.reconstruct(*prepared.cloud, poisson);
}

ReconstructedMesh ReconstructionPreprocessor::run(const open3d::geometry::PointCloud& cloud,
                                                  SurfaceReconstructor& reconstructor,
                                                  const PoissonSettings& poisson) const {
    auto withNormals = estimateNormals(cloud);
    PreprocessedCloud prepared = filterAndInvert(*withNormals, settings_.minNormalMagnitude);
    return submit(prepared, reconstructor, poisson);
}

} // namespace mesh
} // namespace rockseg
