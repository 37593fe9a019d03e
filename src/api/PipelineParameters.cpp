#include "rockseg/api/PipelineParameters.hpp"
#include "rockseg/core/Configuration.hpp"

#include <sstream>

namespace rockseg {
namespace api {

PipelineParameters PipelineParameters::fromConfiguration(const core::Configuration& config) {
    PipelineParameters p;

    // Preprocessing
    p.downsample = config.getBool("preprocessing.downsample", p.downsample);
    p.voxelSize = config.getDouble("preprocessing.voxel_size", p.voxelSize);
    p.preprocess.normalRadius = config.getDouble("preprocessing.normal_radius", p.preprocess.normalRadius);
    p.preprocess.maxNeighbors = config.getInt("preprocessing.max_neighbors", p.preprocess.maxNeighbors);
    p.preprocess.orientationK = config.getInt("preprocessing.orientation_k", p.preprocess.orientationK);
    p.preprocess.minNormalMagnitude =
        config.getDouble("preprocessing.min_normal_magnitude", p.preprocess.minNormalMagnitude);

    // Segmentation
    p.thresholds.smoothness = config.getDouble("segmentation.smoothness", p.thresholds.smoothness);
    p.thresholds.curvature = config.getDouble("segmentation.curvature", p.thresholds.curvature);
    p.thresholds.distance = config.getDouble("segmentation.distance", p.thresholds.distance);
    p.thresholds.basalProximity = config.getDouble("segmentation.basal_proximity", p.thresholds.basalProximity);

    // Basal classification
    p.basal.neighbors = config.getInt("basal.k", p.basal.neighbors);
    p.basal.mixtureThreshold = config.getDouble("basal.tau", p.basal.mixtureThreshold);

    // Boundary fill
    auto& fill = p.boundaryFill;
    fill.interpolationCount = config.getInt("boundary_fill.interpolation_count", fill.interpolationCount);
    fill.raySamples = config.getInt("boundary_fill.ray_samples", fill.raySamples);
    fill.rayStart = config.getDouble("boundary_fill.ray_start", fill.rayStart);
    fill.rayEnd = config.getDouble("boundary_fill.ray_end", fill.rayEnd);
    fill.minHitDistance = config.getDouble("boundary_fill.min_hit_distance", fill.minHitDistance);
    fill.maxHitDistance = config.getDouble("boundary_fill.max_hit_distance", fill.maxHitDistance);
    fill.basalFraction = config.getDouble("boundary_fill.basal_fraction", fill.basalFraction);
    fill.maxWorkers = config.getInt("boundary_fill.max_workers", fill.maxWorkers);

    // Reconstruction
    p.poisson.octreeDepth = config.getInt("reconstruction.octree_depth", p.poisson.octreeDepth);
    p.poisson.width = config.getDouble("reconstruction.width", p.poisson.width);
    p.poisson.scale = config.getDouble("reconstruction.scale", p.poisson.scale);
    p.poisson.linearFit = config.getBool("reconstruction.linear_fit", p.poisson.linearFit);
    p.poisson.cropLowDensity = config.getBool("reconstruction.crop_low_density", p.poisson.cropLowDensity);
    p.poisson.densityQuantile = config.getDouble("reconstruction.density_quantile", p.poisson.densityQuantile);

    return p;
}

bool PipelineParameters::validate() const {
    if (downsample && voxelSize <= 0.0) return false;
    return thresholds.validate() &&
           basal.validate() &&
           boundaryFill.validate() &&
           preprocess.validate() &&
           poisson.validate();
}

std::string PipelineParameters::toString() const {
    std::stringstream ss;
    ss << "Pipeline Parameters:\n";
    ss << "  Downsample: " << (downsample ? "Yes" : "No");
    if (downsample) {
        ss << " (voxel " << voxelSize << ")";
    }
    ss << "\n" << thresholds.toString();
    ss << "\n" << basal.toString();
    ss << "\n" << boundaryFill.toString();
    ss << "\n" << preprocess.toString();
    ss << "\n" << poisson.toString();
    return ss.str();
}

} // namespace api
} // namespace rockseg
