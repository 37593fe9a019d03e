#pragma once

#include "rockseg/mesh/ReconstructionPreprocessor.hpp"
#include "rockseg/mesh/SurfaceReconstructor.hpp"
#include "rockseg/pointcloud/BasalClassifier.hpp"
#include "rockseg/pointcloud/BoundaryFiller.hpp"
#include "rockseg/segmentation/Segmenter.hpp"

#include <string>

namespace rockseg {
namespace core {
class Configuration;
}

namespace api {

/**
 * @brief Every tunable of the rock pipeline
 *
 * Configuration keys:
 *   preprocessing.downsample, preprocessing.voxel_size,
 *   preprocessing.normal_radius, preprocessing.max_neighbors,
 *   preprocessing.orientation_k, preprocessing.min_normal_magnitude
 *   segmentation.smoothness, segmentation.curvature,
 *   segmentation.distance, segmentation.basal_proximity
 *   basal.k, basal.tau
 *   boundary_fill.interpolation_count, boundary_fill.ray_samples,
 *   boundary_fill.ray_start, boundary_fill.ray_end,
 *   boundary_fill.min_hit_distance, boundary_fill.max_hit_distance,
 *   boundary_fill.basal_fraction, boundary_fill.max_workers
 *   reconstruction.octree_depth, reconstruction.width, reconstruction.scale,
 *   reconstruction.linear_fit, reconstruction.crop_low_density,
 *   reconstruction.density_quantile
 */
struct PipelineParameters {
    bool downsample = true;
    double voxelSize = 0.01;

    segmentation::SegmentationThresholds thresholds;
    pointcloud::BasalSettings basal;
    pointcloud::BoundaryFillSettings boundaryFill;
    mesh::PreprocessSettings preprocess;
    mesh::PoissonSettings poisson;

    /**
     * @brief Read parameters, missing keys keep their defaults
     */
    static PipelineParameters fromConfiguration(const core::Configuration& config);

    bool validate() const;
    std::string toString() const;
};

} // namespace api
} // namespace rockseg
