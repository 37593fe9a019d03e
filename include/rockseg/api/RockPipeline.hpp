#pragma once

#include "rockseg/api/PipelineParameters.hpp"
#include "rockseg/core/types.hpp"
#include "rockseg/io/LasIO.hpp"
#include "rockseg/mesh/SurfaceReconstructor.hpp"
#include "rockseg/pointcloud/BoundaryFiller.hpp"

#include <Eigen/Core>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {

namespace segmentation {
class Segmenter;
}

namespace api {

/**
 * @brief Pipeline stages, in order
 */
enum class PipelineStage {
    EMPTY,
    LOADED,
    SEEDS_READY,
    SEGMENTED,
    BASAL_READY,
    BOUNDARY_FILLED,
    RECONSTRUCTED
};

std::string stageToString(PipelineStage stage);

/**
 * @brief Notification emitted after every completed stage
 */
struct StageEvent {
    PipelineStage stage = PipelineStage::EMPTY;
    core::Generation generation = 0;    ///< Generation of the cloud the stage produced or consumed
    size_t pointCount = 0;
    std::string message;
    std::shared_ptr<const open3d::geometry::PointCloud> preview;  ///< Colored cloud, may be null
};

/**
 * @brief Rock / pedestal pipeline coordinator
 *
 * Sequences Loaded -> SeedsReady -> Segmented -> BasalReady ->
 * BoundaryFilled -> Reconstructed. Every stage consumes the stored output of
 * the previous one and stores its own as an immutable value. Invoking a stage
 * whose prerequisite is missing throws core::StageOrderException; re-running a
 * stage discards every downstream output.
 *
 * Not thread-safe. The boundary filler runs its own worker pool internally.
 */
class RockPipeline {
public:
    // Color of synthesized points in exported records, apart from the label colors
    static const Eigen::Vector3d kExportedFillColor;

    /**
     * @brief Stage callback, replaces the interactive viewer
     */
    using StageCallback = std::function<void(const StageEvent& event)>;

    /**
     * @throws core::InvalidParameterException on invalid parameters
     */
    explicit RockPipeline(const PipelineParameters& params = {});
    ~RockPipeline();

    void setStageCallback(StageCallback callback);

    /**
     * @brief Replace the parameters; stored outputs are kept
     * @throws core::InvalidParameterException on invalid parameters
     */
    void setParameters(const PipelineParameters& params);
    const PipelineParameters& parameters() const;

    // ===== Stages =====

    /**
     * @brief Start a new run on @p cloud
     * @param recentering Mean subtracted on import, added back by exportRecords()
     * @throws core::EmptyInputException for a null or empty cloud
     */
    const core::CloudHandle& load(std::shared_ptr<const open3d::geometry::PointCloud> cloud,
                                  const Eigen::Vector3d& recentering = Eigen::Vector3d::Zero());

    /**
     * @brief Voxel-downsample the loaded cloud, only right after load()
     * @throws core::StageOrderException outside the Loaded stage
     */
    const core::CloudHandle& downsample(double voxelSize);

    /**
     * @brief Apex / lowest point seeds
     */
    std::shared_ptr<const core::SeedSet> computeDefaultSeeds();

    /**
     * @throws core::InvalidSeedException for empty or out-of-range seeds
     */
    std::shared_ptr<const core::SeedSet> setSeeds(const std::vector<size_t>& rock,
                                                  const std::vector<size_t>& pedestal);

    /**
     * @brief segment + propagateLabels; points still unlabeled become rock
     *
     * When a basal mask of the current cloud is stored (segment() re-run
     * after estimateBasal()), it is handed to the segmenter, then discarded
     * with the other downstream outputs.
     * @throws core::ExternalComponentException wrapping any segmenter failure
     */
    std::shared_ptr<const core::LabelArray> segment(segmentation::Segmenter& segmenter);

    std::shared_ptr<const core::BasalMask> estimateBasal();

    /**
     * @brief Use an externally computed basal mask instead of estimateBasal()
     * @throws core::InvalidParameterException if the mask does not match the current cloud
     */
    std::shared_ptr<const core::BasalMask> setBasalMask(const core::BasalMask& mask);

    /**
     * @brief Close the bottom of the rock ∪ basal working cloud
     * @param cancel Optional flag; when set the run is abandoned
     * @throws core::CancelledException if @p cancel was raised, nothing is stored
     */
    std::shared_ptr<const pointcloud::BoundaryFillResult> fillBoundary(
        const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Normal estimation, filtering and surface reconstruction
     * @throws core::ExternalComponentException wrapping reconstructor failures
     */
    std::shared_ptr<const mesh::ReconstructedMesh> reconstruct(mesh::SurfaceReconstructor& reconstructor);

    /**
     * @brief Run every remaining stage from the loaded cloud
     *
     * Downsamples when enabled and not yet done, uses the default seeds when
     * none were set.
     */
    std::shared_ptr<const mesh::ReconstructedMesh> runAll(segmentation::Segmenter& segmenter,
                                                          mesh::SurfaceReconstructor& reconstructor,
                                                          const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Segmented points and synthesized boundary points, recentering undone
     *
     * Intensity: pedestal 0, rock 1, basal and synthesized 2. Synthesized
     * points are colored kExportedFillColor.
     * @throws core::StageOrderException before segmentation
     */
    io::PointRecordSet exportRecords() const;

    // ===== State =====

    PipelineStage stage() const;
    const core::CloudHandle& cloud() const;
    const Eigen::Vector3d& recentering() const;

    std::shared_ptr<const core::SeedSet> seeds() const;
    std::shared_ptr<const core::LabelArray> labels() const;
    std::shared_ptr<const open3d::geometry::PointCloud> labeledCloud() const;
    std::shared_ptr<const core::BasalMask> basalMask() const;
    std::shared_ptr<const pointcloud::BoundaryFillResult> boundaryFill() const;
    std::shared_ptr<const mesh::ReconstructedMesh> reconstructedMesh() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;

    RockPipeline(const RockPipeline&) = delete;
    RockPipeline& operator=(const RockPipeline&) = delete;
};

} // namespace api
} // namespace rockseg
