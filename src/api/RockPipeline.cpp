#include "rockseg/api/RockPipeline.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"
#include "rockseg/mesh/ReconstructionPreprocessor.hpp"
#include "rockseg/pointcloud/BasalClassifier.hpp"
#include "rockseg/pointcloud/SeedHeuristic.hpp"
#include "rockseg/segmentation/Segmenter.hpp"

#include <open3d/geometry/PointCloud.h>

namespace rockseg {
namespace api {

const Eigen::Vector3d RockPipeline::kExportedFillColor(0.0, 1.0, 0.0);

std::string stageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::EMPTY: return "Empty";
        case PipelineStage::LOADED: return "Loaded";
        case PipelineStage::SEEDS_READY: return "SeedsReady";
        case PipelineStage::SEGMENTED: return "Segmented";
        case PipelineStage::BASAL_READY: return "BasalReady";
        case PipelineStage::BOUNDARY_FILLED: return "BoundaryFilled";
        case PipelineStage::RECONSTRUCTED: return "Reconstructed";
    }
    return "Unknown";
}

class RockPipeline::Impl {
public:
    PipelineParameters params;
    StageCallback stageCallback;

    PipelineStage stage = PipelineStage::EMPTY;
    core::Generation lastGeneration = 0;
    core::CloudHandle cloud;
    Eigen::Vector3d recentering = Eigen::Vector3d::Zero();
    bool downsampled = false;

    std::shared_ptr<const core::SeedSet> seeds;
    std::shared_ptr<const core::LabelArray> labels;
    std::shared_ptr<const open3d::geometry::PointCloud> labeledCloud;
    std::shared_ptr<const core::BasalMask> basal;
    std::shared_ptr<const pointcloud::BoundaryFillResult> fill;
    std::shared_ptr<const mesh::ReconstructedMesh> reconstructed;

    core::Generation nextGeneration() { return ++lastGeneration; }

    // Drops every output produced after `keep`
    void invalidateAfter(PipelineStage keep) {
        if (keep < PipelineStage::RECONSTRUCTED) reconstructed.reset();
        if (keep < PipelineStage::BOUNDARY_FILLED) fill.reset();
        if (keep < PipelineStage::BASAL_READY) basal.reset();
        if (keep < PipelineStage::SEGMENTED) {
            labels.reset();
            labeledCloud.reset();
        }
        if (keep < PipelineStage::SEEDS_READY) seeds.reset();
        stage = keep;
    }

    void require(bool present, PipelineStage wanted, const std::string& operation) const {
        if (!present) {
            ROCKSEG_THROW(core::StageOrderException,
                          operation + " requires stage " + stageToString(wanted) +
                          " (current stage: " + stageToString(stage) + ")");
        }
    }

    void requireCurrent(core::Generation generation, const std::string& what) const {
        if (generation != cloud.generation) {
            ROCKSEG_THROW(core::StageOrderException,
                          what + " was computed for cloud generation " + std::to_string(generation) +
                          ", current generation is " + std::to_string(cloud.generation));
        }
    }

    void emit(PipelineStage completed, core::Generation generation, size_t pointCount,
              const std::string& message,
              std::shared_ptr<const open3d::geometry::PointCloud> preview = nullptr) {
        LOG_INFO("[RockPipeline] " + stageToString(completed) + ": " + message);
        if (stageCallback) {
            StageEvent event;
            event.stage = completed;
            event.generation = generation;
            event.pointCount = pointCount;
            event.message = message;
            event.preview = std::move(preview);
            stageCallback(event);
        }
    }
};

RockPipeline::RockPipeline(const PipelineParameters& params) : pImpl(std::make_unique<Impl>()) {
    setParameters(params);
}

RockPipeline::~RockPipeline() = default;

void RockPipeline::setStageCallback(StageCallback callback) {
    pImpl->stageCallback = std::move(callback);
}

void RockPipeline::setParameters(const PipelineParameters& params) {
    if (!params.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException, "Invalid pipeline parameters:\n" + params.toString());
    }
    pImpl->params = params;
}

const PipelineParameters& RockPipeline::parameters() const {
    return pImpl->params;
}

const core::CloudHandle& RockPipeline::load(std::shared_ptr<const open3d::geometry::PointCloud> cloud,
                                            const Eigen::Vector3d& recentering) {
    if (!cloud || cloud->points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Cannot load an empty point cloud");
    }

    pImpl->invalidateAfter(PipelineStage::EMPTY);
    pImpl->cloud.cloud = std::move(cloud);
    pImpl->cloud.generation = pImpl->nextGeneration();
    pImpl->recentering = recentering;
    pImpl->downsampled = false;
    pImpl->stage = PipelineStage::LOADED;

    pImpl->emit(PipelineStage::LOADED, pImpl->cloud.generation, pImpl->cloud.size(),
                std::to_string(pImpl->cloud.size()) + " points", pImpl->cloud.cloud);
    return pImpl->cloud;
}

const core::CloudHandle& RockPipeline::downsample(double voxelSize) {
    pImpl->require(pImpl->stage == PipelineStage::LOADED, PipelineStage::LOADED, "downsample");
    if (voxelSize <= 0.0) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Voxel size must be positive, got " + std::to_string(voxelSize));
    }

    const size_t before = pImpl->cloud.size();
    std::shared_ptr<open3d::geometry::PointCloud> reduced = pImpl->cloud.cloud->VoxelDownSample(voxelSize);
    if (!reduced || reduced->points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Voxel downsampling removed every point");
    }

    pImpl->cloud.cloud = reduced;
    pImpl->cloud.generation = pImpl->nextGeneration();
    pImpl->downsampled = true;

    pImpl->emit(PipelineStage::LOADED, pImpl->cloud.generation, pImpl->cloud.size(),
                "downsampled " + std::to_string(before) + " -> " + std::to_string(pImpl->cloud.size()) +
                " points (voxel " + std::to_string(voxelSize) + ")", pImpl->cloud.cloud);
    return pImpl->cloud;
}

std::shared_ptr<const core::SeedSet> RockPipeline::computeDefaultSeeds() {
    pImpl->require(pImpl->cloud.valid(), PipelineStage::LOADED, "computeDefaultSeeds");

    pointcloud::DefaultSeeds defaults = pointcloud::SeedHeuristic::compute(*pImpl->cloud.cloud);
    return setSeeds({defaults.rockSeed}, {defaults.pedestalSeed});
}

std::shared_ptr<const core::SeedSet> RockPipeline::setSeeds(const std::vector<size_t>& rock,
                                                            const std::vector<size_t>& pedestal) {
    pImpl->require(pImpl->cloud.valid(), PipelineStage::LOADED, "setSeeds");

    auto seeds = std::make_shared<core::SeedSet>();
    seeds->rock = rock;
    seeds->pedestal = pedestal;
    seeds->generation = pImpl->cloud.generation;
    pointcloud::SeedHeuristic::validate(*seeds, pImpl->cloud.size());

    pImpl->invalidateAfter(PipelineStage::LOADED);
    pImpl->seeds = seeds;
    pImpl->stage = PipelineStage::SEEDS_READY;

    pImpl->emit(PipelineStage::SEEDS_READY, seeds->generation, pImpl->cloud.size(),
                std::to_string(rock.size()) + " rock seed(s), " +
                std::to_string(pedestal.size()) + " pedestal seed(s)");
    return pImpl->seeds;
}

std::shared_ptr<const core::LabelArray> RockPipeline::segment(segmentation::Segmenter& segmenter) {
    pImpl->require(static_cast<bool>(pImpl->seeds), PipelineStage::SEEDS_READY, "segment");
    pImpl->requireCurrent(pImpl->seeds->generation, "Seed set");

    const auto& thresholds = pImpl->params.thresholds;
    if (!thresholds.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException, "Invalid segmentation thresholds:\n" + thresholds.toString());
    }

    const open3d::geometry::PointCloud& cloud = *pImpl->cloud.cloud;
    core::LabelArray labels;
    std::shared_ptr<open3d::geometry::PointCloud> colored;

    // A second pass grows up to the basal ring of the first one
    std::shared_ptr<const core::BasalMask> basal;
    if (pImpl->basal && pImpl->basal->generation == pImpl->cloud.generation &&
        pImpl->basal->size() == cloud.points_.size()) {
        basal = pImpl->basal;
        LOG_INFO("[RockPipeline] Re-segmenting with " + std::to_string(basal->count()) + " basal points");
    }

    try {
        segmentation::SegmentationOutput output =
            segmenter.segment(cloud, pImpl->seeds->rock, pImpl->seeds->pedestal, thresholds, basal.get());
        if (output.labels.size() != cloud.points_.size()) {
            ROCKSEG_THROW(core::ExternalComponentException,
                          segmenter.name() + " returned " + std::to_string(output.labels.size()) +
                          " labels for " + std::to_string(cloud.points_.size()) + " points");
        }
        labels = segmenter.propagateLabels(cloud, output.labels);
        if (labels.size() != cloud.points_.size()) {
            ROCKSEG_THROW(core::ExternalComponentException,
                          segmenter.name() + " propagated " + std::to_string(labels.size()) +
                          " labels for " + std::to_string(cloud.points_.size()) + " points");
        }
    } catch (const core::ExternalComponentException&) {
        throw;
    } catch (const std::exception& e) {
        ROCKSEG_THROW(core::ExternalComponentException, e.what());
    }

    size_t relabeled = 0;
    for (auto& label : labels.labels) {
        if (label == core::Label::UNLABELED) {
            label = core::Label::ROCK;
            ++relabeled;
        }
    }
    if (relabeled > 0) {
        LOG_DEBUG("[RockPipeline] " + std::to_string(relabeled) + " unlabeled points assigned to rock");
    }
    labels.generation = pImpl->cloud.generation;

    try {
        colored = segmenter.colorByLabel(cloud, labels);
    } catch (const std::exception& e) {
        ROCKSEG_THROW(core::ExternalComponentException, e.what());
    }

    pImpl->invalidateAfter(PipelineStage::SEEDS_READY);
    pImpl->labels = std::make_shared<const core::LabelArray>(std::move(labels));
    pImpl->labeledCloud = colored;
    pImpl->stage = PipelineStage::SEGMENTED;

    pImpl->emit(PipelineStage::SEGMENTED, pImpl->labels->generation, pImpl->labels->size(),
                std::to_string(pImpl->labels->count(core::Label::ROCK)) + " rock, " +
                std::to_string(pImpl->labels->count(core::Label::PEDESTAL)) + " pedestal",
                pImpl->labeledCloud);
    return pImpl->labels;
}

std::shared_ptr<const core::BasalMask> RockPipeline::estimateBasal() {
    pImpl->require(static_cast<bool>(pImpl->labels), PipelineStage::SEGMENTED, "estimateBasal");
    pImpl->requireCurrent(pImpl->labels->generation, "Label array");

    pointcloud::BasalClassifier classifier(pImpl->params.basal);
    core::BasalMask mask = classifier.classify(*pImpl->cloud.cloud, *pImpl->labels);
    return setBasalMask(mask);
}

std::shared_ptr<const core::BasalMask> RockPipeline::setBasalMask(const core::BasalMask& mask) {
    pImpl->require(static_cast<bool>(pImpl->labels), PipelineStage::SEGMENTED, "setBasalMask");
    if (mask.generation != pImpl->cloud.generation || mask.size() != pImpl->cloud.size()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Basal mask (" + std::to_string(mask.size()) + " entries, generation " +
                      std::to_string(mask.generation) + ") does not match the current cloud (" +
                      std::to_string(pImpl->cloud.size()) + " points, generation " +
                      std::to_string(pImpl->cloud.generation) + ")");
    }

    pImpl->invalidateAfter(PipelineStage::SEGMENTED);
    pImpl->basal = std::make_shared<const core::BasalMask>(mask);
    pImpl->stage = PipelineStage::BASAL_READY;

    pImpl->emit(PipelineStage::BASAL_READY, mask.generation, mask.size(),
                std::to_string(mask.count()) + " basal points");
    return pImpl->basal;
}

std::shared_ptr<const pointcloud::BoundaryFillResult> RockPipeline::fillBoundary(
    const std::atomic<bool>* cancel) {
    pImpl->require(static_cast<bool>(pImpl->basal), PipelineStage::BASAL_READY, "fillBoundary");
    pImpl->requireCurrent(pImpl->basal->generation, "Basal mask");

    const open3d::geometry::PointCloud& cloud = *pImpl->cloud.cloud;
    const auto& labels = pImpl->labels->labels;
    const auto& mask = pImpl->basal->mask;

    // Working copy: rock and basal points only
    std::vector<size_t> kept;
    std::vector<size_t> basalInFiltered;
    for (size_t i = 0; i < cloud.points_.size(); ++i) {
        if (labels[i] == core::Label::ROCK || mask[i]) {
            if (mask[i]) {
                basalInFiltered.push_back(kept.size());
            }
            kept.push_back(i);
        }
    }
    if (kept.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "No rock or basal point to fill the boundary from");
    }
    std::shared_ptr<open3d::geometry::PointCloud> filtered = cloud.SelectByIndex(kept);

    pointcloud::BoundaryFiller filler(pImpl->params.boundaryFill);
    pointcloud::BoundaryFillResult result = filler.fill(*filtered, basalInFiltered, cancel);
    if (result.cancelled) {
        ROCKSEG_THROW(core::CancelledException, "Boundary fill cancelled, no result stored");
    }
    if (result.failedTasks > 0) {
        LOG_WARNING("[RockPipeline] " + std::to_string(result.failedTasks) + " boundary rays failed");
    }
    result.generation = pImpl->nextGeneration();

    pImpl->invalidateAfter(PipelineStage::BASAL_READY);
    pImpl->fill = std::make_shared<const pointcloud::BoundaryFillResult>(std::move(result));
    pImpl->stage = PipelineStage::BOUNDARY_FILLED;

    pImpl->emit(PipelineStage::BOUNDARY_FILLED, pImpl->fill->generation,
                pImpl->fill->augmentedCloud->points_.size(),
                std::to_string(pImpl->fill->newPoints.size()) + " synthesized points from " +
                std::to_string(pImpl->fill->rays.size()) + " rays",
                pImpl->fill->augmentedCloud);
    return pImpl->fill;
}

std::shared_ptr<const mesh::ReconstructedMesh> RockPipeline::reconstruct(
    mesh::SurfaceReconstructor& reconstructor) {
    pImpl->require(static_cast<bool>(pImpl->fill), PipelineStage::BOUNDARY_FILLED, "reconstruct");

    mesh::ReconstructionPreprocessor preprocessor(pImpl->params.preprocess);
    mesh::ReconstructedMesh result;
    try {
        result = preprocessor.run(*pImpl->fill->augmentedCloud, reconstructor, pImpl->params.poisson);
    } catch (const core::Exception&) {
        throw;
    } catch (const std::exception& e) {
        ROCKSEG_THROW(core::ExternalComponentException, reconstructor.name() + ": " + e.what());
    }
    if (!result.mesh) {
        ROCKSEG_THROW(core::ExternalComponentException, reconstructor.name() + " returned no mesh");
    }

    pImpl->invalidateAfter(PipelineStage::BOUNDARY_FILLED);
    pImpl->reconstructed = std::make_shared<const mesh::ReconstructedMesh>(std::move(result));
    pImpl->stage = PipelineStage::RECONSTRUCTED;

    pImpl->emit(PipelineStage::RECONSTRUCTED, pImpl->fill->generation, pImpl->reconstructed->inputPoints,
                std::to_string(pImpl->reconstructed->vertexCount()) + " vertices, " +
                std::to_string(pImpl->reconstructed->triangleCount()) + " triangles");
    return pImpl->reconstructed;
}

std::shared_ptr<const mesh::ReconstructedMesh> RockPipeline::runAll(segmentation::Segmenter& segmenter,
                                                                    mesh::SurfaceReconstructor& reconstructor,
                                                                    const std::atomic<bool>* cancel) {
    pImpl->require(pImpl->cloud.valid(), PipelineStage::LOADED, "runAll");

    if (pImpl->params.downsample && !pImpl->downsampled && pImpl->stage == PipelineStage::LOADED) {
        downsample(pImpl->params.voxelSize);
    }
    if (!pImpl->seeds) {
        computeDefaultSeeds();
    }
    segment(segmenter);
    estimateBasal();
    fillBoundary(cancel);
    return reconstruct(reconstructor);
}

io::PointRecordSet RockPipeline::exportRecords() const {
    pImpl->require(static_cast<bool>(pImpl->labels), PipelineStage::SEGMENTED, "exportRecords");

    const open3d::geometry::PointCloud& cloud = *pImpl->cloud.cloud;
    const auto& labels = pImpl->labels->labels;
    const bool hasColors = pImpl->labeledCloud &&
                           pImpl->labeledCloud->colors_.size() == cloud.points_.size();

    io::PointRecordSet records;
    const size_t synthesized = pImpl->fill ? pImpl->fill->newPoints.size() : 0;
    records.points.reserve(cloud.points_.size() + synthesized);
    records.colors.reserve(cloud.points_.size() + synthesized);
    records.intensity.reserve(cloud.points_.size() + synthesized);

    for (size_t i = 0; i < cloud.points_.size(); ++i) {
        records.points.push_back(cloud.points_[i] + pImpl->recentering);
        records.colors.push_back(hasColors ? pImpl->labeledCloud->colors_[i] : Eigen::Vector3d::Zero());

        uint16_t intensity = labels[i] == core::Label::PEDESTAL ? 0 : 1;
        if (pImpl->basal && pImpl->basal->mask[i]) {
            intensity = 2;
        }
        records.intensity.push_back(intensity);
    }

    if (pImpl->fill) {
        for (const auto& p : pImpl->fill->newPoints) {
            records.points.push_back(p + pImpl->recentering);
            records.colors.push_back(kExportedFillColor);
            records.intensity.push_back(2);
        }
    }
    return records;
}

PipelineStage RockPipeline::stage() const { return pImpl->stage; }
const core::CloudHandle& RockPipeline::cloud() const { return pImpl->cloud; }
const Eigen::Vector3d& RockPipeline::recentering() const { return pImpl->recentering; }

std::shared_ptr<const core::SeedSet> RockPipeline::seeds() const { return pImpl->seeds; }
std::shared_ptr<const core::LabelArray> RockPipeline::labels() const { return pImpl->labels; }
std::shared_ptr<const open3d::geometry::PointCloud> RockPipeline::labeledCloud() const { return pImpl->labeledCloud; }
std::shared_ptr<const core::BasalMask> RockPipeline::basalMask() const { return pImpl->basal; }
std::shared_ptr<const pointcloud::BoundaryFillResult> RockPipeline::boundaryFill() const { return pImpl->fill; }
std::shared_ptr<const mesh::ReconstructedMesh> RockPipeline::reconstructedMesh() const { return pImpl->reconstructed; }

} // namespace api
} // namespace rockseg
