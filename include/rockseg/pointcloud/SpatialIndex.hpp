#pragma once

#include <Eigen/Core>

#include <memory>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
class KDTreeFlann;
}
}

namespace rockseg {
namespace pointcloud {

/**
 * @brief Result of a k-nearest-neighbor query, sorted by ascending distance
 */
struct KnnResult {
    std::vector<double> distances;      // Euclidean, not squared
    std::vector<int> indices;

    size_t size() const { return indices.size(); }
    bool empty() const { return indices.empty(); }
};

/**
 * @brief Immutable nearest-neighbor index over a point set
 *
 * Wraps an Open3D KD-tree together with its own copy of the points, so the
 * index stays valid after the source cloud is modified or released. All query
 * methods are const and may be called concurrently from several threads.
 * Rebuild (construct a new index) whenever the point set changes.
 */
class SpatialIndex {
public:
    /**
     * @brief Build the index
     * @throws core::EmptyInputException if @p points is empty
     */
    explicit SpatialIndex(const std::vector<Eigen::Vector3d>& points);

    explicit SpatialIndex(const open3d::geometry::PointCloud& cloud);

    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /**
     * @brief k nearest neighbors of @p query
     *
     * Returns at most size() neighbors when k exceeds the index size, and
     * nothing for k <= 0. Coincident points are reported with distance 0.
     */
    KnnResult queryKNN(const Eigen::Vector3d& query, int k) const;

    std::vector<KnnResult> queryKNNBatch(const std::vector<Eigen::Vector3d>& queries, int k) const;

    /**
     * @brief Single nearest neighbor
     * @return false if the query could not be answered
     */
    bool queryNearest(const Eigen::Vector3d& query, int& index, double& distance) const;

    size_t size() const { return points_.size(); }

    const Eigen::Vector3d& point(size_t index) const { return points_[index]; }

private:
    void build();

    std::vector<Eigen::Vector3d> points_;
    std::unique_ptr<open3d::geometry::KDTreeFlann> tree_;
};

} // namespace pointcloud
} // namespace rockseg
