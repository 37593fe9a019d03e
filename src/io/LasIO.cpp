#include "rockseg/io/LasIO.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/PointCloud.h>

#include <pdal/Options.hpp>
#include <pdal/PointTable.hpp>
#include <pdal/PointView.hpp>
#include <pdal/io/BufferReader.hpp>
#include <pdal/io/LasReader.hpp>
#include <pdal/io/LasWriter.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace rockseg {
namespace io {

namespace {

uint16_t toColorChannel(double value) {
    const double clamped = std::min(1.0, std::max(0.0, value));
    return static_cast<uint16_t>(std::lround(clamped * LasIO::kColorScale));
}

} // namespace

constexpr double LasIO::kColorScale;

bool PointRecordSet::validate() const {
    if (!colors.empty() && colors.size() != points.size()) return false;
    if (!intensity.empty() && intensity.size() != points.size()) return false;
    return true;
}

LoadedCloud LasIO::read(const std::string& filename, bool recenter) {
    if (!std::filesystem::exists(filename)) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                           "LAS file not found: " + filename);
    }

    LoadedCloud loaded;
    loaded.cloud = std::make_shared<open3d::geometry::PointCloud>();

    try {
        pdal::Options options;
        options.add("filename", filename);

        pdal::LasReader reader;
        reader.setOptions(options);

        pdal::PointTable table;
        reader.prepare(table);
        pdal::PointViewSet viewSet = reader.execute(table);

        for (const pdal::PointViewPtr& view : viewSet) {
            const bool hasColor = view->layout()->hasDim(pdal::Dimension::Id::Red) &&
                                  view->layout()->hasDim(pdal::Dimension::Id::Green) &&
                                  view->layout()->hasDim(pdal::Dimension::Id::Blue);
            const bool hasIntensity = view->layout()->hasDim(pdal::Dimension::Id::Intensity);
            loaded.hasColor = hasColor;

            for (pdal::PointId i = 0; i < view->size(); ++i) {
                loaded.cloud->points_.emplace_back(
                    view->getFieldAs<double>(pdal::Dimension::Id::X, i),
                    view->getFieldAs<double>(pdal::Dimension::Id::Y, i),
                    view->getFieldAs<double>(pdal::Dimension::Id::Z, i));

                if (hasColor) {
                    loaded.cloud->colors_.emplace_back(
                        view->getFieldAs<double>(pdal::Dimension::Id::Red, i) / kColorScale,
                        view->getFieldAs<double>(pdal::Dimension::Id::Green, i) / kColorScale,
                        view->getFieldAs<double>(pdal::Dimension::Id::Blue, i) / kColorScale);
                }

                loaded.intensity.push_back(hasIntensity
                    ? view->getFieldAs<uint16_t>(pdal::Dimension::Id::Intensity, i)
                    : uint16_t(0));
            }
        }
    } catch (const pdal::pdal_error& e) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Failed to read LAS file " + filename + ": " + e.what());
    }

    if (loaded.cloud->points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "LAS file contains no points: " + filename);
    }

    // Views may disagree on color; keep colors only when every point has one
    if (loaded.cloud->colors_.size() != loaded.cloud->points_.size()) {
        loaded.cloud->colors_.clear();
        loaded.hasColor = false;
    }

    if (recenter) {
        Eigen::Vector3d sum = Eigen::Vector3d::Zero();
        for (const auto& p : loaded.cloud->points_) {
            sum += p;
        }
        loaded.recentering = sum / static_cast<double>(loaded.cloud->points_.size());
        for (auto& p : loaded.cloud->points_) {
            p -= loaded.recentering;
        }
    }

    ROCKSEG_LOG_INFO("LasIO") << "Loaded " << loaded.cloud->points_.size() << " points from " << filename
                              << " (color: " << (loaded.hasColor ? "yes" : "no") << ", mean: "
                              << loaded.recentering.x() << ", " << loaded.recentering.y() << ", "
                              << loaded.recentering.z() << ")";
    return loaded;
}

void LasIO::write(const std::string& filename, const PointRecordSet& records) {
    if (!records.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Record channels differ in length (points " + std::to_string(records.points.size()) +
                      ", colors " + std::to_string(records.colors.size()) +
                      ", intensity " + std::to_string(records.intensity.size()) + ")");
    }

    try {
        pdal::PointTable table;
        pdal::PointLayoutPtr layout = table.layout();
        layout->registerDim(pdal::Dimension::Id::X);
        layout->registerDim(pdal::Dimension::Id::Y);
        layout->registerDim(pdal::Dimension::Id::Z);
        layout->registerDim(pdal::Dimension::Id::Intensity);
        layout->registerDim(pdal::Dimension::Id::Red);
        layout->registerDim(pdal::Dimension::Id::Green);
        layout->registerDim(pdal::Dimension::Id::Blue);

        pdal::PointViewPtr view(new pdal::PointView(table));
        for (size_t i = 0; i < records.size(); ++i) {
            const pdal::PointId id = view->size();
            const Eigen::Vector3d& p = records.points[i];
            view->setField(pdal::Dimension::Id::X, id, p.x());
            view->setField(pdal::Dimension::Id::Y, id, p.y());
            view->setField(pdal::Dimension::Id::Z, id, p.z());
            view->setField(pdal::Dimension::Id::Intensity, id,
                           records.intensity.empty() ? uint16_t(0) : records.intensity[i]);

            const Eigen::Vector3d color = records.colors.empty() ? Eigen::Vector3d::Zero() : records.colors[i];
            view->setField(pdal::Dimension::Id::Red, id, toColorChannel(color.x()));
            view->setField(pdal::Dimension::Id::Green, id, toColorChannel(color.y()));
            view->setField(pdal::Dimension::Id::Blue, id, toColorChannel(color.z()));
        }

        pdal::BufferReader bufferReader;
        bufferReader.addView(view);

        pdal::Options options;
        options.add("filename", filename);
        options.add("minor_version", 2);
        options.add("dataformat_id", 3);
        options.add("scale_x", 1e-5);
        options.add("scale_y", 1e-5);
        options.add("scale_z", 1e-5);
        options.add("offset_x", "auto");
        options.add("offset_y", "auto");
        options.add("offset_z", "auto");

        pdal::LasWriter writer;
        writer.setInput(bufferReader);
        writer.setOptions(options);
        writer.prepare(table);
        writer.execute(table);
    } catch (const pdal::pdal_error& e) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Failed to write LAS file " + filename + ": " + e.what());
    }

    LOG_INFO("[LasIO] Wrote " + std::to_string(records.size()) + " points to " + filename);
}

} // namespace io
} // namespace rockseg
