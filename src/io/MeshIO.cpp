#include "rockseg/io/MeshIO.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/TriangleMesh.h>
#include <open3d/io/TriangleMeshIO.h>

#include <filesystem>

namespace rockseg {
namespace io {

void MeshIO::write(const std::string& filename,
                   const open3d::geometry::TriangleMesh& mesh,
                   bool writeAscii) {
    if (mesh.vertices_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Refusing to write an empty mesh to " + filename);
    }

    if (!open3d::io::WriteTriangleMesh(filename, mesh, writeAscii)) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Failed to write mesh file: " + filename);
    }

    LOG_INFO("[MeshIO] Wrote mesh (" + std::to_string(mesh.vertices_.size()) + " vertices, " +
             std::to_string(mesh.triangles_.size()) + " triangles) to " + filename);
}

std::shared_ptr<open3d::geometry::TriangleMesh> MeshIO::read(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                           "Mesh file not found: " + filename);
    }

    auto mesh = std::make_shared<open3d::geometry::TriangleMesh>();
    if (!open3d::io::ReadTriangleMesh(filename, *mesh)) {
        ROCKSEG_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Failed to read mesh file: " + filename);
    }
    return mesh;
}

} // namespace io
} // namespace rockseg
