#pragma once

#include <memory>
#include <string>

namespace open3d {
namespace geometry {
class TriangleMesh;
}
}

namespace rockseg {
namespace io {

/**
 * @brief Triangle mesh persistence through Open3D
 *
 * The format follows the file extension (.ply, .obj, .stl, ...).
 */
class MeshIO {
public:
    /**
     * @throws core::EmptyInputException for a mesh without vertices
     * @throws core::FileException (ERROR_FILE_IO) if Open3D cannot write the file
     */
    static void write(const std::string& filename,
                      const open3d::geometry::TriangleMesh& mesh,
                      bool writeAscii = false);

    /**
     * @throws core::FileException (ERROR_FILE_NOT_FOUND, ERROR_FILE_IO)
     */
    static std::shared_ptr<open3d::geometry::TriangleMesh> read(const std::string& filename);
};

} // namespace io
} // namespace rockseg
