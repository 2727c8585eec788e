/**
 * GeoMesh Converter - Canonical Object Documents
 *
 * JSON form of canonical triangle-mesh objects. Parsing dispatches on the
 * "schema" id and fails closed: any id outside the supported set, or an
 * attribute type outside scalar/integer/category, is UnsupportedSchemaVersion.
 */

#pragma once

#include "mesh_schema.hpp"
#include "result.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>

namespace geomesh {

Result<TriangleMesh> parse_triangle_mesh(const nlohmann::json& document);
nlohmann::json triangle_mesh_to_json(const TriangleMesh& mesh);

Result<TriangleMesh> load_triangle_mesh(const std::filesystem::path& path);
Result<void> save_triangle_mesh(const std::filesystem::path& path, const TriangleMesh& mesh);

} // namespace geomesh
