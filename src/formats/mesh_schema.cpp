/**
 * GeoMesh Converter - Canonical Mesh Schemas Implementation
 */

#include "geomesh/mesh_schema.hpp"

#include <type_traits>

namespace geomesh {

const char* attribute_type_name(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::Continuous: return "scalar";
        case AttributeKind::Integer:    return "integer";
        case AttributeKind::Category:   return "category";
    }
    return "unknown";
}

std::optional<AttributeKind> parse_attribute_type(std::string_view name) {
    if (name == "scalar") return AttributeKind::Continuous;
    if (name == "integer") return AttributeKind::Integer;
    if (name == "category") return AttributeKind::Category;
    return std::nullopt;
}

std::string SchemaVersion::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::string triangle_mesh_schema_id(const SchemaVersion& version) {
    return "/objects/triangle-mesh/" + version.to_string() + "/triangle-mesh.schema.json";
}

SchemaVersion schema_version_of(const TriangleMesh& mesh) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::VERSION; }, mesh);
}

const MeshObjectInfo& object_info(const TriangleMesh& mesh) {
    return std::visit([](const auto& m) -> const MeshObjectInfo& { return m; }, mesh);
}

} // namespace geomesh
