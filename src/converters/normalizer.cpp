/**
 * GeoMesh Converter - Schema Normalizer Implementation
 */

#include "geomesh/normalizer.hpp"
#include "geomesh/mesh_json.hpp"
#include "geomesh/logging.hpp"

namespace geomesh {

namespace {

NormalizedMesh from_info(const MeshObjectInfo& info, const SchemaVersion& version) {
    NormalizedMesh out;
    out.source_version = version;
    out.name = info.name;
    out.description = info.description;
    out.bounding_box = info.bounding_box;
    out.coordinate_reference_system = info.coordinate_reference_system;
    return out;
}

NormalizedMesh normalize_version(const TriangleMeshV1_0_0& mesh) {
    NormalizedMesh out = from_info(mesh, TriangleMeshV1_0_0::VERSION);
    out.vertices = mesh.vertices;
    out.triangles = mesh.indices;
    out.vertex_attributes = mesh.vertex_attributes;
    return out;
}

NormalizedMesh normalize_version(const TriangleMeshV2_0_0& mesh) {
    NormalizedMesh out = from_info(mesh, TriangleMeshV2_0_0::VERSION);
    out.vertices = mesh.triangles.vertices.data;
    out.triangles = mesh.triangles.indices.data;
    out.vertex_attributes = mesh.triangles.vertices.attributes;
    out.face_attributes = mesh.triangles.indices.attributes;
    return out;
}

NormalizedMesh normalize_version(const TriangleMeshV2_1_0& mesh) {
    NormalizedMesh out = from_info(mesh, TriangleMeshV2_1_0::VERSION);
    out.vertices = mesh.triangles.vertices.data;
    out.triangles = mesh.triangles.indices.data;
    out.vertex_attributes = mesh.triangles.vertices.attributes;
    out.face_attributes = mesh.triangles.indices.attributes;
    out.parts = mesh.parts;
    return out;
}

} // namespace

NormalizedMesh normalize(const TriangleMesh& mesh) {
    NormalizedMesh out = std::visit([](const auto& m) { return normalize_version(m); }, mesh);

    LOG_DEBUG("Normalizer", "'" << out.name << "' v" << out.source_version.to_string()
              << ": " << out.vertex_attributes.size() << " vertex / "
              << out.face_attributes.size() << " face attributes"
              << (out.parts ? ", parts" : ""));
    return out;
}

Result<NormalizedMesh> normalize(const nlohmann::json& document) {
    TRY_ASSIGN(mesh, parse_triangle_mesh(document));
    return normalize(mesh);
}

} // namespace geomesh
