/**
 * GeoMesh Converter - Schema Normalizer
 *
 * Erases the differences between triangle-mesh schema versions so the rest
 * of the pipeline sees one shape.
 */

#pragma once

#include "mesh_schema.hpp"
#include "result.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace geomesh {

struct NormalizedMesh {
    SchemaVersion source_version;
    std::string name;
    std::optional<std::string> description;
    BoundingBox bounding_box;
    CoordinateReferenceSystem coordinate_reference_system;

    ArrayRef vertices;
    ArrayRef triangles;
    std::vector<AttributeRecord> vertex_attributes;
    std::vector<AttributeRecord> face_attributes;   // empty for versions without them
    std::optional<PartsDescriptor> parts;           // absent for versions without them
};

/**
 * Normalize any supported version. Attributes keep their order and names.
 */
NormalizedMesh normalize(const TriangleMesh& mesh);

/**
 * Normalize an object document. Fails with UnsupportedSchemaVersion for
 * schema ids or attribute types outside the supported set.
 */
Result<NormalizedMesh> normalize(const nlohmann::json& document);

} // namespace geomesh
