/**
 * GeoMesh Converter - Canonical Mesh Schemas
 *
 * The closed set of triangle-mesh object versions. Each version is its own
 * struct; TriangleMesh is a variant over exactly these, so every consumer
 * dispatching on it is checked for exhaustiveness by the compiler.
 *
 *   1.0.0  vertices + indices at top level, vertex attributes only
 *   2.0.0  triangles.{vertices,indices} each carrying attributes
 *   2.1.0  2.0.0 plus an optional parts descriptor (latest)
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geomesh {

/**
 * Reference to a stored array plus its declared shape.
 */
struct ArrayRef {
    TableRef data;
    uint64_t length = 0;
    uint32_t width = 1;
    std::string data_type;
};

enum class AttributeKind {
    Continuous,  // "scalar": float64 values
    Integer,     // "integer": int32/int64 values
    Category     // "category": int keys + lookup table
};

const char* attribute_type_name(AttributeKind kind);
std::optional<AttributeKind> parse_attribute_type(std::string_view name);

/**
 * Attribute record schema. 1.1.0 adds the key identifier.
 */
enum class AttributeSchema {
    V1_0_1,
    V1_1_0
};

/**
 * Attribute as stored in a canonical object.
 */
struct AttributeRecord {
    AttributeSchema schema = AttributeSchema::V1_1_0;
    AttributeKind kind = AttributeKind::Continuous;
    std::string name;
    std::string key;                        // 1.1.0 only
    ArrayRef values;
    std::optional<ArrayRef> lookup_table;   // Category only
    std::vector<double> nan_values;         // nan_description.values
};

/**
 * Optional chunked selection of the base triangle stream.
 */
struct PartsDescriptor {
    ArrayRef chunks;
    std::optional<ArrayRef> triangle_indices;
};

struct SchemaVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    std::string to_string() const;
    bool operator==(const SchemaVersion& other) const {
        return major == other.major && minor == other.minor && patch == other.patch;
    }
};

/**
 * Fields common to every triangle-mesh version.
 */
struct MeshObjectInfo {
    std::string name;
    std::optional<std::string> description;
    BoundingBox bounding_box;
    CoordinateReferenceSystem coordinate_reference_system;
};

struct TriangleMeshV1_0_0 : MeshObjectInfo {
    static constexpr SchemaVersion VERSION{1, 0, 0};

    ArrayRef vertices;
    ArrayRef indices;
    std::vector<AttributeRecord> vertex_attributes;
};

struct VertexBlock {
    ArrayRef data;
    std::vector<AttributeRecord> attributes;
};

struct IndexBlock {
    ArrayRef data;
    std::vector<AttributeRecord> attributes;
};

struct Triangles {
    VertexBlock vertices;
    IndexBlock indices;
};

struct TriangleMeshV2_0_0 : MeshObjectInfo {
    static constexpr SchemaVersion VERSION{2, 0, 0};

    Triangles triangles;
};

struct TriangleMeshV2_1_0 : MeshObjectInfo {
    static constexpr SchemaVersion VERSION{2, 1, 0};

    Triangles triangles;
    std::optional<PartsDescriptor> parts;
};

using TriangleMesh = std::variant<TriangleMeshV1_0_0, TriangleMeshV2_0_0, TriangleMeshV2_1_0>;
using LatestTriangleMesh = TriangleMeshV2_1_0;

/**
 * Schema id as written in object documents, e.g.
 * "/objects/triangle-mesh/2.1.0/triangle-mesh.schema.json".
 */
std::string triangle_mesh_schema_id(const SchemaVersion& version);
SchemaVersion schema_version_of(const TriangleMesh& mesh);
const MeshObjectInfo& object_info(const TriangleMesh& mesh);

} // namespace geomesh
