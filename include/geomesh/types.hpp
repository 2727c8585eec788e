/**
 * GeoMesh Converter - Common types and definitions
 */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <filesystem>

namespace geomesh {

namespace fs = std::filesystem;

// Canonical geometry: float64 coordinates, uint64 vertex indices
using VertexSet = std::vector<glm::dvec3>;
using TriangleSet = std::vector<glm::u64vec3>;

/**
 * Opaque handle to a table held by a TableStore.
 * Copying a reference never copies or owns the table.
 */
struct TableRef {
    std::string id;

    bool empty() const { return id.empty(); }
    bool operator==(const TableRef& other) const { return id == other.id; }
    bool operator!=(const TableRef& other) const { return id != other.id; }
};

/**
 * Where an attribute or data array is attached.
 */
enum class DataLocation {
    Vertices,
    Faces
};

constexpr const char* location_name(DataLocation location) {
    return location == DataLocation::Vertices ? "vertices" : "faces";
}

inline std::optional<DataLocation> parse_location(std::string_view name) {
    if (name == "vertices") return DataLocation::Vertices;
    if (name == "faces") return DataLocation::Faces;
    return std::nullopt;
}

/**
 * Attribute values in memory. Continuous values are float64; integer and
 * category keys are int64.
 */
using DataArray = std::variant<std::vector<double>, std::vector<int64_t>>;

inline size_t data_array_size(const DataArray& array) {
    return std::visit([](const auto& values) { return values.size(); }, array);
}

/**
 * Category legend entry (key to label).
 */
struct CategoryEntry {
    int64_t key = 0;
    std::string label;

    bool operator==(const CategoryEntry& other) const {
        return key == other.key && label == other.label;
    }
};

/**
 * Axis-aligned bounds of a vertex set.
 */
struct BoundingBox {
    double min_x = 0.0, max_x = 0.0;
    double min_y = 0.0, max_y = 0.0;
    double min_z = 0.0, max_z = 0.0;

    static BoundingBox from_vertices(const VertexSet& vertices);
};

/**
 * Coordinate reference system. Only the EPSG code is interpreted; an empty
 * value means "unspecified".
 */
struct CoordinateReferenceSystem {
    std::optional<int> epsg_code;
    std::string ogc_wkt;

    bool unspecified() const { return !epsg_code && ogc_wkt.empty(); }
};

} // namespace geomesh
