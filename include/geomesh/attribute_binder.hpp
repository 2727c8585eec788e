/**
 * GeoMesh Converter - Attribute Binder
 *
 * Loads attribute values and binds them to the materialized geometry.
 * Vertex attributes pass through unchanged; face attributes are projected
 * with the same resolved row sequence as the triangles, so face value i
 * always belongs to output triangle i. NaN sentinels are carried as data.
 */

#pragma once

#include "result.hpp"
#include "mesh_schema.hpp"
#include "table_store.hpp"
#include "types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace geomesh {

struct Attribute {
    std::string name;
    std::string key;
    AttributeKind kind = AttributeKind::Continuous;
    DataLocation location = DataLocation::Vertices;
    DataArray values;
    std::vector<double> nan_values;
    std::vector<CategoryEntry> categories;   // Category only
};

Result<Attribute> load_attribute(const TableStore& store, const AttributeRecord& record, DataLocation location);
Result<std::vector<Attribute>> load_attributes(const TableStore& store, std::span<const AttributeRecord> records,
                                               DataLocation location);

/**
 * Bind the attributes at `location`; others are ignored.
 *
 * base_length is the vertex count for vertex attributes and the base
 * triangle count (before any parts selection) for face attributes. A value
 * count that differs fails with AttributeLengthMismatch. resolved_faces is
 * only used for face attributes.
 */
Result<std::vector<Attribute>> bind_attributes(std::span<const Attribute> attributes, DataLocation location,
                                               uint64_t base_length, std::span<const uint64_t> resolved_faces);

/**
 * values[rows[i]] for every i. Rows must be in range.
 */
DataArray project_values(const DataArray& values, std::span<const uint64_t> rows);

} // namespace geomesh
