/**
 * GeoMesh Converter - Table Schemas
 *
 * Builders and readers for the table layouts the canonical mesh refers to.
 * Readers check the column layout and fail with InvalidFormat on anything
 * unexpected; narrower column types (float32, uint32) are widened.
 */

#pragma once

#include "result.hpp"
#include "table.hpp"
#include "types.hpp"

#include <vector>

namespace geomesh {

/**
 * Chunk of a base triangle stream.
 */
struct Chunk {
    uint64_t start_segment_index = 0;
    uint64_t number_of_segments = 0;
};

// vertices: x, y, z (float64)
Table make_vertex_table(const VertexSet& vertices);
Result<VertexSet> read_vertex_table(const Table& table);

// triangles: n0, n1, n2 (uint64)
Table make_triangle_table(const TriangleSet& triangles);
Result<TriangleSet> read_triangle_table(const Table& table);

// chunks: start_segment_index, number_of_segments (uint64)
Table make_chunk_table(const std::vector<Chunk>& chunks);
Result<std::vector<Chunk>> read_chunk_table(const Table& table);

// single index column: index (uint64)
Table make_index_table(const std::vector<uint64_t>& indices);
Result<std::vector<uint64_t>> read_index_table(const Table& table);

/**
 * Attribute values: one "value" column. Continuous values are stored as
 * float64, integer values as int64 and category keys as int32.
 */
Table make_value_table(const DataArray& values);
Table make_category_key_table(const std::vector<int64_t>& keys);
Result<DataArray> read_value_table(const Table& table);

// category lookup: key (int32), value (string)
Table make_lookup_table(const std::vector<CategoryEntry>& entries);
Result<std::vector<CategoryEntry>> read_lookup_table(const Table& table);

} // namespace geomesh
