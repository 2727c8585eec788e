/**
 * GeoMesh Converter - Geometry Materializer
 *
 * Builds the concrete vertex and triangle sets for a resolved triangle
 * selection. Vertices are always returned in full and unchanged; triangle
 * vertex indices are passed through without compaction.
 */

#pragma once

#include "result.hpp"
#include "table_store.hpp"
#include "types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace geomesh {

struct MeshGeometry {
    VertexSet vertices;
    TriangleSet triangles;
};

/**
 * Load the base vertex and triangle tables. Fails with IndexOutOfRange if
 * a triangle refers to a vertex that does not exist.
 */
Result<MeshGeometry> load_base_geometry(const TableStore& store, const TableRef& vertices,
                                        const TableRef& triangles);

/**
 * Triangle rows of base at the resolved positions, in order, duplicates kept.
 */
Result<MeshGeometry> project_geometry(const MeshGeometry& base, std::span<const uint64_t> resolved);

Result<MeshGeometry> materialize(const TableStore& store, const TableRef& vertices,
                                 const TableRef& triangles, std::span<const uint64_t> resolved);

} // namespace geomesh
