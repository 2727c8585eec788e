/**
 * GeoMesh Converter - Geometry Materializer Implementation
 */

#include "geomesh/geometry_materializer.hpp"
#include "geomesh/table_schemas.hpp"
#include "geomesh/logging.hpp"

namespace geomesh {

Result<MeshGeometry> load_base_geometry(const TableStore& store, const TableRef& vertices,
                                        const TableRef& triangles) {
    TRY_ASSIGN(vertex_table, store.load(vertices));
    TRY_ASSIGN(triangle_table, store.load(triangles));

    auto vertex_set = read_vertex_table(vertex_table);
    if (!vertex_set) {
        return vertex_set.error().with_context("vertices");
    }
    auto triangle_set = read_triangle_table(triangle_table);
    if (!triangle_set) {
        return triangle_set.error().with_context("triangles");
    }

    const uint64_t vertex_count = vertex_set->size();
    for (size_t row = 0; row < triangle_set->size(); ++row) {
        const auto& tri = (*triangle_set)[row];
        for (int c = 0; c < 3; ++c) {
            if (tri[c] >= vertex_count) {
                return Error::index_out_of_range(
                    "Triangle " + std::to_string(row) + " refers to vertex " + std::to_string(tri[c])
                    + " of " + std::to_string(vertex_count), "triangles");
            }
        }
    }

    return MeshGeometry{std::move(*vertex_set), std::move(*triangle_set)};
}

Result<MeshGeometry> project_geometry(const MeshGeometry& base, std::span<const uint64_t> resolved) {
    MeshGeometry out;
    out.vertices = base.vertices;
    out.triangles.reserve(resolved.size());

    for (uint64_t row : resolved) {
        if (row >= base.triangles.size()) {
            return Error::index_out_of_range(
                "Resolved row " + std::to_string(row) + " exceeds " + std::to_string(base.triangles.size())
                + " base triangles");
        }
        out.triangles.push_back(base.triangles[row]);
    }
    return out;
}

Result<MeshGeometry> materialize(const TableStore& store, const TableRef& vertices,
                                 const TableRef& triangles, std::span<const uint64_t> resolved) {
    TRY_ASSIGN(base, load_base_geometry(store, vertices, triangles));
    auto geometry = project_geometry(base, resolved);
    if (geometry) {
        LOG_DEBUG("Materializer", base.triangles.size() << " base triangles -> "
                  << geometry->triangles.size() << ", " << geometry->vertices.size() << " vertices");
    }
    return geometry;
}

} // namespace geomesh
