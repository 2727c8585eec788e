/**
 * GeoMesh Converter - Surface Exporter
 *
 * Canonical mesh -> surface element:
 *   normalize, resolve parts, materialize geometry, bind attributes
 *   (vertex entries first, then face entries), assemble.
 *
 * Every call loads its own tables and builds a fresh element. A failure in
 * any stage fails the whole element; nothing partial is returned.
 */

#pragma once

#include "result.hpp"
#include "mesh_schema.hpp"
#include "normalizer.hpp"
#include "surface_element.hpp"
#include "table_store.hpp"

#include <span>
#include <string>
#include <vector>

namespace geomesh {

struct ExportReport {
    SurfaceProject project;
    std::vector<FailedItem> failed;

    bool all_succeeded() const { return failed.empty(); }
};

class SurfaceExporter {
public:
    explicit SurfaceExporter(const TableStore& store);

    Result<SurfaceElement> export_mesh(const TriangleMesh& mesh) const;
    Result<SurfaceElement> export_mesh(const NormalizedMesh& mesh) const;

    /**
     * Export several meshes into one project. Meshes that fail are left
     * out and listed in the report; the rest are exported in order.
     */
    ExportReport export_meshes(std::span<const TriangleMesh> meshes, std::string project_name,
                               std::string project_description = "") const;

private:
    const TableStore& store_;
};

} // namespace geomesh
