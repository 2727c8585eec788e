/**
 * GeoMesh Converter - Surface Importer
 *
 * Surface element -> canonical mesh at the latest schema version, without
 * parts. Geometry and every data array are saved to the table store and
 * referenced from the returned mesh.
 */

#pragma once

#include "result.hpp"
#include "mesh_schema.hpp"
#include "surface_element.hpp"
#include "table_store.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace geomesh {

struct ImportOptions {
    std::optional<int> epsg_code;   // CRS of imported meshes; unspecified if empty
};

struct ImportReport {
    std::vector<LatestTriangleMesh> meshes;
    std::vector<FailedItem> skipped;

    bool all_succeeded() const { return skipped.empty(); }
};

class SurfaceImporter {
public:
    explicit SurfaceImporter(TableStore& store, ImportOptions options = {});

    /**
     * Import one element. Fails with UnsupportedGeometryType for anything
     * that is not a surface, IndexOutOfRange for triangles referring to
     * missing vertices and AttributeLengthMismatch for data arrays that do
     * not match their location.
     */
    Result<LatestTriangleMesh> import_element(const SurfaceElement& element) const;

    /**
     * Import every element. Failing elements are skipped and reported;
     * the remaining ones are still imported. Elements the file reader
     * could not decode are reported as skipped too.
     */
    ImportReport import_project(const SurfaceProject& project) const;

    Result<ImportReport> import_file(const std::filesystem::path& path) const;

private:
    Result<AttributeRecord> save_data(const SurfaceData& data, const std::string& key) const;

    TableStore& store_;
    ImportOptions options_;
};

} // namespace geomesh
