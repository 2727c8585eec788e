/**
 * GeoMesh Converter - Surface Importer Implementation
 */

#include "geomesh/importer.hpp"
#include "geomesh/surface_file.hpp"
#include "geomesh/table_schemas.hpp"
#include "geomesh/logging.hpp"

#include <set>

namespace geomesh {

namespace {

ArrayRef make_array_ref(TableRef ref, uint64_t length, uint32_t width, std::string data_type) {
    ArrayRef array;
    array.data = std::move(ref);
    array.length = length;
    array.width = width;
    array.data_type = std::move(data_type);
    return array;
}

// "vertices/<name>", suffixed with "#n" when a location repeats a name
std::string make_key(DataLocation location, const std::string& name, std::set<std::string>& used) {
    std::string base = std::string(location_name(location)) + "/" + name;
    std::string key = base;
    for (int n = 2; !used.insert(key).second; ++n) {
        key = base + "#" + std::to_string(n);
    }
    return key;
}

Result<void> check_element(const SurfaceElement& element, const SurfaceGeometry& surface) {
    const uint64_t vertex_count = surface.vertices.size();
    for (size_t row = 0; row < surface.triangles.size(); ++row) {
        const auto& tri = surface.triangles[row];
        for (int c = 0; c < 3; ++c) {
            if (tri[c] >= vertex_count) {
                return Error::index_out_of_range(
                    "Triangle " + std::to_string(row) + " refers to vertex " + std::to_string(tri[c])
                    + " of " + std::to_string(vertex_count));
            }
        }
    }

    for (const auto& data : element.data) {
        const uint64_t expected = data.location == DataLocation::Vertices
            ? vertex_count : static_cast<uint64_t>(surface.triangles.size());
        const uint64_t count = data_array_size(data.array);
        if (count != expected) {
            return Error::attribute_length_mismatch(
                std::string(location_name(data.location)) + " data has " + std::to_string(count)
                + " values, expected " + std::to_string(expected), data.name);
        }
        if (data.is_category() && !std::holds_alternative<std::vector<int64_t>>(data.array)) {
            return Error::invalid_format("Category data must hold integer keys", data.name);
        }
    }
    return Result<void>::success();
}

} // namespace

SurfaceImporter::SurfaceImporter(TableStore& store, ImportOptions options)
    : store_(store)
    , options_(options) {
}

Result<AttributeRecord> SurfaceImporter::save_data(const SurfaceData& data, const std::string& key) const {
    AttributeRecord attr;
    attr.schema = AttributeSchema::V1_1_0;
    attr.name = data.name;
    attr.key = key;
    const uint64_t count = data_array_size(data.array);

    if (data.is_category()) {
        attr.kind = AttributeKind::Category;
        const auto& keys = std::get<std::vector<int64_t>>(data.array);
        Table key_table = make_category_key_table(keys);
        TRY_ASSIGN(values_ref, store_.save(key_table));
        attr.values = make_array_ref(values_ref, count, 1, column_type_name(key_table.column(0).type()));

        TRY_ASSIGN(lookup_ref, store_.save(make_lookup_table(data.legend)));
        attr.lookup_table = make_array_ref(lookup_ref, data.legend.size(), 2, "lookup");
    } else if (std::holds_alternative<std::vector<int64_t>>(data.array)) {
        attr.kind = AttributeKind::Integer;
        TRY_ASSIGN(values_ref, store_.save(make_value_table(data.array)));
        attr.values = make_array_ref(values_ref, count, 1, "int64");
    } else {
        attr.kind = AttributeKind::Continuous;
        TRY_ASSIGN(values_ref, store_.save(make_value_table(data.array)));
        attr.values = make_array_ref(values_ref, count, 1, "float64");
    }
    return attr;
}

Result<LatestTriangleMesh> SurfaceImporter::import_element(const SurfaceElement& element) const {
    const auto* surface = std::get_if<SurfaceGeometry>(&element.geometry);
    if (!surface) {
        return Error::unsupported_geometry_type(geometry_type_name(element.geometry), element.name);
    }

    auto valid = check_element(element, *surface);
    if (!valid) {
        return valid.error().with_context(element.name);
    }

    LatestTriangleMesh mesh;
    mesh.name = element.name;
    mesh.description = element.description;
    mesh.bounding_box = BoundingBox::from_vertices(surface->vertices);
    mesh.coordinate_reference_system.epsg_code = options_.epsg_code;

    auto vertices_ref = store_.save(make_vertex_table(surface->vertices));
    if (!vertices_ref) return vertices_ref.error().with_context(element.name);
    auto triangles_ref = store_.save(make_triangle_table(surface->triangles));
    if (!triangles_ref) return triangles_ref.error().with_context(element.name);

    mesh.triangles.vertices.data = make_array_ref(*vertices_ref, surface->vertices.size(), 3, "float64");
    mesh.triangles.indices.data = make_array_ref(*triangles_ref, surface->triangles.size(), 3, "uint64");

    std::set<std::string> used_keys;
    for (const auto& data : element.data) {
        auto attr = save_data(data, make_key(data.location, data.name, used_keys));
        if (!attr) {
            return attr.error().with_context(element.name + "/" + data.name);
        }
        auto& target = data.location == DataLocation::Vertices
            ? mesh.triangles.vertices.attributes
            : mesh.triangles.indices.attributes;
        target.push_back(std::move(*attr));
    }

    LOG_INFO("Importer", "Imported '" << mesh.name << "': " << surface->vertices.size() << " vertices, "
             << surface->triangles.size() << " triangles, "
             << mesh.triangles.vertices.attributes.size() << " vertex / "
             << mesh.triangles.indices.attributes.size() << " face attributes");
    return mesh;
}

ImportReport SurfaceImporter::import_project(const SurfaceProject& project) const {
    ImportReport report;

    for (const auto& element : project.elements) {
        auto mesh = import_element(element);
        if (!mesh) {
            LOG_WARNING("Importer", "Skipping element '" << element.name << "': "
                        << error_code_name(mesh.code()) << ": " << mesh.error().full_message());
            report.skipped.push_back({element.name, mesh.error()});
            continue;
        }
        report.meshes.push_back(std::move(*mesh));
    }
    report.skipped.insert(report.skipped.end(), project.unreadable.begin(), project.unreadable.end());

    LOG_INFO("Importer", "Project '" << project.name << "': " << report.meshes.size() << " imported, "
             << report.skipped.size() << " skipped");
    return report;
}

Result<ImportReport> SurfaceImporter::import_file(const std::filesystem::path& path) const {
    TRY_ASSIGN(project, read_surface_file(path));
    return import_project(project);
}

} // namespace geomesh
