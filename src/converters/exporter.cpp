/**
 * GeoMesh Converter - Surface Exporter Implementation
 */

#include "geomesh/exporter.hpp"
#include "geomesh/attribute_binder.hpp"
#include "geomesh/geometry_materializer.hpp"
#include "geomesh/parts_resolver.hpp"
#include "geomesh/logging.hpp"

namespace geomesh {

namespace {

SurfaceData to_surface_data(Attribute attr) {
    SurfaceData data;
    data.location = attr.location;
    data.name = std::move(attr.name);
    data.array = std::move(attr.values);
    if (attr.kind == AttributeKind::Category) {
        data.legend = std::move(attr.categories);
    }
    return data;
}

} // namespace

SurfaceExporter::SurfaceExporter(const TableStore& store)
    : store_(store) {
}

Result<SurfaceElement> SurfaceExporter::export_mesh(const TriangleMesh& mesh) const {
    return export_mesh(normalize(mesh));
}

Result<SurfaceElement> SurfaceExporter::export_mesh(const NormalizedMesh& mesh) const {
    auto fail = [&](const Error& error) { return error.with_context(mesh.name); };

    auto base = load_base_geometry(store_, mesh.vertices.data, mesh.triangles.data);
    if (!base) return fail(base.error());
    const uint64_t vertex_count = base->vertices.size();
    const uint64_t base_triangle_count = base->triangles.size();

    std::optional<PartsSelection> parts;
    if (mesh.parts) {
        auto loaded = load_parts(store_, *mesh.parts);
        if (!loaded) return fail(loaded.error());
        parts = std::move(*loaded);
    }

    auto resolved = resolve_parts(parts, base_triangle_count);
    if (!resolved) return fail(resolved.error());

    auto geometry = project_geometry(*base, *resolved);
    if (!geometry) return fail(geometry.error());

    auto vertex_attributes = load_attributes(store_, mesh.vertex_attributes, DataLocation::Vertices);
    if (!vertex_attributes) return fail(vertex_attributes.error());
    auto face_attributes = load_attributes(store_, mesh.face_attributes, DataLocation::Faces);
    if (!face_attributes) return fail(face_attributes.error());

    auto vertex_data = bind_attributes(*vertex_attributes, DataLocation::Vertices, vertex_count, *resolved);
    if (!vertex_data) return fail(vertex_data.error());
    auto face_data = bind_attributes(*face_attributes, DataLocation::Faces, base_triangle_count, *resolved);
    if (!face_data) return fail(face_data.error());

    SurfaceElement element;
    element.name = mesh.name;
    element.description = mesh.description.value_or("");
    element.geometry = SurfaceGeometry{std::move(geometry->vertices), std::move(geometry->triangles)};

    element.data.reserve(vertex_data->size() + face_data->size());
    for (auto& attr : *vertex_data) {
        element.data.push_back(to_surface_data(std::move(attr)));
    }
    for (auto& attr : *face_data) {
        element.data.push_back(to_surface_data(std::move(attr)));
    }

    LOG_INFO("Exporter", "Exported '" << element.name << "' (v" << mesh.source_version.to_string() << "): "
             << vertex_count << " vertices, " << resolved->size() << " triangles, "
             << element.data.size() << " data arrays");
    return element;
}

ExportReport SurfaceExporter::export_meshes(std::span<const TriangleMesh> meshes, std::string project_name,
                                            std::string project_description) const {
    ExportReport report;
    report.project.name = std::move(project_name);
    report.project.description = std::move(project_description);

    for (const auto& mesh : meshes) {
        auto element = export_mesh(mesh);
        if (!element) {
            const auto& name = object_info(mesh).name;
            LOG_ERROR("Exporter", "Skipping '" << name << "': " << error_code_name(element.code())
                      << ": " << element.error().full_message());
            report.failed.push_back({name, element.error()});
            continue;
        }
        report.project.elements.push_back(std::move(*element));
    }

    LOG_INFO("Exporter", "Project '" << report.project.name << "': " << report.project.elements.size()
             << " exported, " << report.failed.size() << " failed");
    return report;
}

} // namespace geomesh
