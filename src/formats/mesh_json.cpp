/**
 * GeoMesh Converter - Canonical Object Documents Implementation
 */

#include "geomesh/mesh_json.hpp"
#include "geomesh/logging.hpp"

#include <fstream>
#include <type_traits>

namespace geomesh {

using nlohmann::json;

namespace {

// ============================================================================
// Reading
// ============================================================================

ArrayRef parse_array_ref(const json& j) {
    ArrayRef ref;
    ref.data.id = j.at("data").get<std::string>();
    ref.length = j.at("length").get<uint64_t>();
    ref.width = j.value("width", 1u);
    ref.data_type = j.value("data_type", std::string());
    return ref;
}

Result<AttributeRecord> parse_attribute(const json& j) {
    AttributeRecord attr;
    attr.name = j.at("name").get<std::string>();

    const std::string type = j.at("attribute_type").get<std::string>();
    auto kind = parse_attribute_type(type);
    if (!kind) {
        return Error::unsupported_schema_version("attribute_type '" + type + "'", attr.name);
    }
    attr.kind = *kind;

    if (j.contains("key")) {
        attr.schema = AttributeSchema::V1_1_0;
        attr.key = j["key"].get<std::string>();
    } else {
        attr.schema = AttributeSchema::V1_0_1;
    }

    attr.values = parse_array_ref(j.at("values"));
    if (attr.kind == AttributeKind::Category) {
        attr.lookup_table = parse_array_ref(j.at("table"));
    }
    if (j.contains("nan_description")) {
        attr.nan_values = j["nan_description"].at("values").get<std::vector<double>>();
    }
    return attr;
}

Result<std::vector<AttributeRecord>> parse_attributes(const json& parent, const char* field) {
    std::vector<AttributeRecord> attributes;
    if (!parent.contains(field) || parent[field].is_null()) {
        return attributes;
    }
    for (const auto& item : parent[field]) {
        TRY_ASSIGN(attr, parse_attribute(item));
        attributes.push_back(std::move(attr));
    }
    return attributes;
}

void parse_object_info(const json& doc, MeshObjectInfo& info) {
    info.name = doc.at("name").get<std::string>();
    if (doc.contains("description") && !doc["description"].is_null()) {
        info.description = doc["description"].get<std::string>();
    }

    if (doc.contains("bounding_box")) {
        const auto& b = doc["bounding_box"];
        info.bounding_box.min_x = b.at("min_x").get<double>();
        info.bounding_box.max_x = b.at("max_x").get<double>();
        info.bounding_box.min_y = b.at("min_y").get<double>();
        info.bounding_box.max_y = b.at("max_y").get<double>();
        info.bounding_box.min_z = b.at("min_z").get<double>();
        info.bounding_box.max_z = b.at("max_z").get<double>();
    }

    if (doc.contains("coordinate_reference_system")) {
        const auto& crs = doc["coordinate_reference_system"];
        if (crs.is_object()) {
            if (crs.contains("epsg_code")) {
                info.coordinate_reference_system.epsg_code = crs["epsg_code"].get<int>();
            }
            if (crs.contains("ogc_wkt")) {
                info.coordinate_reference_system.ogc_wkt = crs["ogc_wkt"].get<std::string>();
            }
        }
    }
}

Result<Triangles> parse_triangles(const json& doc) {
    const auto& t = doc.at("triangles");
    Triangles triangles;

    triangles.vertices.data = parse_array_ref(t.at("vertices"));
    TRY_ASSIGN(vertex_attributes, parse_attributes(t["vertices"], "attributes"));
    triangles.vertices.attributes = std::move(vertex_attributes);

    triangles.indices.data = parse_array_ref(t.at("indices"));
    TRY_ASSIGN(face_attributes, parse_attributes(t["indices"], "attributes"));
    triangles.indices.attributes = std::move(face_attributes);

    return triangles;
}

Result<TriangleMesh> parse_v1_0_0(const json& doc) {
    TriangleMeshV1_0_0 mesh;
    parse_object_info(doc, mesh);
    mesh.vertices = parse_array_ref(doc.at("vertices"));
    mesh.indices = parse_array_ref(doc.at("indices"));
    TRY_ASSIGN(attributes, parse_attributes(doc, "vertex_attributes"));
    mesh.vertex_attributes = std::move(attributes);
    return TriangleMesh(std::move(mesh));
}

Result<TriangleMesh> parse_v2_0_0(const json& doc) {
    TriangleMeshV2_0_0 mesh;
    parse_object_info(doc, mesh);
    TRY_ASSIGN(triangles, parse_triangles(doc));
    mesh.triangles = std::move(triangles);
    return TriangleMesh(std::move(mesh));
}

Result<TriangleMesh> parse_v2_1_0(const json& doc) {
    TriangleMeshV2_1_0 mesh;
    parse_object_info(doc, mesh);
    TRY_ASSIGN(triangles, parse_triangles(doc));
    mesh.triangles = std::move(triangles);

    if (doc.contains("parts") && !doc["parts"].is_null()) {
        const auto& p = doc["parts"];
        PartsDescriptor parts;
        parts.chunks = parse_array_ref(p.at("chunks"));
        if (p.contains("triangle_indices") && !p["triangle_indices"].is_null()) {
            parts.triangle_indices = parse_array_ref(p["triangle_indices"]);
        }
        mesh.parts = std::move(parts);
    }
    return TriangleMesh(std::move(mesh));
}

// ============================================================================
// Writing
// ============================================================================

json array_ref_to_json(const ArrayRef& ref) {
    json j;
    j["data"] = ref.data.id;
    j["length"] = ref.length;
    j["width"] = ref.width;
    if (!ref.data_type.empty()) {
        j["data_type"] = ref.data_type;
    }
    return j;
}

json attribute_to_json(const AttributeRecord& attr) {
    json j;
    j["name"] = attr.name;
    if (attr.schema == AttributeSchema::V1_1_0) {
        j["key"] = attr.key;
    }
    j["attribute_type"] = attribute_type_name(attr.kind);
    j["values"] = array_ref_to_json(attr.values);
    if (attr.lookup_table) {
        j["table"] = array_ref_to_json(*attr.lookup_table);
    }
    j["nan_description"] = {{"values", attr.nan_values}};
    return j;
}

json attributes_to_json(const std::vector<AttributeRecord>& attributes) {
    json list = json::array();
    for (const auto& attr : attributes) {
        list.push_back(attribute_to_json(attr));
    }
    return list;
}

void object_info_to_json(const MeshObjectInfo& info, json& doc) {
    doc["name"] = info.name;
    doc["description"] = info.description ? json(*info.description) : json(nullptr);

    const auto& b = info.bounding_box;
    doc["bounding_box"] = {
        {"min_x", b.min_x}, {"max_x", b.max_x},
        {"min_y", b.min_y}, {"max_y", b.max_y},
        {"min_z", b.min_z}, {"max_z", b.max_z}
    };

    const auto& crs = info.coordinate_reference_system;
    if (crs.epsg_code) {
        doc["coordinate_reference_system"] = {{"epsg_code", *crs.epsg_code}};
    } else if (!crs.ogc_wkt.empty()) {
        doc["coordinate_reference_system"] = {{"ogc_wkt", crs.ogc_wkt}};
    } else {
        doc["coordinate_reference_system"] = "unspecified";
    }
}

json triangles_to_json(const Triangles& triangles) {
    json vertices = array_ref_to_json(triangles.vertices.data);
    vertices["attributes"] = attributes_to_json(triangles.vertices.attributes);

    json indices = array_ref_to_json(triangles.indices.data);
    indices["attributes"] = attributes_to_json(triangles.indices.attributes);

    return {{"vertices", vertices}, {"indices", indices}};
}

} // namespace

Result<TriangleMesh> parse_triangle_mesh(const json& document) {
    if (!document.is_object() || !document.contains("schema") || !document["schema"].is_string()) {
        return Error::invalid_format("Object document has no schema id");
    }

    const std::string schema = document["schema"].get<std::string>();
    try {
        if (schema == triangle_mesh_schema_id(TriangleMeshV1_0_0::VERSION)) {
            return parse_v1_0_0(document);
        }
        if (schema == triangle_mesh_schema_id(TriangleMeshV2_0_0::VERSION)) {
            return parse_v2_0_0(document);
        }
        if (schema == triangle_mesh_schema_id(TriangleMeshV2_1_0::VERSION)) {
            return parse_v2_1_0(document);
        }
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Malformed object document: ") + e.what(), schema);
    }

    return Error::unsupported_schema_version(schema);
}

json triangle_mesh_to_json(const TriangleMesh& mesh) {
    json doc;
    doc["schema"] = triangle_mesh_schema_id(schema_version_of(mesh));
    object_info_to_json(object_info(mesh), doc);

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, TriangleMeshV1_0_0>) {
            doc["vertices"] = array_ref_to_json(m.vertices);
            doc["indices"] = array_ref_to_json(m.indices);
            doc["vertex_attributes"] = attributes_to_json(m.vertex_attributes);
        } else {
            doc["triangles"] = triangles_to_json(m.triangles);
        }
        if constexpr (std::is_same_v<T, TriangleMeshV2_1_0>) {
            if (m.parts) {
                json parts;
                parts["chunks"] = array_ref_to_json(m.parts->chunks);
                if (m.parts->triangle_indices) {
                    parts["triangle_indices"] = array_ref_to_json(*m.parts->triangle_indices);
                }
                doc["parts"] = parts;
            }
        }
    }, mesh);

    return doc;
}

Result<TriangleMesh> load_triangle_mesh(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error::io_error("Failed to open object document", path.string());
    }

    json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return Error::invalid_format("Object document is not valid JSON", path.string());
    }

    auto mesh = parse_triangle_mesh(document);
    if (!mesh) {
        return mesh.error().with_context(path.filename().string());
    }
    LOG_DEBUG("MeshJson", "Loaded " << path.string() << " ("
              << triangle_mesh_schema_id(schema_version_of(*mesh)) << ")");
    return mesh;
}

Result<void> save_triangle_mesh(const std::filesystem::path& path, const TriangleMesh& mesh) {
    std::ofstream file(path);
    if (!file) {
        return Error::io_error("Failed to create object document", path.string());
    }

    file << triangle_mesh_to_json(mesh).dump(2) << '\n';
    if (!file) {
        return Error::io_error("Failed to write object document", path.string());
    }
    return Result<void>::success();
}

} // namespace geomesh
