/**
 * GeoMesh Converter - Surface File Container Implementation
 *
 * Layout (FORM/IFF-based, chunk sizes big-endian):
 * - FORM header with GMSX type
 * - HEAD chunk (format version, element count)
 * - DATA chunk (zlib-compressed arrays)
 * - INDX chunk (zlib-compressed JSON directory)
 */

#include "geomesh/surface_file.hpp"
#include "geomesh/byte_io.hpp"
#include "geomesh/compression.hpp"
#include "geomesh/files.hpp"
#include "geomesh/logging.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace geomesh {

using nlohmann::json;

const char* geometry_type_name(const ElementGeometry& geometry) {
    struct Visitor {
        const char* operator()(const SurfaceGeometry&) const { return "surface"; }
        const char* operator()(const PointSetGeometry&) const { return "pointset"; }
        const char* operator()(const LineSetGeometry&) const { return "lineset"; }
        const char* operator()(const UnknownGeometry& g) const { return g.type.c_str(); }
    };
    return std::visit(Visitor{}, geometry);
}

namespace {

constexpr std::array<char, 4> FORM_SIGNATURE = {'F', 'O', 'R', 'M'};
constexpr std::array<char, 4> GMSX_TYPE = {'G', 'M', 'S', 'X'};
constexpr std::array<char, 4> HEAD_CHUNK = {'H', 'E', 'A', 'D'};
constexpr std::array<char, 4> DATA_CHUNK = {'D', 'A', 'T', 'A'};
constexpr std::array<char, 4> INDX_CHUNK = {'I', 'N', 'D', 'X'};

bool tag_equals(std::span<const uint8_t> bytes, const std::array<char, 4>& tag) {
    return bytes.size() == 4 && std::memcmp(bytes.data(), tag.data(), 4) == 0;
}

std::string_view tag_view(const std::array<char, 4>& tag) {
    return std::string_view(tag.data(), tag.size());
}

size_t dtype_size(const std::string& dtype) {
    if (dtype == "float64" || dtype == "uint64" || dtype == "int64") return 8;
    if (dtype == "float32" || dtype == "uint32" || dtype == "int32") return 4;
    return 0;
}

// ============================================================================
// Writing
// ============================================================================

/**
 * Accumulates the DATA chunk payload and hands out array descriptors.
 */
class ArrayWriter {
public:
    explicit ArrayWriter(int level) : level_(level) {}

    json add(const std::vector<uint8_t>& raw, const char* dtype, uint64_t length, uint32_t width) {
        json desc;
        desc["offset"] = payload_.size();
        desc["size"] = raw.size();
        desc["dtype"] = dtype;
        desc["length"] = length;
        desc["width"] = width;

        if (raw.empty()) {
            desc["compressed_size"] = 0;
            return desc;
        }

        auto compressed = compress_zlib(raw, level_);
        desc["compressed_size"] = compressed.size();
        payload_.insert(payload_.end(), compressed.begin(), compressed.end());
        return desc;
    }

    const std::vector<uint8_t>& payload() const { return payload_; }

private:
    int level_;
    std::vector<uint8_t> payload_;
};

json write_vertices(ArrayWriter& arrays, const VertexSet& vertices) {
    ByteWriter out;
    for (const auto& v : vertices) {
        out.put_le(v.x);
        out.put_le(v.y);
        out.put_le(v.z);
    }
    return arrays.add(out.buffer(), "float64", vertices.size(), 3);
}

// Index arrays are written as uint32 when every index fits.
template<typename Vec>
json write_indices(ArrayWriter& arrays, const std::vector<Vec>& items) {
    constexpr int WIDTH = Vec::length();

    uint64_t max_index = 0;
    for (const auto& item : items) {
        for (int c = 0; c < WIDTH; ++c) {
            max_index = std::max<uint64_t>(max_index, item[c]);
        }
    }

    ByteWriter out;
    const bool narrow = max_index <= std::numeric_limits<uint32_t>::max();
    for (const auto& item : items) {
        for (int c = 0; c < WIDTH; ++c) {
            if (narrow) {
                out.put_le(static_cast<uint32_t>(item[c]));
            } else {
                out.put_le(static_cast<uint64_t>(item[c]));
            }
        }
    }
    return arrays.add(out.buffer(), narrow ? "uint32" : "uint64", items.size(), WIDTH);
}

json write_geometry(ArrayWriter& arrays, const ElementGeometry& geometry) {
    json g;
    g["type"] = geometry_type_name(geometry);

    if (const auto* surface = std::get_if<SurfaceGeometry>(&geometry)) {
        g["vertices"] = write_vertices(arrays, surface->vertices);
        g["triangles"] = write_indices(arrays, surface->triangles);
    } else if (const auto* points = std::get_if<PointSetGeometry>(&geometry)) {
        g["vertices"] = write_vertices(arrays, points->vertices);
    } else if (const auto* lines = std::get_if<LineSetGeometry>(&geometry)) {
        g["vertices"] = write_vertices(arrays, lines->vertices);
        g["segments"] = write_indices(arrays, lines->segments);
    }
    return g;
}

json write_data(ArrayWriter& arrays, const SurfaceData& data) {
    json d;
    d["location"] = location_name(data.location);
    d["name"] = data.name;

    ByteWriter out;
    const char* dtype = std::visit([&](const auto& values) {
        for (const auto& v : values) {
            out.put_le(v);
        }
        using V = typename std::decay_t<decltype(values)>::value_type;
        return std::is_same_v<V, double> ? "float64" : "int64";
    }, data.array);
    d["array"] = arrays.add(out.buffer(), dtype, data_array_size(data.array), 1);

    if (!data.legend.empty()) {
        json legend = json::array();
        for (const auto& entry : data.legend) {
            legend.push_back({{"key", entry.key}, {"label", entry.label}});
        }
        d["legend"] = legend;
    }
    return d;
}

void write_chunk(ByteWriter& out, const std::array<char, 4>& tag, const std::vector<uint8_t>& payload) {
    out.put_tag(tag_view(tag));
    out.put_u32_be(static_cast<uint32_t>(payload.size()));
    out.put_bytes(payload.data(), payload.size());
}

// ============================================================================
// Reading
// ============================================================================

struct ArrayBlock {
    std::string dtype;
    uint64_t length = 0;
    uint32_t width = 1;
    std::vector<uint8_t> raw;
};

class ArrayReader {
public:
    explicit ArrayReader(std::span<const uint8_t> payload) : payload_(payload) {}

    Result<ArrayBlock> read(const json& desc, const std::string& what) const {
        ArrayBlock block;
        block.dtype = desc.at("dtype").get<std::string>();
        block.length = desc.at("length").get<uint64_t>();
        block.width = desc.value("width", 1u);
        const uint64_t offset = desc.at("offset").get<uint64_t>();
        const uint64_t compressed_size = desc.at("compressed_size").get<uint64_t>();
        const uint64_t size = desc.at("size").get<uint64_t>();

        const size_t element_size = dtype_size(block.dtype);
        if (element_size == 0) {
            return Error::invalid_format("Unknown array dtype '" + block.dtype + "'", what);
        }
        if (block.width == 0 ||
            block.length > size / element_size / block.width ||
            block.length * block.width * element_size != size) {
            return Error::invalid_format("Array size does not match its shape", what);
        }
        if (offset > payload_.size() || compressed_size > payload_.size() - offset) {
            return Error::invalid_format("Array lies outside the DATA chunk", what);
        }
        if (size == 0) {
            return block;
        }

        try {
            block.raw = decompress_zlib(payload_.data() + offset, compressed_size, size);
        } catch (const std::exception& e) {
            return Error::compression_error(what + ": " + e.what());
        }
        return block;
    }

private:
    std::span<const uint8_t> payload_;
};

// Reads one element of any supported dtype, converted to Out.
template<typename Out>
bool read_value(ByteReader& in, const std::string& dtype, Out& out) {
    if (dtype == "float64") { double v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    if (dtype == "float32") { float v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    if (dtype == "uint64") { uint64_t v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    if (dtype == "uint32") { uint32_t v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    if (dtype == "int64") { int64_t v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    if (dtype == "int32") { int32_t v; if (!in.get_le(v)) return false; out = static_cast<Out>(v); return true; }
    return false;
}

Result<VertexSet> to_vertices(const ArrayBlock& block, const std::string& what) {
    if (block.width != 3 || (block.dtype != "float64" && block.dtype != "float32")) {
        return Error::invalid_format("Vertices must be float32/float64 with width 3, found "
                                     + block.dtype + " x" + std::to_string(block.width), what);
    }

    VertexSet vertices(block.length);
    ByteReader in(block.raw);
    for (auto& v : vertices) {
        if (!read_value(in, block.dtype, v.x) || !read_value(in, block.dtype, v.y) ||
            !read_value(in, block.dtype, v.z)) {
            return Error::invalid_format("Truncated vertex array", what);
        }
    }
    return vertices;
}

template<typename Vec>
Result<std::vector<Vec>> to_indices(const ArrayBlock& block, const std::string& what) {
    constexpr int WIDTH = Vec::length();
    if (block.width != static_cast<uint32_t>(WIDTH) || (block.dtype != "uint32" && block.dtype != "uint64")) {
        return Error::invalid_format("Index array must be uint32/uint64 with width " + std::to_string(WIDTH)
                                     + ", found " + block.dtype + " x" + std::to_string(block.width), what);
    }

    std::vector<Vec> items(block.length);
    ByteReader in(block.raw);
    for (auto& item : items) {
        for (int c = 0; c < WIDTH; ++c) {
            if (!read_value(in, block.dtype, item[c])) {
                return Error::invalid_format("Truncated index array", what);
            }
        }
    }
    return items;
}

Result<DataArray> to_data_array(const ArrayBlock& block, const std::string& what) {
    if (block.width != 1) {
        return Error::invalid_format("Data arrays must have width 1", what);
    }

    ByteReader in(block.raw);
    if (block.dtype == "float64" || block.dtype == "float32") {
        std::vector<double> values(block.length);
        for (auto& v : values) {
            if (!read_value(in, block.dtype, v)) {
                return Error::invalid_format("Truncated data array", what);
            }
        }
        return DataArray(std::move(values));
    }
    if (block.dtype == "int64" || block.dtype == "int32") {
        std::vector<int64_t> values(block.length);
        for (auto& v : values) {
            if (!read_value(in, block.dtype, v)) {
                return Error::invalid_format("Truncated data array", what);
            }
        }
        return DataArray(std::move(values));
    }
    return Error::invalid_format("Unsupported data dtype '" + block.dtype + "'", what);
}

Result<ElementGeometry> read_geometry(const ArrayReader& arrays, const json& g, const std::string& element) {
    const std::string type = g.at("type").get<std::string>();

    if (type == "surface") {
        TRY_ASSIGN(vblock, arrays.read(g.at("vertices"), element + "/vertices"));
        TRY_ASSIGN(tblock, arrays.read(g.at("triangles"), element + "/triangles"));
        SurfaceGeometry surface;
        TRY_ASSIGN(vertices, to_vertices(vblock, element + "/vertices"));
        TRY_ASSIGN(triangles, to_indices<glm::u64vec3>(tblock, element + "/triangles"));
        surface.vertices = std::move(vertices);
        surface.triangles = std::move(triangles);
        return ElementGeometry(std::move(surface));
    }
    if (type == "pointset") {
        TRY_ASSIGN(vblock, arrays.read(g.at("vertices"), element + "/vertices"));
        TRY_ASSIGN(vertices, to_vertices(vblock, element + "/vertices"));
        return ElementGeometry(PointSetGeometry{std::move(vertices)});
    }
    if (type == "lineset") {
        TRY_ASSIGN(vblock, arrays.read(g.at("vertices"), element + "/vertices"));
        TRY_ASSIGN(sblock, arrays.read(g.at("segments"), element + "/segments"));
        TRY_ASSIGN(vertices, to_vertices(vblock, element + "/vertices"));
        TRY_ASSIGN(segments, to_indices<glm::u64vec2>(sblock, element + "/segments"));
        return ElementGeometry(LineSetGeometry{std::move(vertices), std::move(segments)});
    }

    LOG_DEBUG("SurfaceFile", "Element '" << element << "' has unknown geometry type '" << type << "'");
    return ElementGeometry(UnknownGeometry{type});
}

Result<SurfaceData> read_data(const ArrayReader& arrays, const json& d, const std::string& element) {
    SurfaceData data;
    data.name = d.at("name").get<std::string>();
    const std::string what = element + "/" + data.name;

    const std::string location = d.at("location").get<std::string>();
    auto parsed = parse_location(location);
    if (!parsed) {
        return Error::invalid_format("Unknown data location '" + location + "'", what);
    }
    data.location = *parsed;

    TRY_ASSIGN(block, arrays.read(d.at("array"), what));
    TRY_ASSIGN(array, to_data_array(block, what));
    data.array = std::move(array);

    if (d.contains("legend")) {
        for (const auto& entry : d["legend"]) {
            data.legend.push_back({entry.at("key").get<int64_t>(), entry.at("label").get<std::string>()});
        }
    }
    return data;
}

Result<SurfaceElement> read_element(const ArrayReader& arrays, const json& e, const std::string& name) {
    SurfaceElement element;
    element.name = name;
    element.description = e.value("description", std::string());

    TRY_ASSIGN(geometry, read_geometry(arrays, e.at("geometry"), element.name));
    element.geometry = std::move(geometry);

    if (e.contains("data")) {
        for (const auto& d : e["data"]) {
            TRY_ASSIGN(data, read_data(arrays, d, element.name));
            element.data.push_back(std::move(data));
        }
    }
    return element;
}

// A malformed element only fails itself; it is listed in project.unreadable
Result<SurfaceProject> read_directory(const json& dir, std::span<const uint8_t> data_payload) {
    ArrayReader arrays(data_payload);

    SurfaceProject project;
    project.name = dir.value("name", std::string());
    project.description = dir.value("description", std::string());

    const json& elements = dir.at("elements");
    if (!elements.is_array()) {
        return Error::invalid_format("Directory 'elements' must be an array");
    }

    for (size_t i = 0; i < elements.size(); ++i) {
        const json& e = elements[i];
        std::string name = "element " + std::to_string(i);
        if (e.is_object() && e.contains("name") && e["name"].is_string()) {
            name = e["name"].get<std::string>();
        }

        auto element = [&]() -> Result<SurfaceElement> {
            try {
                return read_element(arrays, e, name);
            } catch (const json::exception& ex) {
                return Error::invalid_format(std::string("Invalid element entry: ") + ex.what(), name);
            }
        }();

        if (!element) {
            LOG_WARNING("SurfaceFile", "Cannot decode element '" << name << "': "
                        << error_code_name(element.code()) << ": " << element.error().full_message());
            project.unreadable.push_back({name, element.error()});
            continue;
        }
        project.elements.push_back(std::move(*element));
    }
    return project;
}

} // namespace

Result<std::vector<uint8_t>> encode_surface_file(const SurfaceProject& project, int compression_level) {
    if (compression_level < 0 || compression_level > 9) {
        return Error::invalid_argument("Compression level must be 0..9, got " + std::to_string(compression_level));
    }

    ArrayWriter arrays(compression_level);
    json dir;
    std::vector<uint8_t> indx_payload;

    try {
        dir["name"] = project.name;
        dir["description"] = project.description;
        dir["elements"] = json::array();

        for (const auto& element : project.elements) {
            json e;
            e["name"] = element.name;
            e["description"] = element.description;
            e["geometry"] = write_geometry(arrays, element.geometry);
            e["data"] = json::array();
            for (const auto& data : element.data) {
                e["data"].push_back(write_data(arrays, data));
            }
            dir["elements"].push_back(std::move(e));
        }

        const std::string text = dir.dump();
        ByteWriter indx;
        indx.put_le(static_cast<uint64_t>(text.size()));
        auto compressed = compress_zlib(reinterpret_cast<const uint8_t*>(text.data()), text.size(), compression_level);
        indx.put_bytes(compressed.data(), compressed.size());
        indx_payload = indx.take();
    } catch (const std::runtime_error& e) {
        return Error::compression_error(std::string("Surface file: ") + e.what());
    }

    ByteWriter head;
    head.put_le(SURFACE_FORMAT_VERSION);
    head.put_le(static_cast<uint32_t>(project.elements.size()));

    const uint64_t total = 12 + (8 + head.size()) + (8 + arrays.payload().size()) + (8 + indx_payload.size());
    if (total > std::numeric_limits<uint32_t>::max()) {
        return Error::invalid_argument("Surface file would exceed 4 GiB", project.name);
    }

    ByteWriter out;
    out.put_tag(tag_view(FORM_SIGNATURE));
    out.put_u32_be(0);  // patched below
    out.put_tag(tag_view(GMSX_TYPE));
    write_chunk(out, HEAD_CHUNK, head.buffer());
    write_chunk(out, DATA_CHUNK, arrays.payload());
    write_chunk(out, INDX_CHUNK, indx_payload);
    out.patch_u32_be(4, static_cast<uint32_t>(out.size() - 8));

    LOG_DEBUG("SurfaceFile", "Encoded '" << project.name << "': " << project.elements.size()
              << " elements, " << out.size() << " bytes");
    return out.take();
}

Result<SurfaceProject> decode_surface_file(std::span<const uint8_t> data) {
    ByteReader in(data);

    std::span<const uint8_t> sig;
    uint32_t form_size = 0;
    std::span<const uint8_t> form_type;
    if (!in.get_bytes(sig, 4) || !tag_equals(sig, FORM_SIGNATURE)) {
        return Error::invalid_format("Invalid FORM signature (expected 'FORM')");
    }
    if (!in.get_u32_be(form_size) || form_size < 4 || form_size > in.remaining()) {
        return Error::invalid_format("Invalid FORM size");
    }
    if (!in.get_bytes(form_type, 4) || !tag_equals(form_type, GMSX_TYPE)) {
        return Error::invalid_format("Invalid form type (expected 'GMSX')");
    }

    std::optional<uint32_t> element_count;
    std::span<const uint8_t> data_payload;
    std::span<const uint8_t> indx_payload;
    bool have_indx = false;

    const size_t form_end = 8 + static_cast<size_t>(form_size);
    while (in.position() < form_end) {
        std::span<const uint8_t> chunk_id;
        uint32_t chunk_size = 0;
        std::span<const uint8_t> payload;
        if (!in.get_bytes(chunk_id, 4) || !in.get_u32_be(chunk_size) ||
            chunk_size > form_end - in.position() || !in.get_bytes(payload, chunk_size)) {
            return Error::invalid_format("Truncated chunk at offset " + std::to_string(in.position()));
        }

        if (tag_equals(chunk_id, HEAD_CHUNK)) {
            ByteReader head(payload);
            uint32_t version = 0;
            uint32_t count = 0;
            if (!head.get_le(version) || !head.get_le(count)) {
                return Error::invalid_format("Truncated HEAD chunk");
            }
            if (version == 0 || version > SURFACE_FORMAT_VERSION) {
                return Error::invalid_format("Unsupported surface file version " + std::to_string(version));
            }
            element_count = count;
        } else if (tag_equals(chunk_id, DATA_CHUNK)) {
            data_payload = payload;
        } else if (tag_equals(chunk_id, INDX_CHUNK)) {
            indx_payload = payload;
            have_indx = true;
        } else {
            LOG_DEBUG("SurfaceFile", "Skipping unknown chunk '"
                      << std::string(reinterpret_cast<const char*>(chunk_id.data()), 4) << "'");
        }
    }

    if (!element_count) {
        return Error::invalid_format("Missing HEAD chunk");
    }
    if (!have_indx) {
        return Error::invalid_format("Missing INDX chunk");
    }

    ByteReader indx(indx_payload);
    uint64_t raw_size = 0;
    if (!indx.get_le(raw_size)) {
        return Error::invalid_format("Truncated INDX chunk");
    }

    json dir;
    try {
        std::span<const uint8_t> compressed;
        if (!indx.get_bytes(compressed, indx.remaining())) {
            return Error::invalid_format("Truncated INDX chunk");
        }
        auto text = decompress_zlib(compressed.data(), compressed.size(), raw_size);
        dir = json::parse(text.begin(), text.end());
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Invalid surface file directory: ") + e.what());
    } catch (const std::exception& e) {
        return Error::compression_error(std::string("Surface file directory: ") + e.what());
    }

    auto project = [&]() -> Result<SurfaceProject> {
        try {
            return read_directory(dir, data_payload);
        } catch (const json::exception& e) {
            return Error::invalid_format(std::string("Invalid surface file directory: ") + e.what());
        }
    }();
    if (!project) {
        return project;
    }
    const size_t listed = project->elements.size() + project->unreadable.size();
    if (listed != *element_count) {
        return Error::invalid_format("HEAD declares " + std::to_string(*element_count) + " elements, directory lists "
                                     + std::to_string(listed));
    }
    return project;
}

Result<void> write_surface_file(const std::filesystem::path& path, const SurfaceProject& project,
                                int compression_level) {
    auto bytes = encode_surface_file(project, compression_level);
    if (!bytes) {
        return bytes.error();
    }
    TRY(write_file(path, *bytes));

    LOG_INFO("SurfaceFile", "Wrote " << path.filename().string() << " (" << project.elements.size()
             << " elements, " << format_file_size(bytes->size()) << ")");
    return Result<void>::success();
}

Result<SurfaceProject> read_surface_file(const std::filesystem::path& path) {
    TRY_ASSIGN(bytes, read_file(path));

    auto project = decode_surface_file(bytes);
    if (!project) {
        return project.error().with_context(path.filename().string());
    }

    LOG_INFO("SurfaceFile", "Opened: " << path.filename().string() << " ("
             << project->elements.size() << " elements)");
    return project;
}

} // namespace geomesh
