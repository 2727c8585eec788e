/**
 * GeoMesh Converter - Table Schemas Implementation
 */

#include "geomesh/table_schemas.hpp"

#include <limits>

namespace geomesh {

namespace {

Error schema_error(const Table& table, const std::string& expected) {
    std::string found;
    for (const auto& column : table.columns()) {
        if (!found.empty()) found += ", ";
        found += column.name + ":" + column_type_name(column.type());
    }
    return Error::invalid_format("Expected table (" + expected + "), found (" + found + ")");
}

// Column as float64, accepting float32
bool widen_float(const Column& column, std::vector<double>& out) {
    if (auto* v = std::get_if<std::vector<double>>(&column.data)) {
        out = *v;
        return true;
    }
    if (auto* v = std::get_if<std::vector<float>>(&column.data)) {
        out.assign(v->begin(), v->end());
        return true;
    }
    return false;
}

// Column as uint64, accepting uint32
bool widen_unsigned(const Column& column, std::vector<uint64_t>& out) {
    if (auto* v = std::get_if<std::vector<uint64_t>>(&column.data)) {
        out = *v;
        return true;
    }
    if (auto* v = std::get_if<std::vector<uint32_t>>(&column.data)) {
        out.assign(v->begin(), v->end());
        return true;
    }
    return false;
}

// Column as int64, accepting int32
bool widen_signed(const Column& column, std::vector<int64_t>& out) {
    if (auto* v = std::get_if<std::vector<int64_t>>(&column.data)) {
        out = *v;
        return true;
    }
    if (auto* v = std::get_if<std::vector<int32_t>>(&column.data)) {
        out.assign(v->begin(), v->end());
        return true;
    }
    return false;
}

template<typename T, typename Widen>
bool read_columns(const Table& table, size_t count, Widen widen, std::vector<std::vector<T>>& out) {
    if (table.column_count() != count) return false;
    out.resize(count);
    for (size_t i = 0; i < count; ++i) {
        if (!widen(table.column(i), out[i])) return false;
    }
    return true;
}

} // namespace

Table make_vertex_table(const VertexSet& vertices) {
    std::vector<double> x, y, z;
    x.reserve(vertices.size());
    y.reserve(vertices.size());
    z.reserve(vertices.size());
    for (const auto& v : vertices) {
        x.push_back(v.x);
        y.push_back(v.y);
        z.push_back(v.z);
    }

    Table table;
    table.add_column("x", std::move(x))
         .add_column("y", std::move(y))
         .add_column("z", std::move(z));
    return table;
}

Result<VertexSet> read_vertex_table(const Table& table) {
    std::vector<std::vector<double>> columns;
    if (!read_columns<double>(table, 3, widen_float, columns)) {
        return schema_error(table, "x, y, z: float64");
    }

    VertexSet vertices(table.row_count());
    for (size_t i = 0; i < vertices.size(); ++i) {
        vertices[i] = glm::dvec3(columns[0][i], columns[1][i], columns[2][i]);
    }
    return vertices;
}

Table make_triangle_table(const TriangleSet& triangles) {
    std::vector<uint64_t> n0, n1, n2;
    n0.reserve(triangles.size());
    n1.reserve(triangles.size());
    n2.reserve(triangles.size());
    for (const auto& t : triangles) {
        n0.push_back(t.x);
        n1.push_back(t.y);
        n2.push_back(t.z);
    }

    Table table;
    table.add_column("n0", std::move(n0))
         .add_column("n1", std::move(n1))
         .add_column("n2", std::move(n2));
    return table;
}

Result<TriangleSet> read_triangle_table(const Table& table) {
    std::vector<std::vector<uint64_t>> columns;
    if (!read_columns<uint64_t>(table, 3, widen_unsigned, columns)) {
        return schema_error(table, "n0, n1, n2: uint64");
    }

    TriangleSet triangles(table.row_count());
    for (size_t i = 0; i < triangles.size(); ++i) {
        triangles[i] = glm::u64vec3(columns[0][i], columns[1][i], columns[2][i]);
    }
    return triangles;
}

Table make_chunk_table(const std::vector<Chunk>& chunks) {
    std::vector<uint64_t> starts, counts;
    starts.reserve(chunks.size());
    counts.reserve(chunks.size());
    for (const auto& c : chunks) {
        starts.push_back(c.start_segment_index);
        counts.push_back(c.number_of_segments);
    }

    Table table;
    table.add_column("start_segment_index", std::move(starts))
         .add_column("number_of_segments", std::move(counts));
    return table;
}

Result<std::vector<Chunk>> read_chunk_table(const Table& table) {
    std::vector<std::vector<uint64_t>> columns;
    if (!read_columns<uint64_t>(table, 2, widen_unsigned, columns)) {
        return schema_error(table, "start_segment_index, number_of_segments: uint64");
    }

    std::vector<Chunk> chunks(table.row_count());
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i] = Chunk{columns[0][i], columns[1][i]};
    }
    return chunks;
}

Table make_index_table(const std::vector<uint64_t>& indices) {
    Table table;
    table.add_column("index", indices);
    return table;
}

Result<std::vector<uint64_t>> read_index_table(const Table& table) {
    std::vector<std::vector<uint64_t>> columns;
    if (!read_columns<uint64_t>(table, 1, widen_unsigned, columns)) {
        return schema_error(table, "index: uint64");
    }
    return std::move(columns[0]);
}

Table make_value_table(const DataArray& values) {
    Table table;
    std::visit([&](const auto& v) { table.add_column("value", v); }, values);
    return table;
}

Table make_category_key_table(const std::vector<int64_t>& keys) {
    std::vector<int32_t> narrow;
    narrow.reserve(keys.size());
    for (int64_t key : keys) {
        if (key < std::numeric_limits<int32_t>::min() || key > std::numeric_limits<int32_t>::max()) {
            // Keys outside int32 keep the wide column
            Table wide;
            wide.add_column("value", keys);
            return wide;
        }
        narrow.push_back(static_cast<int32_t>(key));
    }

    Table table;
    table.add_column("value", std::move(narrow));
    return table;
}

Result<DataArray> read_value_table(const Table& table) {
    if (table.column_count() != 1) {
        return schema_error(table, "value");
    }

    const Column& column = table.column(0);
    std::vector<double> floats;
    if (widen_float(column, floats)) {
        return DataArray(std::move(floats));
    }
    std::vector<int64_t> ints;
    if (widen_signed(column, ints)) {
        return DataArray(std::move(ints));
    }
    std::vector<uint64_t> unsigned_ints;
    if (widen_unsigned(column, unsigned_ints)) {
        ints.reserve(unsigned_ints.size());
        for (uint64_t v : unsigned_ints) {
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Error::invalid_format("Unsigned value exceeds int64 range: " + std::to_string(v));
            }
            ints.push_back(static_cast<int64_t>(v));
        }
        return DataArray(std::move(ints));
    }

    return schema_error(table, "value: numeric");
}

Table make_lookup_table(const std::vector<CategoryEntry>& entries) {
    std::vector<int64_t> keys;
    std::vector<std::string> labels;
    keys.reserve(entries.size());
    labels.reserve(entries.size());
    for (const auto& e : entries) {
        keys.push_back(e.key);
        labels.push_back(e.label);
    }

    Table key_table = make_category_key_table(keys);
    Table lookup;
    lookup.add_column("key", key_table.column(0).data)
          .add_column("value", std::move(labels));
    return lookup;
}

Result<std::vector<CategoryEntry>> read_lookup_table(const Table& table) {
    std::vector<int64_t> keys;
    const auto* labels = table.column_count() == 2
        ? std::get_if<std::vector<std::string>>(&table.column(1).data)
        : nullptr;
    if (!labels || !widen_signed(table.column(0), keys)) {
        return schema_error(table, "key: int32, value: string");
    }

    std::vector<CategoryEntry> entries(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        entries[i] = CategoryEntry{keys[i], (*labels)[i]};
    }
    return entries;
}

} // namespace geomesh
