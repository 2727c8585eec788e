/**
 * GeoMesh Converter - Columnar Table
 *
 * In-memory form of the tables held by the Table Store: ordered, named,
 * equal-length columns of a single primitive type each.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace geomesh {

/**
 * Column element type. Values are persisted in table blobs.
 */
enum class ColumnType : uint8_t {
    Float64 = 1,
    Float32 = 2,
    UInt64 = 3,
    UInt32 = 4,
    Int64 = 5,
    Int32 = 6,
    String = 7
};

const char* column_type_name(ColumnType type);

using ColumnData = std::variant<
    std::vector<double>,
    std::vector<float>,
    std::vector<uint64_t>,
    std::vector<uint32_t>,
    std::vector<int64_t>,
    std::vector<int32_t>,
    std::vector<std::string>>;

struct Column {
    std::string name;
    ColumnData data;

    ColumnType type() const;
    size_t size() const;
};

class Table {
public:
    Table() = default;

    /**
     * Append a column. Throws std::invalid_argument if its length differs
     * from the existing columns or the name is already used.
     */
    Table& add_column(std::string name, ColumnData data);

    const std::vector<Column>& columns() const { return columns_; }
    size_t column_count() const { return columns_.size(); }
    size_t row_count() const { return columns_.empty() ? 0 : columns_.front().size(); }

    const Column& column(size_t index) const { return columns_.at(index); }
    const Column* find(const std::string& name) const;

    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<Column> columns_;
};

} // namespace geomesh
