/**
 * GeoMesh Converter - Columnar Table Implementation
 */

#include "geomesh/table.hpp"

#include <algorithm>
#include <stdexcept>

namespace geomesh {

const char* column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::Float64: return "float64";
        case ColumnType::Float32: return "float32";
        case ColumnType::UInt64:  return "uint64";
        case ColumnType::UInt32:  return "uint32";
        case ColumnType::Int64:   return "int64";
        case ColumnType::Int32:   return "int32";
        case ColumnType::String:  return "string";
    }
    return "unknown";
}

ColumnType Column::type() const {
    // Variant alternatives are declared in ColumnType order
    return static_cast<ColumnType>(data.index() + 1);
}

size_t Column::size() const {
    return std::visit([](const auto& values) { return values.size(); }, data);
}

Table& Table::add_column(std::string name, ColumnData data) {
    if (find(name)) {
        throw std::invalid_argument("Duplicate column name: " + name);
    }

    Column column{std::move(name), std::move(data)};
    if (!columns_.empty() && column.size() != row_count()) {
        throw std::invalid_argument("Column '" + column.name + "' has " + std::to_string(column.size()) +
                                    " rows, table has " + std::to_string(row_count()));
    }

    columns_.push_back(std::move(column));
    return *this;
}

const Column* Table::find(const std::string& name) const {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [&](const Column& c) { return c.name == name; });
    return it == columns_.end() ? nullptr : &*it;
}

bool Table::operator==(const Table& other) const {
    if (columns_.size() != other.columns_.size()) return false;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name != other.columns_[i].name) return false;
        if (columns_[i].data != other.columns_[i].data) return false;
    }
    return true;
}

} // namespace geomesh
