/**
 * GeoMesh Converter - Attribute Binder Implementation
 */

#include "geomesh/attribute_binder.hpp"
#include "geomesh/table_schemas.hpp"
#include "geomesh/logging.hpp"

#include <type_traits>

namespace geomesh {

Result<Attribute> load_attribute(const TableStore& store, const AttributeRecord& record, DataLocation location) {
    Attribute attr;
    attr.name = record.name;
    attr.key = record.key;
    attr.kind = record.kind;
    attr.location = location;
    attr.nan_values = record.nan_values;

    TRY_ASSIGN(value_table, store.load(record.values.data));
    auto values = read_value_table(value_table);
    if (!values) {
        return values.error().with_context(record.name);
    }
    attr.values = std::move(*values);

    const size_t count = data_array_size(attr.values);
    if (record.values.length != count) {
        LOG_WARNING("AttributeBinder", "Attribute '" << record.name << "' declares " << record.values.length
                    << " values, table holds " << count);
    }

    if (record.kind == AttributeKind::Continuous && !std::holds_alternative<std::vector<double>>(attr.values)) {
        return Error::invalid_format("Continuous attribute values must be floating point", record.name);
    }
    if (record.kind == AttributeKind::Integer && !std::holds_alternative<std::vector<int64_t>>(attr.values)) {
        return Error::invalid_format("Integer attribute values must be integers", record.name);
    }
    if (record.kind == AttributeKind::Category) {
        if (!std::holds_alternative<std::vector<int64_t>>(attr.values)) {
            return Error::invalid_format("Category attribute keys must be integers", record.name);
        }
        if (!record.lookup_table) {
            return Error::invalid_format("Category attribute has no lookup table", record.name);
        }
        TRY_ASSIGN(lookup, store.load(record.lookup_table->data));
        auto categories = read_lookup_table(lookup);
        if (!categories) {
            return categories.error().with_context(record.name);
        }
        attr.categories = std::move(*categories);
    }

    return attr;
}

Result<std::vector<Attribute>> load_attributes(const TableStore& store, std::span<const AttributeRecord> records,
                                               DataLocation location) {
    std::vector<Attribute> attributes;
    attributes.reserve(records.size());
    for (const auto& record : records) {
        TRY_ASSIGN(attr, load_attribute(store, record, location));
        attributes.push_back(std::move(attr));
    }
    return attributes;
}

DataArray project_values(const DataArray& values, std::span<const uint64_t> rows) {
    return std::visit([&](const auto& source) -> DataArray {
        std::decay_t<decltype(source)> projected;
        projected.reserve(rows.size());
        for (uint64_t row : rows) {
            projected.push_back(source[row]);
        }
        return projected;
    }, values);
}

Result<std::vector<Attribute>> bind_attributes(std::span<const Attribute> attributes, DataLocation location,
                                               uint64_t base_length, std::span<const uint64_t> resolved_faces) {
    std::vector<Attribute> bound;

    for (const auto& attr : attributes) {
        if (attr.location != location) {
            continue;
        }

        const uint64_t count = data_array_size(attr.values);
        if (count != base_length) {
            return Error::attribute_length_mismatch(
                std::string(location_name(location)) + " attribute has " + std::to_string(count)
                + " values, expected " + std::to_string(base_length), attr.name);
        }

        Attribute out = attr;
        if (location == DataLocation::Faces) {
            for (uint64_t row : resolved_faces) {
                if (row >= count) {
                    return Error::index_out_of_range(
                        "Resolved face " + std::to_string(row) + " exceeds " + std::to_string(count) + " values",
                        attr.name);
                }
            }
            out.values = project_values(attr.values, resolved_faces);
        }
        bound.push_back(std::move(out));
    }

    LOG_DEBUG("AttributeBinder", "Bound " << bound.size() << " " << location_name(location) << " attributes");
    return bound;
}

} // namespace geomesh
