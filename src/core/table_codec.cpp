/**
 * GeoMesh Converter - Table Codec Implementation
 */

#include "geomesh/table_codec.hpp"
#include "geomesh/byte_io.hpp"

#include <zlib.h>
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace geomesh {

constexpr std::array<char, 4> TABLE_MAGIC = {'G', 'T', 'B', 'L'};
constexpr size_t TABLE_HEADER_SIZE = 4 + 4 + 1 + 8;

namespace {

template<typename T>
void write_values(ByteWriter& out, const std::vector<T>& values) {
    for (const auto& v : values) {
        out.put_le(v);
    }
}

void write_values(ByteWriter& out, const std::vector<std::string>& values) {
    for (const auto& s : values) {
        out.put_le(static_cast<uint32_t>(s.size()));
        out.put_bytes(s.data(), s.size());
    }
}

template<typename T>
bool read_values(ByteReader& in, uint64_t rows, std::vector<T>& values) {
    if (rows > in.remaining() / sizeof(T)) return false;
    values.resize(static_cast<size_t>(rows));
    for (auto& v : values) {
        if (!in.get_le(v)) return false;
    }
    return true;
}

bool read_values(ByteReader& in, uint64_t rows, std::vector<std::string>& values) {
    // Every string costs at least its 4-byte length prefix
    if (rows > in.remaining() / 4) return false;
    values.resize(static_cast<size_t>(rows));
    for (auto& s : values) {
        uint32_t length = 0;
        if (!in.get_le(length) || !in.get_string(s, length)) return false;
    }
    return true;
}

ColumnData make_column_data(ColumnType type) {
    switch (type) {
        case ColumnType::Float64: return std::vector<double>{};
        case ColumnType::Float32: return std::vector<float>{};
        case ColumnType::UInt64:  return std::vector<uint64_t>{};
        case ColumnType::UInt32:  return std::vector<uint32_t>{};
        case ColumnType::Int64:   return std::vector<int64_t>{};
        case ColumnType::Int32:   return std::vector<int32_t>{};
        case ColumnType::String:  return std::vector<std::string>{};
    }
    throw std::invalid_argument("Unknown column type");
}

bool valid_column_type(uint8_t raw) {
    return raw >= static_cast<uint8_t>(ColumnType::Float64) &&
           raw <= static_cast<uint8_t>(ColumnType::String);
}

} // namespace

std::vector<uint8_t> serialize_table(const Table& table) {
    ByteWriter out;
    out.put_le(static_cast<uint32_t>(table.column_count()));
    out.put_le(static_cast<uint64_t>(table.row_count()));

    for (const auto& column : table.columns()) {
        out.put_u8(static_cast<uint8_t>(column.type()));
        out.put_le(static_cast<uint16_t>(column.name.size()));
        out.put_bytes(column.name.data(), column.name.size());
    }

    for (const auto& column : table.columns()) {
        std::visit([&](const auto& values) { write_values(out, values); }, column.data);
    }

    return out.take();
}

Result<Table> deserialize_table(std::span<const uint8_t> raw) {
    ByteReader in(raw);

    uint32_t column_count = 0;
    uint64_t row_count = 0;
    if (!in.get_le(column_count) || !in.get_le(row_count)) {
        return Error::invalid_format("Truncated table header");
    }

    struct Header {
        std::string name;
        ColumnType type;
    };
    std::vector<Header> headers;
    for (uint32_t i = 0; i < column_count; ++i) {
        uint8_t type = 0;
        uint16_t name_len = 0;
        Header header;
        if (!in.get_le(type) || !in.get_le(name_len) || !in.get_string(header.name, name_len)) {
            return Error::invalid_format("Truncated column header", "column " + std::to_string(i));
        }
        if (!valid_column_type(type)) {
            return Error::invalid_format("Unknown column type " + std::to_string(type), header.name);
        }
        header.type = static_cast<ColumnType>(type);
        headers.push_back(std::move(header));
    }

    Table table;
    for (auto& header : headers) {
        ColumnData data = make_column_data(header.type);
        bool ok = std::visit([&](auto& values) { return read_values(in, row_count, values); }, data);
        if (!ok) {
            return Error::invalid_format("Truncated column data", header.name);
        }
        try {
            table.add_column(std::move(header.name), std::move(data));
        } catch (const std::invalid_argument& e) {
            return Error::invalid_format(e.what());
        }
    }

    if (!in.at_end()) {
        return Error::invalid_format("Trailing bytes after table payload");
    }

    return table;
}

std::string table_checksum(std::span<const uint8_t> raw) {
    uLong crc = crc32(0L, Z_NULL, 0);
    uLong adler = adler32(0L, Z_NULL, 0);

    // zlib takes uInt lengths; feed large payloads in slices
    constexpr size_t SLICE = 1u << 30;
    for (size_t offset = 0; offset < raw.size(); offset += SLICE) {
        size_t len = std::min(SLICE, raw.size() - offset);
        crc = crc32(crc, raw.data() + offset, static_cast<uInt>(len));
        adler = adler32(adler, raw.data() + offset, static_cast<uInt>(len));
    }

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%08lx%08lx-%llx",
                  static_cast<unsigned long>(crc & 0xFFFFFFFFUL),
                  static_cast<unsigned long>(adler & 0xFFFFFFFFUL),
                  static_cast<unsigned long long>(raw.size()));
    return buf;
}

Result<EncodedTable> encode_table(const Table& table, CompressionType compression) {
    std::vector<uint8_t> raw = serialize_table(table);

    EncodedTable encoded;
    encoded.checksum = table_checksum(raw);
    encoded.raw_size = raw.size();
    encoded.compression = compression;

    std::vector<uint8_t> payload;
    try {
        payload = compress(raw.data(), raw.size(), compression);
    } catch (const std::runtime_error& e) {
        return Error::compression_error(e.what());
    }

    ByteWriter out;
    out.put_bytes(TABLE_MAGIC.data(), TABLE_MAGIC.size());
    out.put_le(TABLE_BLOB_VERSION);
    out.put_u8(static_cast<uint8_t>(compression));
    out.put_le(static_cast<uint64_t>(raw.size()));
    out.put_bytes(payload.data(), payload.size());
    encoded.blob = out.take();

    return encoded;
}

Result<std::vector<uint8_t>> decode_blob(std::span<const uint8_t> blob) {
    if (blob.size() < TABLE_HEADER_SIZE ||
        std::memcmp(blob.data(), TABLE_MAGIC.data(), TABLE_MAGIC.size()) != 0) {
        return Error::invalid_format("Not a table blob");
    }

    ByteReader in(blob.subspan(TABLE_MAGIC.size()));
    uint32_t version = 0;
    uint8_t compression = 0;
    uint64_t raw_size = 0;
    if (!in.get_le(version) || !in.get_le(compression) || !in.get_le(raw_size)) {
        return Error::invalid_format("Truncated table blob header");
    }
    if (version != TABLE_BLOB_VERSION) {
        return Error::invalid_format("Unsupported table blob version " + std::to_string(version));
    }
    if (compression > static_cast<uint8_t>(CompressionType::LZ4)) {
        return Error::invalid_format("Unknown table compression " + std::to_string(compression));
    }
    if (raw_size > std::numeric_limits<size_t>::max()) {
        return Error::invalid_format("Table payload too large");
    }

    auto payload = blob.subspan(TABLE_HEADER_SIZE);
    try {
        return decompress(payload.data(), payload.size(), static_cast<size_t>(raw_size),
                          static_cast<CompressionType>(compression));
    } catch (const std::runtime_error& e) {
        return Error::compression_error(e.what());
    }
}

Result<Table> decode_table(std::span<const uint8_t> blob) {
    TRY_ASSIGN(raw, decode_blob(blob));
    return deserialize_table(raw);
}

} // namespace geomesh
