/**
 * GeoMesh Converter - Table Codec
 *
 * Binary form of a Table as persisted by the Table Store.
 *
 * Raw payload (little-endian):
 *   u32 column_count, u64 row_count
 *   per column: u8 type, u16 name_length, name
 *   per column: row_count values (strings as u32 length + bytes)
 *
 * Stored blob: "GTBL", u32 version, u8 compression, u64 raw_size, payload.
 */

#pragma once

#include "result.hpp"
#include "table.hpp"
#include "types.hpp"
#include "compression.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace geomesh {

constexpr uint32_t TABLE_BLOB_VERSION = 1;

struct EncodedTable {
    std::string checksum;
    std::vector<uint8_t> blob;
    uint64_t raw_size = 0;
    CompressionType compression = CompressionType::None;
};

std::vector<uint8_t> serialize_table(const Table& table);
Result<Table> deserialize_table(std::span<const uint8_t> raw);

/**
 * Integrity checksum of a raw payload (crc32, adler32 and size). It does
 * not depend on the blob compression. Not an identity: different tables
 * may share a checksum.
 */
std::string table_checksum(std::span<const uint8_t> raw);

Result<EncodedTable> encode_table(const Table& table, CompressionType compression);

/**
 * Decode a stored blob back into the raw payload / the table.
 */
Result<std::vector<uint8_t>> decode_blob(std::span<const uint8_t> blob);
Result<Table> decode_table(std::span<const uint8_t> blob);

} // namespace geomesh
