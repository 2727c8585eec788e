/**
 * GeoMesh Converter - Compression utilities
 *
 * Table blobs in the store use LZ4 by default; surface file arrays and
 * the surface file directory use zlib.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>

namespace geomesh {

/**
 * Compression applied to a stored payload. Values are persisted.
 */
enum class CompressionType : uint8_t {
    None = 0,
    Zlib = 1,
    LZ4 = 2
};

const char* compression_name(CompressionType type);
std::optional<CompressionType> parse_compression(std::string_view name);

/**
 * Compress / decompress with the given method. Throw std::runtime_error
 * on failure or when the output does not have the expected size.
 */
std::vector<uint8_t> compress(const uint8_t* data, size_t size, CompressionType type, int zlib_level = 6);
std::vector<uint8_t> decompress(const uint8_t* data, size_t size, size_t expected_size, CompressionType type);

std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size);
std::vector<uint8_t> decompress_lz4(const uint8_t* data, size_t size, size_t expected_size);

std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

std::vector<uint8_t> compress_lz4(const uint8_t* data, size_t size);

} // namespace geomesh
