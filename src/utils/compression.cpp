/**
 * GeoMesh Converter - Compression Implementation
 */

#include "geomesh/compression.hpp"
#include <zlib.h>
#include <lz4.h>
#include <limits>
#include <stdexcept>
#include <string>

namespace geomesh {

static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

const char* compression_name(CompressionType type) {
    switch (type) {
        case CompressionType::None: return "none";
        case CompressionType::Zlib: return "zlib";
        case CompressionType::LZ4:  return "lz4";
    }
    return "unknown";
}

std::optional<CompressionType> parse_compression(std::string_view name) {
    if (name == "none") return CompressionType::None;
    if (name == "zlib") return CompressionType::Zlib;
    if (name == "lz4") return CompressionType::LZ4;
    return std::nullopt;
}

std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size) {
    std::vector<uint8_t> result(expected_size);
    if (expected_size == 0) {
        return result;
    }

    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(expected_size);

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize zlib decompression: ") + zlib_error_string(ret));
    }

    ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::string("Zlib decompression failed: ") + zlib_error_string(ret) +
                                 " (input=" + std::to_string(size) + ", expected=" + std::to_string(expected_size) + ")");
    }
    if (strm.total_out != expected_size) {
        throw std::runtime_error("Zlib decompressed size mismatch (got " + std::to_string(strm.total_out) +
                                 ", expected " + std::to_string(expected_size) + ")");
    }

    return result;
}

std::vector<uint8_t> decompress_lz4(const uint8_t* data, size_t size, size_t expected_size) {
    std::vector<uint8_t> result(expected_size);
    if (expected_size == 0) {
        return result;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        expected_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("LZ4 block too large");
    }

    int decompressed_size = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(result.data()),
        static_cast<int>(size),
        static_cast<int>(expected_size)
    );

    if (decompressed_size < 0 || static_cast<size_t>(decompressed_size) != expected_size) {
        throw std::runtime_error("LZ4 decompression failed (expected " + std::to_string(expected_size) + " bytes)");
    }

    return result;
}

std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level) {
    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> result(bound);

    int ret = compress2(
        result.data(), &bound,
        data, static_cast<uLong>(size),
        level
    );

    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Zlib compression failed: ") + zlib_error_string(ret));
    }

    result.resize(bound);
    return result;
}

std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level) {
    return compress_zlib(data.data(), data.size(), level);
}

std::vector<uint8_t> compress_lz4(const uint8_t* data, size_t size) {
    if (size == 0) {
        return {};
    }
    if (size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("LZ4 input too large: " + std::to_string(size) + " bytes");
    }

    int bound = LZ4_compressBound(static_cast<int>(size));
    std::vector<uint8_t> result(static_cast<size_t>(bound));

    int compressed_size = LZ4_compress_default(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(result.data()),
        static_cast<int>(size),
        bound
    );

    if (compressed_size <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    result.resize(static_cast<size_t>(compressed_size));
    return result;
}

std::vector<uint8_t> compress(const uint8_t* data, size_t size, CompressionType type, int zlib_level) {
    switch (type) {
        case CompressionType::None:
            return std::vector<uint8_t>(data, data + size);
        case CompressionType::Zlib:
            return compress_zlib(data, size, zlib_level);
        case CompressionType::LZ4:
            return compress_lz4(data, size);
    }
    throw std::runtime_error("Unknown compression type");
}

std::vector<uint8_t> decompress(const uint8_t* data, size_t size, size_t expected_size, CompressionType type) {
    switch (type) {
        case CompressionType::None:
            if (size != expected_size) {
                throw std::runtime_error("Uncompressed payload size mismatch");
            }
            return std::vector<uint8_t>(data, data + size);
        case CompressionType::Zlib:
            return decompress_zlib(data, size, expected_size);
        case CompressionType::LZ4:
            return decompress_lz4(data, size, expected_size);
    }
    throw std::runtime_error("Unknown compression type");
}

} // namespace geomesh
