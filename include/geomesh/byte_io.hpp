/**
 * GeoMesh Converter - Byte stream helpers
 *
 * Little-endian writer and bounds-checked reader used by the table codec
 * and the surface file container. Chunk sizes in the container are
 * big-endian, so both byte orders are offered for uint32.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace geomesh {

class ByteWriter {
public:
    void put_u8(uint8_t v) { buffer_.push_back(v); }

    template<typename T>
    void put_le(T value) {
        static_assert(std::is_arithmetic_v<T>);
        using U = std::conditional_t<sizeof(T) == 8, uint64_t,
                  std::conditional_t<sizeof(T) == 4, uint32_t,
                  std::conditional_t<sizeof(T) == 2, uint16_t, uint8_t>>>;
        U bits;
        std::memcpy(&bits, &value, sizeof(T));
        for (size_t i = 0; i < sizeof(T); ++i) {
            buffer_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
        }
    }

    void put_u32_be(uint32_t v) {
        buffer_.push_back(static_cast<uint8_t>(v >> 24));
        buffer_.push_back(static_cast<uint8_t>(v >> 16));
        buffer_.push_back(static_cast<uint8_t>(v >> 8));
        buffer_.push_back(static_cast<uint8_t>(v));
    }

    void put_bytes(const void* data, size_t size) {
        const auto* p = static_cast<const uint8_t*>(data);
        buffer_.insert(buffer_.end(), p, p + size);
    }

    void put_tag(std::string_view tag) { put_bytes(tag.data(), tag.size()); }

    // Overwrite a big-endian uint32 written earlier (chunk size back-patching)
    void patch_u32_be(size_t offset, uint32_t v) {
        buffer_[offset] = static_cast<uint8_t>(v >> 24);
        buffer_[offset + 1] = static_cast<uint8_t>(v >> 16);
        buffer_[offset + 2] = static_cast<uint8_t>(v >> 8);
        buffer_[offset + 3] = static_cast<uint8_t>(v);
    }

    size_t size() const { return buffer_.size(); }
    std::vector<uint8_t>& buffer() { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Reader over a byte span. Every get_* returns false once the input is
 * exhausted; the position is left unchanged in that case.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    bool get_le(T& out) {
        static_assert(std::is_arithmetic_v<T>);
        if (remaining() < sizeof(T)) return false;
        using U = std::conditional_t<sizeof(T) == 8, uint64_t,
                  std::conditional_t<sizeof(T) == 4, uint32_t,
                  std::conditional_t<sizeof(T) == 2, uint16_t, uint8_t>>>;
        U bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits |= static_cast<U>(static_cast<U>(data_[pos_ + i]) << (8 * i));
        }
        std::memcpy(&out, &bits, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    bool get_u32_be(uint32_t& out) {
        if (remaining() < 4) return false;
        out = (static_cast<uint32_t>(data_[pos_]) << 24) |
              (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
              (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
              static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return true;
    }

    bool get_bytes(std::span<const uint8_t>& out, size_t size) {
        if (remaining() < size) return false;
        out = data_.subspan(pos_, size);
        pos_ += size;
        return true;
    }

    bool get_string(std::string& out, size_t size) {
        std::span<const uint8_t> bytes;
        if (!get_bytes(bytes, size)) return false;
        out.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return true;
    }

    bool skip(size_t size) {
        if (remaining() < size) return false;
        pos_ += size;
        return true;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ == data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace geomesh
