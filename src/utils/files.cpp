/**
 * GeoMesh Converter - File Utilities Implementation
 */

#include "geomesh/files.hpp"
#include <fstream>
#include <chrono>
#include <cstdio>

namespace geomesh {

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Failed to open file", path.string());
    }

    file.seekg(0, std::ios::end);
    const std::streamoff size = file.tellg();
    if (size < 0) {
        return Error::io_error("Failed to determine file size", path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return Error::io_error("Failed to read file", path.string());
    }
    return data;
}

Result<void> write_file(const std::filesystem::path& path, const uint8_t* data, size_t size) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Failed to create directory: " + ec.message(), path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Failed to create file", path.string());
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file) {
        return Error::io_error("Failed to write file", path.string());
    }
    return Result<void>::success();
}

Result<void> write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    return write_file(path, data.data(), data.size());
}

std::filesystem::path ensure_unique_path(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return path;

    auto stem = path.stem().string();
    auto ext = path.extension().string();
    auto parent = path.parent_path();

    constexpr int MAX_ATTEMPTS = 10000;
    for (int counter = 1; counter <= MAX_ATTEMPTS; ++counter) {
        auto new_path = parent / (stem + "_" + std::to_string(counter) + ext);
        if (!std::filesystem::exists(new_path)) return new_path;
    }

    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    return parent / (stem + "_" + std::to_string(now) + ext);
}

std::string sanitize_filename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                result += '_';
                break;
            default:
                result += (static_cast<unsigned char>(c) < 0x20) ? '_' : c;
        }
    }
    if (result.empty() || result == "." || result == "..") {
        return "unnamed";
    }
    return result;
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace geomesh
