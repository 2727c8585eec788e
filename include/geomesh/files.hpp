/**
 * GeoMesh Converter - File utilities
 */

#pragma once

#include "result.hpp"

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace geomesh {

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/**
 * Write data to file, creating parent directories.
 */
Result<void> write_file(const std::filesystem::path& path, const uint8_t* data, size_t size);
Result<void> write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);

/**
 * Ensure unique path ("name.json" -> "name_1.json" if taken).
 */
std::filesystem::path ensure_unique_path(const std::filesystem::path& path);

/**
 * Replace characters that are not safe in file names.
 */
std::string sanitize_filename(const std::string& name);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace geomesh
