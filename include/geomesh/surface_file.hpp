/**
 * GeoMesh Converter - Surface File Container
 *
 * FORM/IFF-style container for surface projects:
 *   "FORM" u32be size "GMSX"
 *   "HEAD" u32be size  u32 format_version, u32 element_count
 *   "DATA" u32be size  zlib-compressed little-endian arrays, back to back
 *   "INDX" u32be size  u64 raw_size + zlib-compressed JSON directory
 *
 * The directory describes the project and every element; arrays are
 * located by {offset, compressed_size, size, dtype, length, width} into the
 * DATA payload. Unknown chunks are skipped. An element that cannot be
 * decoded is listed in SurfaceProject::unreadable and the others are
 * still returned; container-level damage fails the whole file.
 */

#pragma once

#include "result.hpp"
#include "surface_element.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace geomesh {

constexpr uint32_t SURFACE_FORMAT_VERSION = 1;

Result<std::vector<uint8_t>> encode_surface_file(const SurfaceProject& project, int compression_level = 6);
Result<SurfaceProject> decode_surface_file(std::span<const uint8_t> data);

Result<void> write_surface_file(const std::filesystem::path& path, const SurfaceProject& project,
                                int compression_level = 6);
Result<SurfaceProject> read_surface_file(const std::filesystem::path& path);

} // namespace geomesh
