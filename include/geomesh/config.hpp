/**
 * GeoMesh Converter - Configuration
 *
 * Settings loaded from a JSON file (geomesh.json by default). Every key is
 * optional; command line flags override what the file sets.
 */

#pragma once

#include "result.hpp"
#include "compression.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace geomesh {

constexpr const char* DEFAULT_CONFIG_FILE = "geomesh.json";

struct Config {
    std::filesystem::path store_path = "geomesh_tables.db";
    CompressionType table_compression = CompressionType::LZ4;
    int surface_compression_level = 6;

    LogLevel log_level = LogLevel::Info;
    std::filesystem::path log_file;     // empty: no log file
    bool log_to_console = true;

    std::optional<int> epsg_code;
};

/**
 * Apply the keys present in j on top of config. Unknown keys are logged
 * and ignored; wrong types or out-of-range values fail with InvalidArgument.
 */
Result<Config> parse_config(const nlohmann::json& j, Config config = {});

Result<Config> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const Config& config);

/**
 * Configure the Logger singleton from config.
 */
Result<void> apply_logging(const Config& config);

} // namespace geomesh
