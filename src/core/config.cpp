/**
 * GeoMesh Converter - Configuration Implementation
 */

#include "geomesh/config.hpp"

#include <fstream>

namespace geomesh {

using nlohmann::json;

namespace {

Error bad_value(const std::string& key, const std::string& expected) {
    return Error::invalid_argument("Config key '" + key + "' must be " + expected);
}

const char* log_level_key(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        default:                return "none";
    }
}

} // namespace

Result<Config> parse_config(const json& j, Config config) {
    if (!j.is_object()) {
        return Error::invalid_argument("Config must be a JSON object");
    }

    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const json& value = item.value();

        if (key == "store_path") {
            if (!value.is_string()) return bad_value(key, "a string");
            config.store_path = value.get<std::string>();
        }
        else if (key == "table_compression") {
            auto type = value.is_string() ? parse_compression(value.get<std::string>()) : std::nullopt;
            if (!type) return bad_value(key, "one of \"lz4\", \"zlib\", \"none\"");
            config.table_compression = *type;
        }
        else if (key == "surface_compression_level") {
            if (!value.is_number_integer()) return bad_value(key, "an integer");
            const int level = value.get<int>();
            if (level < 0 || level > 9) return bad_value(key, "in 0..9");
            config.surface_compression_level = level;
        }
        else if (key == "log_level") {
            auto level = value.is_string() ? parse_log_level(value.get<std::string>()) : std::nullopt;
            if (!level) return bad_value(key, "one of \"debug\", \"info\", \"warning\", \"error\", \"none\"");
            config.log_level = *level;
        }
        else if (key == "log_file") {
            if (!value.is_string()) return bad_value(key, "a string");
            config.log_file = value.get<std::string>();
        }
        else if (key == "log_to_console") {
            if (!value.is_boolean()) return bad_value(key, "a boolean");
            config.log_to_console = value.get<bool>();
        }
        else if (key == "epsg_code") {
            if (value.is_null()) {
                config.epsg_code.reset();
            } else if (value.is_number_integer() && value.get<int64_t>() > 0 && value.get<int64_t>() <= 999999) {
                config.epsg_code = value.get<int>();
            } else {
                return bad_value(key, "a positive integer or null");
            }
        }
        else {
            LOG_WARNING("Config", "Ignoring unknown key '" << key << "'");
        }
    }

    return config;
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error::io_error("Failed to open config", path.string());
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return Error::invalid_format("Config is not valid JSON", path.string());
    }

    auto config = parse_config(j);
    if (!config) {
        return config.error().with_context(path.filename().string());
    }
    LOG_DEBUG("Config", "Loaded " << path.string());
    return config;
}

json config_to_json(const Config& config) {
    json j;
    j["store_path"] = config.store_path.string();
    j["table_compression"] = compression_name(config.table_compression);
    j["surface_compression_level"] = config.surface_compression_level;
    j["log_level"] = log_level_key(config.log_level);
    j["log_file"] = config.log_file.string();
    j["log_to_console"] = config.log_to_console;
    j["epsg_code"] = config.epsg_code ? json(*config.epsg_code) : json(nullptr);
    return j;
}

Result<void> apply_logging(const Config& config) {
    auto& logger = Logger::instance();
    logger.set_level(config.log_level);
    logger.set_console_output(config.log_to_console);
    if (!logger.set_file(config.log_file)) {
        return Error::io_error("Failed to open log file", config.log_file.string());
    }
    return Result<void>::success();
}

} // namespace geomesh
