/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include <session/config.hpp>
#include <core/errors.hpp>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <fstream>
#include <nlohmann/json.hpp>

namespace Lexicore {

namespace {

int parse_int(const char* name, std::string_view value) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
    if (ec == std::errc::result_out_of_range) {
        throw ConfigurationError(std::string(name) + " is out of range: '" + std::string(value) + "'");
    }
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigurationError(std::string(name) + " must be an integer, got '" + std::string(value) + "'");
    }
    return v;
}

int json_int(const nlohmann::json& value, const std::string& key) {
    constexpr auto max = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(max)) {
            throw ConfigurationError(key + " is out of range: " + value.dump());
        }
        return static_cast<int>(v);
    }
    if (!value.is_number_integer()) {
        throw ConfigurationError(key + " must be an integer, got " + value.dump());
    }
    auto v = value.get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > max) {
        throw ConfigurationError(key + " is out of range: " + value.dump());
    }
    return static_cast<int>(v);
}

ParserKind parse_parser(const std::string& name) {
    auto kind = parser_kind_from_name(name);
    if (!kind) {
        throw ConfigurationError("Unknown parser strategy '" + name + "'");
    }
    return *kind;
}

} // namespace

std::filesystem::path Config::default_data_dir() {
    if (const char* env = std::getenv("LEXICORE_DATA"); env && *env) {
        return env;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".lexicore";
    }
    return std::filesystem::current_path() / ".lexicore";
}

Config Config::load_from_env() {
    Config config;
    config.data_dir = default_data_dir();

    if (const char* v = std::getenv("LEXICORE_PARSER")) {
        config.parser = parse_parser(v);
    }
    if (const char* v = std::getenv("LEXICORE_DOWNLOAD_TIMEOUT_MS")) {
        config.download_timeout_ms = parse_int("LEXICORE_DOWNLOAD_TIMEOUT_MS", v);
    }
    if (const char* v = std::getenv("LEXICORE_DOWNLOAD_RETRIES")) {
        config.download_retries = parse_int("LEXICORE_DOWNLOAD_RETRIES", v);
    }
    if (const char* v = std::getenv("LEXICORE_BUSY_TIMEOUT_MS")) {
        config.busy_timeout_ms = parse_int("LEXICORE_BUSY_TIMEOUT_MS", v);
    }
    if (const char* v = std::getenv("LEXICORE_PROJECT_INDEX")) {
        config.project_index = v;
    }

    config.validate();
    return config;
}

Config Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open config file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid JSON in " + path.string() + ": " + e.what());
    }
    if (!json.is_object()) {
        throw ConfigurationError("Config file must hold a JSON object: " + path.string());
    }

    Config config;
    config.data_dir = default_data_dir();
    try {
        for (auto& [key, value] : json.items()) {
            if (key == "data_dir")                    config.data_dir = value.get<std::string>();
            else if (key == "parser")                 config.parser = parse_parser(value.get<std::string>());
            else if (key == "stream_threshold_bytes") config.stream_threshold_bytes = value.get<std::size_t>();
            else if (key == "strict")                 config.strict = value.get<bool>();
            else if (key == "trim_text")              config.trim_text = value.get<bool>();
            else if (key == "busy_timeout_ms")        config.busy_timeout_ms = json_int(value, key);
            else if (key == "download_timeout_ms")    config.download_timeout_ms = json_int(value, key);
            else if (key == "download_retries")       config.download_retries = json_int(value, key);
            else if (key == "lmf_extensions")         config.lmf_extensions = value.get<std::vector<std::string>>();
            else if (key == "project_index")          config.project_index = value.get<std::string>();
            else throw ConfigurationError("Unknown config key '" + key + "' in " + path.string());
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError("Wrong value type in " + path.string() + ": " + e.what());
    }

    // Relative data_dir is taken relative to the config file
    if (config.data_dir.is_relative()) {
        config.data_dir = path.parent_path() / config.data_dir;
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (data_dir.empty()) {
        throw ConfigurationError("data_dir must not be empty");
    }
    if (busy_timeout_ms < 0) {
        throw ConfigurationError("busy_timeout_ms must be >= 0");
    }
    if (download_timeout_ms <= 0) {
        throw ConfigurationError("download_timeout_ms must be > 0");
    }
    if (download_retries < 0) {
        throw ConfigurationError("download_retries must be >= 0");
    }
    if (stream_threshold_bytes == 0) {
        throw ConfigurationError("stream_threshold_bytes must be > 0");
    }
    if (lmf_extensions.empty()) {
        throw ConfigurationError("lmf_extensions must list at least one extension");
    }
    for (const auto& ext : lmf_extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            throw ConfigurationError("lmf_extensions entries must look like '.xml', got '" + ext + "'");
        }
    }
    if (!project_index.empty() && !std::filesystem::is_regular_file(project_index)) {
        throw ConfigurationError("project_index does not exist: " + project_index.string());
    }
}

} // namespace Lexicore
