/**
 * @file config.hpp
 * @brief Engine configuration: data directory, parser strategy, download policy
 */

#pragma once

#include <export.hpp>
#include <lmf/parser_registry.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace Lexicore {

struct LEXICORE_API Config {
    std::filesystem::path data_dir;

    ParserKind parser = ParserKind::Auto;
    std::size_t stream_threshold_bytes = 8u * 1024u * 1024u;
    bool strict = true;
    bool trim_text = false;

    int busy_timeout_ms = 1000;

    long download_timeout_ms = 10000;
    int download_retries = 0;

    /// Payload extensions searched for inside extracted archives.
    std::vector<std::string> lmf_extensions{".xml"};

    /// Replaces the built-in project index when set.
    std::filesystem::path project_index;

    /**
     * @brief $LEXICORE_DATA, else $HOME/.lexicore, else ./.lexicore
     */
    static std::filesystem::path default_data_dir();

    /**
     * @brief Defaults overridden by environment variables
     *
     * Uses: LEXICORE_DATA, LEXICORE_PARSER, LEXICORE_DOWNLOAD_TIMEOUT_MS,
     * LEXICORE_DOWNLOAD_RETRIES, LEXICORE_BUSY_TIMEOUT_MS, LEXICORE_PROJECT_INDEX
     */
    static Config load_from_env();

    /**
     * @brief Defaults overridden by a JSON file; unknown keys are rejected.
     */
    static Config load_file(const std::filesystem::path& path);

    /// Throws ConfigurationError on invalid values.
    void validate() const;
};

} // namespace Lexicore
