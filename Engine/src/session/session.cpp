/**
 * @file session.cpp
 * @brief Data directory layout and store opening
 */

#include <session/session.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <fstream>

namespace Lexicore {

namespace {

void ensure_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir)) {
        throw ConfigurationError("Cannot create directory " + dir.string() +
                                 (ec ? ": " + ec.message() : std::string()));
    }
}

void ensure_writable(const std::filesystem::path& dir) {
    auto probe = dir / ".lexicore-write-probe";
    {
        std::ofstream out(probe);
        if (!out || !(out << "ok")) {
            throw ConfigurationError("Data directory is not writable: " + dir.string());
        }
    }
    std::error_code ec;
    std::filesystem::remove(probe, ec);
}

} // namespace

Session::Session(Config config) : config_(std::move(config)) {
    config_.validate();
    config_.data_dir = std::filesystem::absolute(config_.data_dir);

    ensure_dir(config_.data_dir);
    ensure_writable(config_.data_dir);
    ensure_dir(downloads_dir());
    ensure_dir(extracted_dir());
    ensure_dir(sources_dir());

    store_ = std::make_unique<Store>(db_path(), lock_path(), config_.busy_timeout_ms);
    Logger::debug("Session opened on " + config_.data_dir.string());
}

ParseOptions Session::parse_options() const {
    ParseOptions options;
    options.strict = config_.strict;
    options.trim_text = config_.trim_text;
    return options;
}

} // namespace Lexicore
