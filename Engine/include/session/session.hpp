/**
 * @file session.hpp
 * @brief Explicit context object: one data directory, one store handle
 */

#pragma once

#include <export.hpp>
#include <lmf/lmf_parser.hpp>
#include <session/config.hpp>
#include <storage/store.hpp>
#include <filesystem>
#include <memory>

namespace Lexicore {

/**
 * @brief Every engine operation takes a Session.
 *
 * Layout of the data directory:
 *   downloads/            cached project archives
 *   extracted/            archive extraction scratch area
 *   sources/<lexicon>/    LMF payload each installed lexicon came from
 *   lexicore.db           the store
 *   lexicore.lock         cross-process write lock
 *
 * Independent sessions over different directories may coexist in a process.
 */
class LEXICORE_API Session {
public:
    /// Validates the config, creates the layout and opens the store.
    /// @throws ConfigurationError when the directory cannot be created or written
    explicit Session(Config config);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const Config& config() const { return config_; }

    const std::filesystem::path& data_dir() const { return config_.data_dir; }
    std::filesystem::path downloads_dir() const { return config_.data_dir / "downloads"; }
    std::filesystem::path extracted_dir() const { return config_.data_dir / "extracted"; }
    std::filesystem::path sources_dir() const { return config_.data_dir / "sources"; }
    std::filesystem::path db_path() const { return config_.data_dir / "lexicore.db"; }
    std::filesystem::path lock_path() const { return config_.data_dir / "lexicore.lock"; }

    Store& store() { return *store_; }

    /// Parser options derived from the config.
    ParseOptions parse_options() const;

private:
    Config config_;
    std::unique_ptr<Store> store_;
};

} // namespace Lexicore
