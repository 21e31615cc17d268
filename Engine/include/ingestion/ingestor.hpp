/**
 * @file ingestor.hpp
 * @brief Acquisition and installation of lexical resources
 *
 * Pipeline:
 *   project spec -> download (cache) -> extract (scratch) -> parse -> one write transaction
 *
 * Parsing always completes before the store is touched. All lexicons of one
 * add() become visible together or not at all.
 */

#pragma once

#include <export.hpp>
#include <ingestion/downloader.hpp>
#include <ingestion/project_index.hpp>
#include <lmf/parser_registry.hpp>
#include <session/session.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lexicore {

struct AddOptions {
    /// Replace lexicons that are already installed.
    bool force = false;

    /// Overrides Config::parser for this call.
    std::optional<ParserKind> parser;

    /// Per-payload parse progress: (bytes consumed, total bytes or 0).
    std::function<void(std::size_t, std::size_t)> on_progress;
};

/**
 * @brief Outcome of one add().
 */
struct IngestionStats {
    std::vector<std::string> lexicons;   ///< ids added, in document order
    std::size_t payloads = 0;
    std::size_t words = 0;
    std::size_t senses = 0;
    std::size_t synsets = 0;
    std::size_t ilis = 0;                ///< rows from ILI files
    double parse_ms = 0.0;
    double write_ms = 0.0;
};

class LEXICORE_API Ingestor {
public:
    explicit Ingestor(Session& session);

    /// The configured project index, or the built-in one.
    const ProjectIndex& index() const { return index_; }

    /**
     * @brief Fetch a project archive into the download cache.
     *
     * Returns the cached file without network access unless force is set.
     * @throws ProjectError for unknown specifiers
     * @throws NetworkError when every url fails
     * @throws ArchiveError on a digest mismatch
     */
    std::filesystem::path download(std::string_view spec, const DownloadOptions& options = {});

    /// Cache location for a resolved project.
    std::filesystem::path cache_path(const ResolvedProject& project) const;

    /**
     * @brief Unpack an archive under extracted/ and list its payloads.
     * @throws ArchiveError when no LMF or ILI payload is found
     */
    std::vector<std::filesystem::path> extract(const std::filesystem::path& archive);

    /**
     * @brief Install a source: LMF .xml, compressed .xml.gz/.xml.xz, a tar
     * archive, a directory of payloads, or an ILI .tsv.
     *
     * @throws ParseError before any write when a payload is invalid
     * @throws ConflictError when a lexicon exists and force is false
     * @throws LockedError when another process holds the write lock
     */
    IngestionStats add(const std::filesystem::path& source, const AddOptions& options = {});

    /// download + extract + add.
    IngestionStats add_project(std::string_view spec, const AddOptions& options = {},
                               const DownloadOptions& download_options = {});

    /**
     * @brief Cascade-delete a lexicon and its retained source files.
     * @throws NotFoundError when the id is not installed
     */
    void remove(const std::string& lexicon_id);

private:
    struct Payload {
        std::filesystem::path path;
        bool ili = false;
    };

    std::vector<Payload> collect_payloads(const std::filesystem::path& source);
    std::vector<Payload> classify(const std::vector<std::filesystem::path>& files) const;
    void retain_source(const std::string& lexicon_id, const std::filesystem::path& payload);

    Session& session_;
    ProjectIndex index_;
    Downloader downloader_;
};

} // namespace Lexicore
