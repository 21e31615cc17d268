/**
 * @file exporter.hpp
 * @brief Read-only serialization of installed lexicons
 */

#pragma once

#include <export.hpp>
#include <session/session.hpp>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Lexicore {

enum class ExportFormat { Lmf, Json, Csv };

LEXICORE_API std::optional<ExportFormat> export_format_from_name(std::string_view name);

struct ExportOptions {
    ExportFormat format = ExportFormat::Lmf;

    /// Lexicon ids to export; empty means every installed lexicon.
    std::vector<std::string> include;

    /// Lexicon ids to leave out, applied after include.
    std::vector<std::string> exclude;
};

/**
 * @brief Writes installed lexicons as WN-LMF XML, a flattened JSON projection
 * or one CSV row per sense. Never writes to the store.
 *
 * JSON layout:
 * @code
 * { "lexicons": [ { "id": ..., "label": ..., ..., "lmf_version": ...,
 *                   "words": [...], "senses": [...], "synsets": [...] } ] }
 * @endcode
 */
class LEXICORE_API Exporter {
public:
    explicit Exporter(Session& session) : session_(session) {}

    /// @throws NotFoundError when an included lexicon is not installed
    void write(std::ostream& out, const ExportOptions& options);

    void write_file(const std::filesystem::path& path, const ExportOptions& options);

    /// Lexicon ids selected by the filters, in installation order.
    std::vector<std::string> selected(const ExportOptions& options);

private:
    Session& session_;
};

} // namespace Lexicore
