/**
 * @file project_index.hpp
 * @brief Static index of downloadable wordnet projects
 */

#pragma once

#include <export.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Lexicore {

struct ProjectVersion {
    std::string version;
    std::vector<std::string> urls;
    std::string blake3;  ///< expected hex digest, empty when not declared
    std::string error;   ///< set for versions that exist but must not be fetched
};

struct Project {
    std::string id;
    std::string type = "wordnet";  ///< "wordnet" or "ili"
    std::string label;
    std::string language;
    std::string license;
    std::vector<ProjectVersion> versions;  ///< index order, newest first
};

/// A project version ready to download.
struct ResolvedProject {
    std::string id;
    std::string version;
    std::string type;
    std::vector<std::string> urls;
    std::string blake3;
};

/// Splits "id:version"; version is empty for a bare id.
LEXICORE_API std::pair<std::string, std::string> split_project_spec(std::string_view spec);

/**
 * @brief Project id -> versions -> urls.
 *
 * JSON layout:
 * @code
 * { "oewn": { "label": "...", "language": "en", "license": "...",
 *             "versions": { "2024": { "urls": ["https://..."], "blake3": "..." } } } }
 * @endcode
 * Version order is the order written in the file.
 */
class LEXICORE_API ProjectIndex {
public:
    /// The index compiled into the engine.
    static ProjectIndex builtin();

    /// @throws ProjectError when the file is unreadable or malformed
    static ProjectIndex load_file(const std::filesystem::path& path);

    /// @throws ProjectError when the text is malformed
    static ProjectIndex parse(std::string_view json);

    const std::vector<Project>& projects() const { return projects_; }

    const Project* find(std::string_view id) const;

    /**
     * @brief Resolve "id" or "id:version".
     * @throws ProjectError for unknown ids/versions, error entries and versions without urls
     */
    ResolvedProject resolve(std::string_view spec) const;

private:
    std::vector<Project> projects_;
};

} // namespace Lexicore
