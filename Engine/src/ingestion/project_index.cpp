/**
 * @file project_index.cpp
 * @brief Project index parsing and specifier resolution
 */

#include <ingestion/project_index.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace Lexicore {

namespace {

constexpr const char* BUILTIN_INDEX = R"JSON({
  "cili": {
    "type": "ili",
    "label": "Collaborative Interlingual Index",
    "license": "https://creativecommons.org/licenses/by/4.0/",
    "versions": {
      "1.0": { "urls": ["https://github.com/globalwordnet/cili/releases/download/v1.0/cili.tsv.xz"] }
    }
  },
  "oewn": {
    "label": "Open English WordNet",
    "language": "en",
    "license": "https://creativecommons.org/licenses/by/4.0/",
    "versions": {
      "2024": { "urls": [
        "https://en-word.net/static/english-wordnet-2024.xml.gz",
        "https://github.com/globalwordnet/english-wordnet/releases/download/2024-edition/english-wordnet-2024.xml.gz"
      ] },
      "2023": { "urls": [
        "https://en-word.net/static/english-wordnet-2023.xml.gz",
        "https://github.com/globalwordnet/english-wordnet/releases/download/2023-edition/english-wordnet-2023.xml.gz"
      ] },
      "2022": { "urls": [
        "https://en-word.net/static/english-wordnet-2022.xml.gz",
        "https://github.com/globalwordnet/english-wordnet/releases/download/2022-edition/english-wordnet-2022.xml.gz"
      ] },
      "2021": { "urls": ["https://en-word.net/static/english-wordnet-2021.xml.gz"] },
      "2020": { "error": "Use 'ewn' as the ID prior to version 2021 ('ewn:2020')" },
      "2019": { "error": "Use 'ewn' as the ID prior to version 2021 ('ewn:2019')" }
    }
  },
  "ewn": {
    "label": "Open English WordNet",
    "language": "en",
    "license": "https://creativecommons.org/licenses/by/4.0/",
    "versions": {
      "2021": { "error": "Use 'oewn' as the ID from version 2021 ('oewn:2021')" },
      "2020": { "urls": ["https://en-word.net/static/english-wordnet-2020.xml.gz"] },
      "2019": { "urls": ["https://en-word.net/static/english-wordnet-2019.xml.gz"] }
    }
  },
  "odenet": {
    "label": "Open German WordNet",
    "language": "de",
    "license": "https://creativecommons.org/licenses/by-sa/4.0/",
    "versions": {
      "1.4": { "urls": ["https://github.com/hdaSprachtechnologie/odenet/releases/download/v1.4/odenet-1.4.tar.xz"] },
      "1.3": { "urls": ["https://github.com/hdaSprachtechnologie/odenet/releases/download/v1.3/odenet-1.3.tar.xz"] }
    }
  },
  "omw": {
    "label": "Open Multilingual Wordnet",
    "language": "mul",
    "license": "Please consult the LICENSE files included with the individual wordnets.",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-1.4.tar.xz"] },
      "1.3": { "error": "OMW 1.3 is no longer indexed" }
    }
  },
  "omw-en": {
    "label": "OMW English Wordnet based on WordNet 3.0",
    "language": "en",
    "license": "https://wordnet.princeton.edu/license-and-commercial-use",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-en-1.4.tar.xz"] }
    }
  },
  "omw-en31": {
    "label": "OMW English Wordnet based on WordNet 3.1",
    "language": "en",
    "license": "https://wordnet.princeton.edu/license-and-commercial-use",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-en31-1.4.tar.xz"] }
    }
  },
  "omw-es": {
    "label": "Multilingual Central Repository (Spanish)",
    "language": "es",
    "license": "https://creativecommons.org/licenses/by/3.0/",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-es-1.4.tar.xz"] }
    }
  },
  "omw-fr": {
    "label": "WOLF (Wordnet Libre du Français)",
    "language": "fr",
    "license": "http://www.cecill.info/licenses/Licence_CeCILL-C_V1-en.html",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-fr-1.4.tar.xz"] }
    }
  },
  "omw-ja": {
    "label": "Japanese Wordnet",
    "language": "ja",
    "license": "wordnet",
    "versions": {
      "1.4": { "urls": ["https://github.com/omwn/omw-data/releases/download/v1.4/omw-ja-1.4.tar.xz"] }
    }
  }
})JSON";

std::string string_or(const nlohmann::ordered_json& obj, const char* key, std::string fallback = {}) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw ProjectError(std::string("Project index field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

ProjectVersion read_version(const std::string& version, const nlohmann::ordered_json& obj) {
    if (!obj.is_object()) {
        throw ProjectError("Project index version '" + version + "' must be an object");
    }
    ProjectVersion out;
    out.version = version;
    out.blake3 = string_or(obj, "blake3");
    out.error = string_or(obj, "error");
    if (auto it = obj.find("urls"); it != obj.end()) {
        if (!it->is_array()) {
            throw ProjectError("Project index 'urls' of version '" + version + "' must be an array");
        }
        for (const auto& url : *it) {
            out.urls.push_back(url.get<std::string>());
        }
    }
    return out;
}

} // namespace

std::pair<std::string, std::string> split_project_spec(std::string_view spec) {
    auto colon = spec.find(':');
    if (colon == std::string_view::npos) {
        return {std::string(spec), std::string()};
    }
    return {std::string(spec.substr(0, colon)), std::string(spec.substr(colon + 1))};
}

ProjectIndex ProjectIndex::builtin() {
    return parse(BUILTIN_INDEX);
}

ProjectIndex ProjectIndex::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ProjectError("Cannot open project index: " + path.string());
    }
    std::ostringstream text;
    text << file.rdbuf();
    return parse(text.str());
}

ProjectIndex ProjectIndex::parse(std::string_view json) {
    nlohmann::ordered_json root;
    try {
        root = nlohmann::ordered_json::parse(json.begin(), json.end());
    } catch (const nlohmann::json::exception& e) {
        throw ProjectError(std::string("Malformed project index: ") + e.what());
    }
    if (!root.is_object()) {
        throw ProjectError("Project index must be a JSON object");
    }

    ProjectIndex index;
    try {
        for (const auto& [id, obj] : root.items()) {
            if (!obj.is_object()) {
                throw ProjectError("Project '" + id + "' must be an object");
            }
            Project project;
            project.id = id;
            project.type = string_or(obj, "type", "wordnet");
            project.label = string_or(obj, "label");
            project.language = string_or(obj, "language");
            project.license = string_or(obj, "license");
            if (project.type != "wordnet" && project.type != "ili") {
                throw ProjectError("Project '" + id + "' has unknown type '" + project.type + "'");
            }
            if (auto versions = obj.find("versions"); versions != obj.end() && versions->is_object()) {
                for (const auto& [version, vobj] : versions->items()) {
                    project.versions.push_back(read_version(version, vobj));
                }
            }
            index.projects_.push_back(std::move(project));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProjectError(std::string("Malformed project index: ") + e.what());
    }
    return index;
}

const Project* ProjectIndex::find(std::string_view id) const {
    for (const auto& project : projects_) {
        if (project.id == id) return &project;
    }
    return nullptr;
}

ResolvedProject ProjectIndex::resolve(std::string_view spec) const {
    auto [id, version] = split_project_spec(spec);
    const Project* project = find(id);
    if (!project) {
        throw ProjectError("Unknown project: " + id);
    }
    if (project->versions.empty()) {
        throw ProjectError("Project has no versions: " + id);
    }

    const ProjectVersion* chosen = nullptr;
    if (version.empty()) {
        chosen = &project->versions.front();
    } else {
        for (const auto& v : project->versions) {
            if (v.version == version) {
                chosen = &v;
                break;
            }
        }
        if (!chosen) {
            throw ProjectError("Unknown version '" + version + "' of project " + id);
        }
    }

    if (!chosen->error.empty()) {
        throw ProjectError(id + ":" + chosen->version + ": " + chosen->error);
    }
    if (chosen->urls.empty()) {
        throw ProjectError("No download urls for " + id + ":" + chosen->version);
    }

    ResolvedProject out;
    out.id = project->id;
    out.version = chosen->version;
    out.type = project->type;
    out.urls = chosen->urls;
    out.blake3 = chosen->blake3;
    return out;
}

} // namespace Lexicore
