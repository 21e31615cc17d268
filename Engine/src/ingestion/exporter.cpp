/**
 * @file exporter.cpp
 * @brief LMF / JSON / CSV export
 */

#include <ingestion/exporter.hpp>
#include <core/errors.hpp>
#include <lmf/lmf_writer.hpp>
#include <storage/entity_reader.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace Lexicore {

using ordered_json = nlohmann::ordered_json;

namespace {

void put(ordered_json& obj, const char* key, const std::string& value) {
    if (!value.empty()) obj[key] = value;
}

ordered_json examples_json(const std::vector<Example>& examples) {
    ordered_json arr = ordered_json::array();
    for (const auto& ex : examples) {
        ordered_json e;
        e["text"] = ex.text;
        put(e, "language", ex.language);
        arr.push_back(std::move(e));
    }
    return arr;
}

ordered_json relations_json(const std::vector<RelationEdge>& relations) {
    ordered_json arr = ordered_json::array();
    for (const auto& rel : relations) {
        arr.push_back({{"type", rel.type}, {"target", rel.target}});
    }
    return arr;
}

ordered_json lexicon_json(const LexiconInfo& info, const Document& doc) {
    const Lexicon& lex = info.lexicon;
    ordered_json out;
    out["id"] = lex.id;
    out["label"] = lex.label;
    out["language"] = lex.language;
    out["email"] = lex.email;
    out["license"] = lex.license;
    out["version"] = lex.version;
    out["url"] = lex.url;
    out["citation"] = lex.citation;
    out["logo"] = lex.logo;
    out["lmf_version"] = info.lmf_version;

    ordered_json words = ordered_json::array();
    for (const auto& w : doc.words) {
        ordered_json j;
        j["id"] = w.id;
        j["lemma"] = w.lemma;
        j["pos"] = pos_code(w.pos);
        put(j, "script", w.script);
        ordered_json forms = ordered_json::array();
        for (const auto& f : w.forms) {
            ordered_json fj;
            put(fj, "id", f.id);
            fj["written_form"] = f.written_form;
            put(fj, "script", f.script);
            forms.push_back(std::move(fj));
        }
        j["forms"] = std::move(forms);
        j["senses"] = w.senses;
        words.push_back(std::move(j));
    }
    out["words"] = std::move(words);

    ordered_json senses = ordered_json::array();
    for (const auto& s : doc.senses) {
        ordered_json j;
        j["id"] = s.id;
        j["word"] = s.word;
        j["synset"] = s.synset;
        j["rank"] = s.rank;
        put(j, "sensekey", s.sensekey);
        put(j, "adjposition", s.adjposition);
        if (!s.lexicalized) j["lexicalized"] = false;
        j["examples"] = examples_json(s.examples);
        j["relations"] = relations_json(s.relations);
        if (!s.counts.empty()) j["counts"] = s.counts;
        senses.push_back(std::move(j));
    }
    out["senses"] = std::move(senses);

    ordered_json synsets = ordered_json::array();
    for (const auto& ss : doc.synsets) {
        ordered_json j;
        j["id"] = ss.id;
        j["pos"] = pos_code(ss.pos);
        put(j, "ili", ss.ili);
        put(j, "ili_definition", ss.ili_definition);
        if (!ss.lexicalized) j["lexicalized"] = false;
        j["members"] = ss.members;
        ordered_json defs = ordered_json::array();
        for (const auto& d : ss.definitions) {
            ordered_json dj;
            dj["text"] = d.text;
            put(dj, "language", d.language);
            put(dj, "source_sense", d.source_sense);
            defs.push_back(std::move(dj));
        }
        j["definitions"] = std::move(defs);
        j["examples"] = examples_json(ss.examples);
        j["relations"] = relations_json(ss.relations);
        synsets.push_back(std::move(j));
    }
    out["synsets"] = std::move(synsets);
    return out;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

void write_csv(std::ostream& out, const Document& doc) {
    std::unordered_map<std::string, const Sense*> senses;
    std::unordered_map<std::string, const Synset*> synsets;
    for (const auto& s : doc.senses) senses.emplace(s.id, &s);
    for (const auto& ss : doc.synsets) synsets.emplace(ss.id, &ss);

    for (const auto& w : doc.words) {
        for (const auto& sense_id : w.senses) {
            auto sit = senses.find(sense_id);
            if (sit == senses.end()) continue;
            const Sense* sense = sit->second;
            auto yit = synsets.find(sense->synset);
            const Synset* synset = yit == synsets.end() ? nullptr : yit->second;
            std::string ili = synset ? synset->ili : std::string();
            std::string definition = synset && !synset->definitions.empty()
                ? synset->definitions.front().text : std::string();
            out << csv_field(w.lexicon) << ',' << csv_field(w.id) << ',' << csv_field(w.lemma) << ','
                << pos_code(w.pos) << ',' << csv_field(sense->id) << ',' << csv_field(sense->synset) << ','
                << csv_field(ili) << ',' << csv_field(definition) << '\n';
        }
    }
}

} // namespace

std::optional<ExportFormat> export_format_from_name(std::string_view name) {
    if (name == "lmf" || name == "xml") return ExportFormat::Lmf;
    if (name == "json") return ExportFormat::Json;
    if (name == "csv") return ExportFormat::Csv;
    return std::nullopt;
}

std::vector<std::string> Exporter::selected(const ExportOptions& options) {
    std::vector<std::string> ids;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto installed = reader.lexicons();
        for (const auto& want : options.include) {
            bool found = std::any_of(installed.begin(), installed.end(),
                                     [&](const LexiconInfo& l) { return l.lexicon.id == want; });
            if (!found) {
                throw NotFoundError("Cannot export unknown lexicon: " + want);
            }
        }
        for (const auto& info : installed) {
            const auto& id = info.lexicon.id;
            if (!options.include.empty() &&
                std::find(options.include.begin(), options.include.end(), id) == options.include.end()) {
                continue;
            }
            if (std::find(options.exclude.begin(), options.exclude.end(), id) != options.exclude.end()) {
                continue;
            }
            ids.push_back(id);
        }
    });
    return ids;
}

void Exporter::write(std::ostream& out, const ExportOptions& options) {
    auto ids = selected(options);

    // One snapshot for the whole export
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);

        if (options.format == ExportFormat::Csv) {
            out << "lexicon,word,lemma,pos,sense,synset,ili,definition\n";
        }

        Document merged;
        ordered_json json_lexicons = ordered_json::array();

        for (const auto& id : ids) {
            auto info = reader.lexicon(id);
            if (!info) continue;  // removed between selection and snapshot
            Document doc = reader.load_lexicon(*info);

            switch (options.format) {
                case ExportFormat::Csv:
                    write_csv(out, doc);
                    break;
                case ExportFormat::Json:
                    json_lexicons.push_back(lexicon_json(*info, doc));
                    break;
                case ExportFormat::Lmf:
                    if (merged.lmf_version.empty()) merged.lmf_version = info->lmf_version;
                    std::move(doc.lexicons.begin(), doc.lexicons.end(), std::back_inserter(merged.lexicons));
                    std::move(doc.words.begin(), doc.words.end(), std::back_inserter(merged.words));
                    std::move(doc.senses.begin(), doc.senses.end(), std::back_inserter(merged.senses));
                    std::move(doc.synsets.begin(), doc.synsets.end(), std::back_inserter(merged.synsets));
                    break;
            }
        }

        if (options.format == ExportFormat::Json) {
            ordered_json root;
            root["lexicons"] = std::move(json_lexicons);
            out << root.dump(2) << '\n';
        } else if (options.format == ExportFormat::Lmf) {
            LmfWriter writer;
            writer.write_lexicon(merged);
            writer.close();
            out << writer.str();
        }
    });

    if (!out) {
        throw Error("Export output stream failed");
    }
    Logger::info("Exported " + std::to_string(ids.size()) + " lexicon(s)");
}

void Exporter::write_file(const std::filesystem::path& path, const ExportOptions& options) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error("Cannot open export file: " + path.string());
    }
    write(out, options);
}

} // namespace Lexicore
