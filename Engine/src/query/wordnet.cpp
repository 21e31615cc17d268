/**
 * @file wordnet.cpp
 * @brief Query façade: lexicon fan-out, relation traversal, analytics
 */

#include <query/wordnet.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace Lexicore {

namespace {

std::vector<std::string> split_spaces(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> out;
    for (std::string item; in >> item;) out.push_back(item);
    return out;
}

bool matches(const LexiconInfo& info, const std::string& spec) {
    auto colon = spec.find(':');
    if (colon == std::string::npos) return info.lexicon.id == spec;
    return info.lexicon.id == spec.substr(0, colon) && info.lexicon.version == spec.substr(colon + 1);
}

/// Union of per-form id lists, sorted.
template <typename Lookup>
std::vector<std::string> merged_ids(const std::vector<std::string>& forms, Lookup lookup) {
    if (forms.size() == 1) return lookup(forms.front());
    std::vector<std::string> out;
    for (const auto& form : forms) {
        auto more = lookup(form);
        out.insert(out.end(), more.begin(), more.end());
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace

Wordnet::Wordnet(Session& session, std::string lexicon, std::string lang, WordnetOptions options)
    : session_(session), lexicon_(lexicon.empty() ? "*" : std::move(lexicon)), lang_(std::move(lang)),
      options_(std::move(options)) {}

std::string Wordnet::normalize(const std::string& form) const {
    if (form.empty() || !options_.normalizer) return form;
    return options_.normalizer(form);
}

std::vector<std::string> Wordnet::lemma_forms(const std::string& form, std::optional<PartOfSpeech> pos) const {
    std::vector<std::string> out;
    if (form.empty() || !options_.search_all_forms || !options_.lemmatizer) return out;
    for (const auto& [code, lemmas] : options_.lemmatizer(form, pos)) {
        for (const auto& lemma : lemmas) {
            if (!lemma.empty()) out.push_back(lemma);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<LexiconInfo> Wordnet::select(EntityReader& reader) {
    std::vector<LexiconInfo> out;
    const bool all = lexicon_ == "*";
    const auto wanted = all ? std::vector<std::string>{} : split_spaces(lexicon_);

    for (auto& info : reader.lexicons()) {
        if (!lang_.empty() && info.lexicon.language != lang_) continue;
        if (!all && std::none_of(wanted.begin(), wanted.end(),
                                 [&](const std::string& w) { return matches(info, w); })) {
            continue;
        }
        out.push_back(std::move(info));
    }
    return out;
}

void Wordnet::each_lexicon(const LexiconVisitor& fn) {
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        for (const auto& info : select(reader)) {
            try {
                fn(reader, info);
            } catch (const Error& e) {
                Logger::warn("Lexicon " + info.lexicon.id + " excluded from results: " + e.what());
            }
        }
    });
}

std::vector<LexiconInfo> Wordnet::lexicons() {
    std::vector<LexiconInfo> out;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        out = select(reader);
    });
    return out;
}

std::vector<Word> Wordnet::words(const std::string& form, std::optional<PartOfSpeech> pos) {
    auto normalized = normalize(form);
    auto out = find_words({normalized}, pos);
    if (out.empty()) {
        if (auto lemmas = lemma_forms(normalized, pos); !lemmas.empty()) out = find_words(lemmas, pos);
    }
    return out;
}

std::vector<Sense> Wordnet::senses(const std::string& form, std::optional<PartOfSpeech> pos) {
    auto normalized = normalize(form);
    auto out = find_senses({normalized}, pos);
    if (out.empty()) {
        if (auto lemmas = lemma_forms(normalized, pos); !lemmas.empty()) out = find_senses(lemmas, pos);
    }
    return out;
}

std::vector<Synset> Wordnet::synsets(const std::string& form, std::optional<PartOfSpeech> pos) {
    auto normalized = normalize(form);
    auto out = find_synsets({normalized}, pos);
    if (out.empty()) {
        if (auto lemmas = lemma_forms(normalized, pos); !lemmas.empty()) out = find_synsets(lemmas, pos);
    }
    return out;
}

std::vector<Word> Wordnet::find_words(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos) {
    std::vector<Word> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        std::vector<Word> found;
        auto ids = merged_ids(forms, [&](const std::string& f) { return reader.word_ids(lex, f, pos); });
        for (const auto& id : ids) {
            if (auto w = reader.word(lex, id)) found.push_back(std::move(*w));
        }
        std::move(found.begin(), found.end(), std::back_inserter(out));
    });
    return out;
}

std::vector<Sense> Wordnet::find_senses(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos) {
    std::vector<Sense> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        std::vector<Sense> found;
        auto ids = merged_ids(forms, [&](const std::string& f) { return reader.word_ids(lex, f, pos); });
        for (const auto& word_id : ids) {
            auto w = reader.word(lex, word_id);
            if (!w) continue;
            for (const auto& sense_id : w->senses) {
                if (auto s = reader.sense(lex, sense_id)) found.push_back(std::move(*s));
            }
        }
        std::move(found.begin(), found.end(), std::back_inserter(out));
    });
    return out;
}

std::vector<Synset> Wordnet::find_synsets(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos) {
    std::vector<Synset> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        std::vector<Synset> found;
        auto ids = merged_ids(forms, [&](const std::string& f) { return reader.synset_ids(lex, f, pos); });
        for (const auto& id : ids) {
            if (auto s = reader.synset(lex, id)) found.push_back(std::move(*s));
        }
        std::move(found.begin(), found.end(), std::back_inserter(out));
    });
    return out;
}

std::vector<Synset> Wordnet::synsets_by_ili(const std::string& ili) {
    std::vector<Synset> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        std::vector<Synset> found;
        for (const auto& id : reader.synset_ids_by_ili(lex, ili)) {
            if (auto s = reader.synset(lex, id)) found.push_back(std::move(*s));
        }
        std::move(found.begin(), found.end(), std::back_inserter(out));
    });
    return out;
}

std::optional<Word> Wordnet::word(const std::string& id) {
    std::optional<Word> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        if (!out) out = reader.word(lex, id);
    });
    return out;
}

std::optional<Sense> Wordnet::sense(const std::string& id) {
    std::optional<Sense> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        if (!out) out = reader.sense(lex, id);
    });
    return out;
}

std::optional<Synset> Wordnet::synset(const std::string& id) {
    std::optional<Synset> out;
    each_lexicon([&](EntityReader& reader, const LexiconInfo& lex) {
        if (!out) out = reader.synset(lex, id);
    });
    return out;
}

std::optional<IliResult> Wordnet::ili(const std::string& id) {
    std::optional<IliResult> out;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto entry = reader.ili(id);
        if (!entry) return;
        out = IliResult{std::move(*entry), {}};
        for (const auto& lex : select(reader)) {
            try {
                for (const auto& sid : reader.synset_ids_by_ili(lex, id)) {
                    if (auto s = reader.synset(lex, sid)) out->synsets.push_back(std::move(*s));
                }
            } catch (const Error& e) {
                Logger::warn("Lexicon " + lex.lexicon.id + " excluded from ILI lookup: " + e.what());
            }
        }
    });
    return out;
}

std::vector<IliEntry> Wordnet::ilis(const std::string& status) {
    std::vector<IliEntry> out;
    session_.store().read([&](SqliteConnection& db) {
        out = EntityReader(db).ilis(status);
    });
    return out;
}

std::optional<std::string> Wordnet::definition(const std::string& synset_id) {
    auto ss = synset(synset_id);
    if (!ss || ss->definitions.empty()) return std::nullopt;
    if (!lang_.empty()) {
        for (const auto& d : ss->definitions) {
            if (d.language == lang_) return d.text;
        }
    }
    return ss->definitions.front().text;
}

std::vector<Synset> Wordnet::related(const Synset& synset, const std::string& type) {
    return related_any(synset, {type.c_str()});
}

std::vector<Synset> Wordnet::related_any(const Synset& synset, std::initializer_list<const char*> types) {
    std::vector<Synset> out;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto lex = reader.lexicon(synset.lexicon);
        if (!lex) return;

        std::vector<std::string> ids;
        for (const char* type : types) {
            auto more = reader.related_synset_ids(*lex, synset.id, type);
            ids.insert(ids.end(), more.begin(), more.end());
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        for (const auto& id : ids) {
            if (auto s = reader.synset(*lex, id)) out.push_back(std::move(*s));
        }
    });
    return out;
}

std::vector<Synset> Wordnet::hypernyms(const Synset& synset) {
    return related_any(synset, {"hypernym", "instance_hypernym"});
}

std::vector<Synset> Wordnet::hyponyms(const Synset& synset) {
    return related_any(synset, {"hyponym", "instance_hyponym"});
}

std::vector<Sense> Wordnet::sense_related(const Sense& sense, const std::string& type) {
    std::vector<Sense> out;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto lex = reader.lexicon(sense.lexicon);
        if (!lex) return;
        for (const auto& id : reader.related_sense_ids(*lex, sense.id, type)) {
            if (auto s = reader.sense(*lex, id)) out.push_back(std::move(*s));
        }
    });
    return out;
}

std::vector<Synset> Wordnet::translate(const Synset& synset, const std::string& lexicon) {
    std::vector<Synset> out;
    if (synset.ili.empty()) return out;
    session_.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto lex = reader.lexicon(lexicon);
        if (!lex) return;
        for (const auto& id : reader.synset_ids_by_ili(*lex, synset.ili)) {
            if (auto s = reader.synset(*lex, id)) out.push_back(std::move(*s));
        }
    });
    return out;
}

StoreTotals Wordnet::stats() {
    StoreTotals out;
    session_.store().read([&](SqliteConnection& db) { out = Statistics(db).totals(); });
    return out;
}

DataQuality Wordnet::data_quality(const std::string& lexicon) {
    DataQuality out;
    session_.store().read([&](SqliteConnection& db) { out = Statistics(db).quality(lexicon); });
    return out;
}

std::map<std::string, long long> Wordnet::pos_distribution(const std::string& lexicon) {
    std::map<std::string, long long> out;
    session_.store().read([&](SqliteConnection& db) { out = Statistics(db).pos_distribution(lexicon); });
    return out;
}

std::optional<LexiconStats> Wordnet::lexicon_stats(const std::string& id) {
    std::optional<LexiconStats> out;
    session_.store().read([&](SqliteConnection& db) { out = Statistics(db).lexicon(id); });
    return out;
}

SynsetSizeStats Wordnet::synset_sizes(const std::string& lexicon) {
    SynsetSizeStats out;
    session_.store().read([&](SqliteConnection& db) { out = Statistics(db).synset_sizes(lexicon); });
    return out;
}

} // namespace Lexicore
