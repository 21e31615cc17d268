/**
 * @file entity_reader.cpp
 * @brief SQL for entity lookup and lexicon loading
 */

#include <storage/entity_reader.hpp>
#include <core/errors.hpp>
#include <core/relations.hpp>
#include <algorithm>
#include <unordered_map>

namespace Lexicore {

namespace {

PartOfSpeech stored_pos(const std::string& code) {
    auto pos = pos_from_code(code);
    if (!pos) {
        throw CorruptStoreError("Invalid part of speech in store: '" + code + "'");
    }
    return *pos;
}

LexiconInfo lexicon_from_row(const SqlRow& r) {
    LexiconInfo info;
    info.rowid = std::stoll(r[0]);
    info.lexicon.id = r[1];
    info.lexicon.label = r[2];
    info.lexicon.language = r[3];
    info.lexicon.email = r[4];
    info.lexicon.license = r[5];
    info.lexicon.version = r[6];
    info.lexicon.url = r[7];
    info.lexicon.citation = r[8];
    info.lexicon.logo = r[9];
    info.lmf_version = r[10];
    info.installed_at = r[11];
    return info;
}

constexpr const char* kLexiconColumns =
    "SELECT rowid, id, label, language, email, license, version, url, citation, logo, "
    "lmf_version, installed_at FROM lexicons";

std::string rid(const LexiconInfo& lex) {
    return std::to_string(lex.rowid);
}

} // namespace

std::vector<std::string> EntityReader::column(const std::string& sql, const std::vector<SqlParam>& params) {
    std::vector<std::string> out;
    db_.query(sql, params, [&](const SqlRow& r) { out.push_back(r[0]); });
    return out;
}

std::vector<LexiconInfo> EntityReader::lexicons() {
    std::vector<LexiconInfo> out;
    db_.query(std::string(kLexiconColumns) + " ORDER BY rowid",
              [&](const SqlRow& r) { out.push_back(lexicon_from_row(r)); });
    return out;
}

std::optional<LexiconInfo> EntityReader::lexicon(const std::string& id) {
    std::optional<LexiconInfo> out;
    db_.query(std::string(kLexiconColumns) + " WHERE id = ?", {id},
              [&](const SqlRow& r) { out = lexicon_from_row(r); });
    return out;
}

std::vector<std::string> EntityReader::word_ids(const LexiconInfo& lex, const std::string& form,
                                                std::optional<PartOfSpeech> pos) {
    std::vector<SqlParam> params{rid(lex)};
    std::string pos_clause;
    if (pos) pos_clause = " AND w.pos = ?";

    if (form.empty()) {
        if (pos) params.push_back(std::string(pos_code(*pos)));
        return column("SELECT w.id FROM words w WHERE w.lexicon_rowid = ?" + pos_clause + " ORDER BY w.id",
                      params);
    }

    params.push_back(form);
    if (pos) params.push_back(std::string(pos_code(*pos)));
    params.push_back(rid(lex));
    params.push_back(form);
    if (pos) params.push_back(std::string(pos_code(*pos)));

    return column(
        "SELECT w.id FROM words w WHERE w.lexicon_rowid = ? AND w.lemma = ?" + pos_clause +
        " UNION "
        "SELECT w.id FROM forms f JOIN words w ON w.lexicon_rowid = f.lexicon_rowid AND w.id = f.word_id "
        "WHERE f.lexicon_rowid = ? AND f.written_form = ?" + pos_clause +
        " ORDER BY 1",
        params);
}

std::vector<std::string> EntityReader::synset_ids(const LexiconInfo& lex, const std::string& form,
                                                  std::optional<PartOfSpeech> pos) {
    if (form.empty()) {
        std::vector<SqlParam> params{rid(lex)};
        std::string sql = "SELECT id FROM synsets WHERE lexicon_rowid = ?";
        if (pos) {
            sql += " AND pos = ?";
            params.push_back(std::string(pos_code(*pos)));
        }
        return column(sql + " ORDER BY id", params);
    }

    std::vector<std::string> words = word_ids(lex, form, pos);
    std::vector<std::string> out;
    std::unordered_map<std::string, bool> seen;
    for (const auto& w : words) {
        for (auto& s : column("SELECT synset_id FROM senses WHERE lexicon_rowid = ? AND word_id = ? ORDER BY rank",
                              {rid(lex), w})) {
            if (seen.emplace(s, true).second) out.push_back(std::move(s));
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> EntityReader::synset_ids_by_ili(const LexiconInfo& lex, const std::string& ili) {
    return column("SELECT id FROM synsets WHERE lexicon_rowid = ? AND ili = ? ORDER BY id", {rid(lex), ili});
}

std::optional<Word> EntityReader::word(const LexiconInfo& lex, const std::string& id) {
    std::optional<Word> out;
    db_.query("SELECT id, lemma, pos, script FROM words WHERE lexicon_rowid = ? AND id = ?", {rid(lex), id},
              [&](const SqlRow& r) {
        Word w;
        w.id = r[0];
        w.lexicon = lex.lexicon.id;
        w.lemma = r[1];
        w.pos = stored_pos(r[2]);
        w.script = r[3];
        out = std::move(w);
    });
    if (!out) return out;
    Word& w = *out;

    db_.query("SELECT form_id, written_form, script FROM forms WHERE lexicon_rowid = ? AND word_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) {
        w.forms.push_back(Form{r[0], r[1], r[2], {}});
    });
    db_.query("SELECT form_seq, category, text FROM tags WHERE lexicon_rowid = ? AND word_id = ? "
              "ORDER BY form_seq, seq", {rid(lex), id}, [&](const SqlRow& r) {
        int form_seq = std::stoi(r[0]);
        Tag tag{r[1], r[2]};
        if (form_seq < 0) w.tags.push_back(std::move(tag));
        else if (static_cast<std::size_t>(form_seq) < w.forms.size()) w.forms[form_seq].tags.push_back(std::move(tag));
    });
    db_.query("SELECT text, variety, notation, phonemic, audio FROM pronunciations "
              "WHERE lexicon_rowid = ? AND word_id = ? ORDER BY seq", {rid(lex), id}, [&](const SqlRow& r) {
        w.pronunciations.push_back(Pronunciation{r[0], r[1], r[2], r[3] != "0", r[4]});
    });
    w.senses = column("SELECT id FROM senses WHERE lexicon_rowid = ? AND word_id = ? ORDER BY rank", {rid(lex), id});
    return out;
}

std::optional<Sense> EntityReader::sense(const LexiconInfo& lex, const std::string& id) {
    std::optional<Sense> out;
    db_.query("SELECT id, word_id, synset_id, rank, sensekey, adjposition, lexicalized FROM senses "
              "WHERE lexicon_rowid = ? AND id = ?", {rid(lex), id}, [&](const SqlRow& r) {
        Sense s;
        s.id = r[0];
        s.lexicon = lex.lexicon.id;
        s.word = r[1];
        s.synset = r[2];
        s.rank = std::stoi(r[3]);
        s.sensekey = r[4];
        s.adjposition = r[5];
        s.lexicalized = r[6] != "0";
        out = std::move(s);
    });
    if (!out) return out;
    Sense& s = *out;

    db_.query("SELECT text, language FROM sense_examples WHERE lexicon_rowid = ? AND sense_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) { s.examples.push_back(Example{r[0], r[1]}); });
    db_.query("SELECT type, target_id FROM sense_relations WHERE lexicon_rowid = ? AND source_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) { s.relations.push_back(RelationEdge{r[0], r[1]}); });
    db_.query("SELECT value FROM sense_counts WHERE lexicon_rowid = ? AND sense_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) { s.counts.push_back(std::stoi(r[0])); });
    return out;
}

std::optional<Synset> EntityReader::synset(const LexiconInfo& lex, const std::string& id) {
    std::optional<Synset> out;
    db_.query("SELECT id, pos, ili, ili_definition, lexicalized FROM synsets WHERE lexicon_rowid = ? AND id = ?",
              {rid(lex), id}, [&](const SqlRow& r) {
        Synset s;
        s.id = r[0];
        s.lexicon = lex.lexicon.id;
        s.pos = stored_pos(r[1]);
        s.ili = r[2];
        s.ili_definition = r[3];
        s.lexicalized = r[4] != "0";
        out = std::move(s);
    });
    if (!out) return out;
    Synset& s = *out;

    s.members = column("SELECT id FROM senses WHERE lexicon_rowid = ? AND synset_id = ? ORDER BY member_seq",
                       {rid(lex), id});
    db_.query("SELECT text, language, source_sense FROM definitions WHERE lexicon_rowid = ? AND synset_id = ? "
              "ORDER BY seq", {rid(lex), id}, [&](const SqlRow& r) {
        s.definitions.push_back(Definition{r[0], r[1], r[2]});
    });
    db_.query("SELECT text, language FROM synset_examples WHERE lexicon_rowid = ? AND synset_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) { s.examples.push_back(Example{r[0], r[1]}); });
    db_.query("SELECT type, target_id FROM synset_relations WHERE lexicon_rowid = ? AND source_id = ? ORDER BY seq",
              {rid(lex), id}, [&](const SqlRow& r) { s.relations.push_back(RelationEdge{r[0], r[1]}); });
    return out;
}

std::optional<IliEntry> EntityReader::ili(const std::string& id) {
    std::optional<IliEntry> out;
    db_.query("SELECT id, status, definition FROM ilis WHERE id = ?", {id},
              [&](const SqlRow& r) { out = IliEntry{r[0], r[1], r[2]}; });
    return out;
}

std::vector<IliEntry> EntityReader::ilis(const std::string& status) {
    std::vector<IliEntry> out;
    auto collect = [&](const SqlRow& r) { out.push_back(IliEntry{r[0], r[1], r[2]}); };
    if (status.empty()) {
        db_.query("SELECT id, status, definition FROM ilis ORDER BY id", collect);
    } else {
        db_.query("SELECT id, status, definition FROM ilis WHERE status = ? ORDER BY id", {status}, collect);
    }
    return out;
}

std::vector<std::string> EntityReader::related_ids(const char* table, const LexiconInfo& lex,
                                                   const std::string& id, const std::string& type) {
    const std::string t(table);
    auto inverse = inverse_relation(type);
    if (!inverse) {
        return column("SELECT DISTINCT target_id FROM " + t +
                      " WHERE lexicon_rowid = ? AND source_id = ? AND type = ? ORDER BY 1",
                      {rid(lex), id, type});
    }
    return column("SELECT target_id FROM " + t + " WHERE lexicon_rowid = ? AND source_id = ? AND type = ?"
                  " UNION "
                  "SELECT source_id FROM " + t + " WHERE lexicon_rowid = ? AND target_id = ? AND type = ?"
                  " ORDER BY 1",
                  {rid(lex), id, type, rid(lex), id, std::string(*inverse)});
}

std::vector<std::string> EntityReader::related_synset_ids(const LexiconInfo& lex, const std::string& synset_id,
                                                          const std::string& type) {
    return related_ids("synset_relations", lex, synset_id, type);
}

std::vector<std::string> EntityReader::related_sense_ids(const LexiconInfo& lex, const std::string& sense_id,
                                                         const std::string& type) {
    return related_ids("sense_relations", lex, sense_id, type);
}

Document EntityReader::load_lexicon(const LexiconInfo& lex) {
    Document doc;
    doc.lmf_version = lex.lmf_version;
    doc.lexicons.push_back(lex.lexicon);
    const std::string r = rid(lex);

    std::unordered_map<std::string, std::size_t> word_at;
    db_.query("SELECT id, lemma, pos, script FROM words WHERE lexicon_rowid = ? ORDER BY rowid", {r},
              [&](const SqlRow& row) {
        Word w;
        w.id = row[0];
        w.lexicon = lex.lexicon.id;
        w.lemma = row[1];
        w.pos = stored_pos(row[2]);
        w.script = row[3];
        word_at.emplace(w.id, doc.words.size());
        doc.words.push_back(std::move(w));
    });
    auto word_ref = [&](const std::string& id) -> Word& {
        auto it = word_at.find(id);
        if (it == word_at.end()) throw CorruptStoreError("Dangling word reference: " + id);
        return doc.words[it->second];
    };

    db_.query("SELECT word_id, form_id, written_form, script FROM forms WHERE lexicon_rowid = ? "
              "ORDER BY word_id, seq", {r}, [&](const SqlRow& row) {
        word_ref(row[0]).forms.push_back(Form{row[1], row[2], row[3], {}});
    });
    db_.query("SELECT word_id, form_seq, category, text FROM tags WHERE lexicon_rowid = ? "
              "ORDER BY word_id, form_seq, seq", {r}, [&](const SqlRow& row) {
        Word& w = word_ref(row[0]);
        int form_seq = std::stoi(row[1]);
        Tag tag{row[2], row[3]};
        if (form_seq < 0) w.tags.push_back(std::move(tag));
        else if (static_cast<std::size_t>(form_seq) < w.forms.size()) w.forms[form_seq].tags.push_back(std::move(tag));
    });
    db_.query("SELECT word_id, text, variety, notation, phonemic, audio FROM pronunciations "
              "WHERE lexicon_rowid = ? ORDER BY word_id, seq", {r}, [&](const SqlRow& row) {
        word_ref(row[0]).pronunciations.push_back(Pronunciation{row[1], row[2], row[3], row[4] != "0", row[5]});
    });

    std::unordered_map<std::string, std::size_t> sense_at;
    db_.query("SELECT id, word_id, synset_id, rank, sensekey, adjposition, lexicalized FROM senses "
              "WHERE lexicon_rowid = ? ORDER BY rowid", {r}, [&](const SqlRow& row) {
        Sense s;
        s.id = row[0];
        s.lexicon = lex.lexicon.id;
        s.word = row[1];
        s.synset = row[2];
        s.rank = std::stoi(row[3]);
        s.sensekey = row[4];
        s.adjposition = row[5];
        s.lexicalized = row[6] != "0";
        sense_at.emplace(s.id, doc.senses.size());
        doc.senses.push_back(std::move(s));
    });
    auto sense_ref = [&](const std::string& id) -> Sense& {
        auto it = sense_at.find(id);
        if (it == sense_at.end()) throw CorruptStoreError("Dangling sense reference: " + id);
        return doc.senses[it->second];
    };
    db_.query("SELECT word_id, id FROM senses WHERE lexicon_rowid = ? ORDER BY word_id, rank", {r},
              [&](const SqlRow& row) { word_ref(row[0]).senses.push_back(row[1]); });
    db_.query("SELECT sense_id, text, language FROM sense_examples WHERE lexicon_rowid = ? "
              "ORDER BY sense_id, seq", {r}, [&](const SqlRow& row) {
        sense_ref(row[0]).examples.push_back(Example{row[1], row[2]});
    });
    db_.query("SELECT source_id, type, target_id FROM sense_relations WHERE lexicon_rowid = ? "
              "ORDER BY source_id, seq", {r}, [&](const SqlRow& row) {
        sense_ref(row[0]).relations.push_back(RelationEdge{row[1], row[2]});
    });
    db_.query("SELECT sense_id, value FROM sense_counts WHERE lexicon_rowid = ? ORDER BY sense_id, seq", {r},
              [&](const SqlRow& row) { sense_ref(row[0]).counts.push_back(std::stoi(row[1])); });

    std::unordered_map<std::string, std::size_t> synset_at;
    db_.query("SELECT id, pos, ili, ili_definition, lexicalized FROM synsets WHERE lexicon_rowid = ? "
              "ORDER BY rowid", {r}, [&](const SqlRow& row) {
        Synset s;
        s.id = row[0];
        s.lexicon = lex.lexicon.id;
        s.pos = stored_pos(row[1]);
        s.ili = row[2];
        s.ili_definition = row[3];
        s.lexicalized = row[4] != "0";
        if (!s.ili.empty()) doc.ili_refs.push_back(s.ili);
        synset_at.emplace(s.id, doc.synsets.size());
        doc.synsets.push_back(std::move(s));
    });
    auto synset_ref = [&](const std::string& id) -> Synset& {
        auto it = synset_at.find(id);
        if (it == synset_at.end()) throw CorruptStoreError("Dangling synset reference: " + id);
        return doc.synsets[it->second];
    };
    db_.query("SELECT synset_id, id FROM senses WHERE lexicon_rowid = ? ORDER BY synset_id, member_seq", {r},
              [&](const SqlRow& row) { synset_ref(row[0]).members.push_back(row[1]); });
    db_.query("SELECT synset_id, text, language, source_sense FROM definitions WHERE lexicon_rowid = ? "
              "ORDER BY synset_id, seq", {r}, [&](const SqlRow& row) {
        synset_ref(row[0]).definitions.push_back(Definition{row[1], row[2], row[3]});
    });
    db_.query("SELECT synset_id, text, language FROM synset_examples WHERE lexicon_rowid = ? "
              "ORDER BY synset_id, seq", {r}, [&](const SqlRow& row) {
        synset_ref(row[0]).examples.push_back(Example{row[1], row[2]});
    });
    db_.query("SELECT source_id, type, target_id FROM synset_relations WHERE lexicon_rowid = ? "
              "ORDER BY source_id, seq", {r}, [&](const SqlRow& row) {
        synset_ref(row[0]).relations.push_back(RelationEdge{row[1], row[2]});
    });

    // Distinct ILI refs, first-seen order
    std::vector<std::string> distinct;
    std::unordered_map<std::string, bool> seen;
    for (auto& ili : doc.ili_refs) {
        if (seen.emplace(ili, true).second) distinct.push_back(std::move(ili));
    }
    doc.ili_refs = std::move(distinct);
    return doc;
}

} // namespace Lexicore
