/**
 * @file lexicon_writer.cpp
 * @brief Batched inserts of parsed documents
 */

#include <storage/lexicon_writer.hpp>
#include <core/errors.hpp>
#include <database/bulk_insert.hpp>
#include <utils/logger.hpp>
#include <unordered_map>

namespace Lexicore {

namespace {

SqlParam opt(const std::string& s) {
    return s.empty() ? SqlParam() : SqlParam(s);
}

std::string num(long long v) {
    return std::to_string(v);
}

} // namespace

bool LexiconWriter::exists(const std::string& lexicon_id) {
    return db_.query_single("SELECT 1 FROM lexicons WHERE id = ?", {lexicon_id}).has_value();
}

long long LexiconWriter::insert_lexicon_row(const Lexicon& lex, const std::string& lmf_version) {
    db_.execute(
        "INSERT INTO lexicons (id, label, language, email, license, version, url, citation, logo, lmf_version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {lex.id, lex.label, lex.language, lex.email, lex.license, lex.version,
         opt(lex.url), opt(lex.citation), opt(lex.logo), opt(lmf_version)});
    auto rowid = db_.query_single("SELECT rowid FROM lexicons WHERE id = ?", {lex.id});
    if (!rowid) {
        throw StorageError("Lexicon row vanished after insert: " + lex.id);
    }
    return std::stoll(*rowid);
}

void LexiconWriter::insert(const Document& doc) {
    std::unordered_map<std::string, long long> rowids;
    for (const auto& lex : doc.lexicons) {
        rowids[lex.id] = insert_lexicon_row(lex, doc.lmf_version);
    }
    auto rowid_of = [&](const std::string& lexicon_id) {
        auto it = rowids.find(lexicon_id);
        if (it == rowids.end()) {
            throw StorageError("Entity refers to lexicon not in document: " + lexicon_id);
        }
        return num(it->second);
    };

    BulkInsert bulk(db_);

    bulk.begin_table("words", {"lexicon_rowid", "id", "lemma", "pos", "script"});
    for (const auto& w : doc.words) {
        bulk.add_row({rowid_of(w.lexicon), w.id, w.lemma, std::string(pos_code(w.pos)), opt(w.script)});
    }

    bulk.begin_table("forms", {"lexicon_rowid", "word_id", "seq", "form_id", "written_form", "script"});
    for (const auto& w : doc.words) {
        for (std::size_t i = 0; i < w.forms.size(); ++i) {
            const Form& f = w.forms[i];
            bulk.add_row({rowid_of(w.lexicon), w.id, num(i), opt(f.id), f.written_form, opt(f.script)});
        }
    }

    bulk.begin_table("tags", {"lexicon_rowid", "word_id", "form_seq", "seq", "category", "text"});
    for (const auto& w : doc.words) {
        for (std::size_t i = 0; i < w.tags.size(); ++i) {
            bulk.add_row({rowid_of(w.lexicon), w.id, num(-1), num(i), w.tags[i].category, w.tags[i].text});
        }
        for (std::size_t f = 0; f < w.forms.size(); ++f) {
            const auto& tags = w.forms[f].tags;
            for (std::size_t i = 0; i < tags.size(); ++i) {
                bulk.add_row({rowid_of(w.lexicon), w.id, num(f), num(i), tags[i].category, tags[i].text});
            }
        }
    }

    bulk.begin_table("pronunciations",
                     {"lexicon_rowid", "word_id", "seq", "text", "variety", "notation", "phonemic", "audio"});
    for (const auto& w : doc.words) {
        for (std::size_t i = 0; i < w.pronunciations.size(); ++i) {
            const Pronunciation& p = w.pronunciations[i];
            bulk.add_row({rowid_of(w.lexicon), w.id, num(i), p.text, opt(p.variety), opt(p.notation),
                          num(p.phonemic ? 1 : 0), opt(p.audio)});
        }
    }

    bulk.begin_table("synsets", {"lexicon_rowid", "id", "pos", "ili", "ili_definition", "lexicalized"});
    std::unordered_map<std::string, std::size_t> member_seq;
    for (const auto& s : doc.synsets) {
        bulk.add_row({rowid_of(s.lexicon), s.id, std::string(pos_code(s.pos)), opt(s.ili),
                      opt(s.ili_definition), num(s.lexicalized ? 1 : 0)});
        for (std::size_t i = 0; i < s.members.size(); ++i) {
            member_seq[s.lexicon + '\x1f' + s.members[i]] = i;
        }
    }

    bulk.begin_table("senses", {"lexicon_rowid", "id", "word_id", "synset_id", "rank", "member_seq",
                                "sensekey", "adjposition", "lexicalized"});
    for (const auto& s : doc.senses) {
        auto it = member_seq.find(s.lexicon + '\x1f' + s.id);
        if (it == member_seq.end()) {
            throw StorageError("Sense " + s.id + " is not a member of its synset " + s.synset);
        }
        bulk.add_row({rowid_of(s.lexicon), s.id, s.word, s.synset, num(s.rank), num(it->second),
                      opt(s.sensekey), opt(s.adjposition), num(s.lexicalized ? 1 : 0)});
    }

    bulk.begin_table("sense_counts", {"lexicon_rowid", "sense_id", "seq", "value"});
    for (const auto& s : doc.senses) {
        for (std::size_t i = 0; i < s.counts.size(); ++i) {
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), num(s.counts[i])});
        }
    }

    bulk.begin_table("sense_examples", {"lexicon_rowid", "sense_id", "seq", "text", "language"});
    for (const auto& s : doc.senses) {
        for (std::size_t i = 0; i < s.examples.size(); ++i) {
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), s.examples[i].text, opt(s.examples[i].language)});
        }
    }

    bulk.begin_table("sense_relations", {"lexicon_rowid", "source_id", "seq", "type", "target_id"});
    for (const auto& s : doc.senses) {
        for (std::size_t i = 0; i < s.relations.size(); ++i) {
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), s.relations[i].type, s.relations[i].target});
        }
    }

    bulk.begin_table("definitions", {"lexicon_rowid", "synset_id", "seq", "text", "language", "source_sense"});
    for (const auto& s : doc.synsets) {
        for (std::size_t i = 0; i < s.definitions.size(); ++i) {
            const Definition& d = s.definitions[i];
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), d.text, opt(d.language), opt(d.source_sense)});
        }
    }

    bulk.begin_table("synset_examples", {"lexicon_rowid", "synset_id", "seq", "text", "language"});
    for (const auto& s : doc.synsets) {
        for (std::size_t i = 0; i < s.examples.size(); ++i) {
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), s.examples[i].text, opt(s.examples[i].language)});
        }
    }

    bulk.begin_table("synset_relations", {"lexicon_rowid", "source_id", "seq", "type", "target_id"});
    for (const auto& s : doc.synsets) {
        for (std::size_t i = 0; i < s.relations.size(); ++i) {
            bulk.add_row({rowid_of(s.lexicon), s.id, num(i), s.relations[i].type, s.relations[i].target});
        }
    }

    bulk.begin_table("ilis", {"id", "status"}, "INSERT OR IGNORE");
    for (const auto& ili : doc.ili_refs) {
        bulk.add_row({ili, std::string("presupposed")});
    }
    bulk.flush();

    Logger::debug("Inserted " + std::to_string(doc.words.size()) + " words, " +
                  std::to_string(doc.senses.size()) + " senses, " +
                  std::to_string(doc.synsets.size()) + " synsets");
}

void LexiconWriter::remove(const std::string& lexicon_id) {
    if (!exists(lexicon_id)) {
        throw NotFoundError("Lexicon not installed: " + lexicon_id);
    }
    db_.execute("DELETE FROM lexicons WHERE id = ?", {lexicon_id});
}

std::size_t LexiconWriter::upsert_ilis(
        const std::function<void(const std::function<void(IliEntry&&)>&)>& producer) {
    SqliteConnection::Statement stmt(db_,
        "INSERT INTO ilis (id, status, definition) VALUES (?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET status = excluded.status, "
        "definition = COALESCE(excluded.definition, ilis.definition)");
    std::size_t n = 0;
    producer([&](IliEntry&& entry) {
        stmt.reset();
        stmt.bind(1, entry.id);
        stmt.bind(2, entry.status);
        stmt.bind(3, opt(entry.definition));
        while (stmt.step()) {}
        ++n;
    });
    return n;
}

} // namespace Lexicore
