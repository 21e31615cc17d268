/**
 * @file schema.cpp
 * @brief DDL for the lexical store
 */

#include <storage/schema.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Lexicore {

namespace {

// Every entity table is keyed by (lexicon_rowid, id): ids are lexicon-scoped.
// Child rows cascade from lexicons. ILI rows are global and never cascade.
constexpr const char* kSchema = R"SQL(
CREATE TABLE lexicons (
    rowid        INTEGER PRIMARY KEY,
    id           TEXT NOT NULL UNIQUE,
    label        TEXT NOT NULL,
    language     TEXT NOT NULL,
    email        TEXT NOT NULL,
    license      TEXT NOT NULL,
    version      TEXT NOT NULL,
    url          TEXT,
    citation     TEXT,
    logo         TEXT,
    lmf_version  TEXT,
    installed_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ', 'now'))
);

CREATE TABLE ilis (
    id          TEXT PRIMARY KEY,
    status      TEXT NOT NULL,
    definition  TEXT
);

CREATE TABLE words (
    lexicon_rowid INTEGER NOT NULL REFERENCES lexicons(rowid) ON DELETE CASCADE,
    id            TEXT NOT NULL,
    lemma         TEXT NOT NULL,
    pos           TEXT NOT NULL CHECK (pos IN ('n','v','a','s','r')),
    script        TEXT,
    UNIQUE (lexicon_rowid, id)
);
CREATE INDEX words_lemma ON words(lemma, pos);

CREATE TABLE forms (
    lexicon_rowid INTEGER NOT NULL,
    word_id       TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    form_id       TEXT,
    written_form  TEXT NOT NULL,
    script        TEXT,
    FOREIGN KEY (lexicon_rowid, word_id) REFERENCES words(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX forms_word ON forms(lexicon_rowid, word_id);
CREATE INDEX forms_written ON forms(written_form);

CREATE TABLE tags (
    lexicon_rowid INTEGER NOT NULL,
    word_id       TEXT NOT NULL,
    form_seq      INTEGER NOT NULL,   -- -1 for tags on the lemma
    seq           INTEGER NOT NULL,
    category      TEXT NOT NULL,
    text          TEXT NOT NULL,
    FOREIGN KEY (lexicon_rowid, word_id) REFERENCES words(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX tags_word ON tags(lexicon_rowid, word_id);

CREATE TABLE pronunciations (
    lexicon_rowid INTEGER NOT NULL,
    word_id       TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    text          TEXT NOT NULL,
    variety       TEXT,
    notation      TEXT,
    phonemic      INTEGER NOT NULL,
    audio         TEXT,
    FOREIGN KEY (lexicon_rowid, word_id) REFERENCES words(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX pronunciations_word ON pronunciations(lexicon_rowid, word_id);

CREATE TABLE synsets (
    lexicon_rowid  INTEGER NOT NULL REFERENCES lexicons(rowid) ON DELETE CASCADE,
    id             TEXT NOT NULL,
    pos            TEXT NOT NULL CHECK (pos IN ('n','v','a','s','r')),
    ili            TEXT,
    ili_definition TEXT,
    lexicalized    INTEGER NOT NULL DEFAULT 1,
    UNIQUE (lexicon_rowid, id)
);
CREATE INDEX synsets_ili ON synsets(ili);

CREATE TABLE senses (
    lexicon_rowid INTEGER NOT NULL,
    id            TEXT NOT NULL,
    word_id       TEXT NOT NULL,
    synset_id     TEXT NOT NULL,
    rank          INTEGER NOT NULL,
    member_seq    INTEGER NOT NULL,
    sensekey      TEXT,
    adjposition   TEXT,
    lexicalized   INTEGER NOT NULL DEFAULT 1,
    UNIQUE (lexicon_rowid, id),
    FOREIGN KEY (lexicon_rowid) REFERENCES lexicons(rowid) ON DELETE CASCADE,
    FOREIGN KEY (lexicon_rowid, word_id) REFERENCES words(lexicon_rowid, id) ON DELETE CASCADE,
    FOREIGN KEY (lexicon_rowid, synset_id) REFERENCES synsets(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX senses_word ON senses(lexicon_rowid, word_id, rank);
CREATE INDEX senses_synset ON senses(lexicon_rowid, synset_id, member_seq);

CREATE TABLE sense_counts (
    lexicon_rowid INTEGER NOT NULL,
    sense_id      TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    value         INTEGER NOT NULL,
    FOREIGN KEY (lexicon_rowid, sense_id) REFERENCES senses(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX sense_counts_sense ON sense_counts(lexicon_rowid, sense_id);

CREATE TABLE definitions (
    lexicon_rowid INTEGER NOT NULL,
    synset_id     TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    text          TEXT NOT NULL,
    language      TEXT,
    source_sense  TEXT,
    FOREIGN KEY (lexicon_rowid, synset_id) REFERENCES synsets(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX definitions_synset ON definitions(lexicon_rowid, synset_id);

CREATE TABLE synset_examples (
    lexicon_rowid INTEGER NOT NULL,
    synset_id     TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    text          TEXT NOT NULL,
    language      TEXT,
    FOREIGN KEY (lexicon_rowid, synset_id) REFERENCES synsets(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX synset_examples_synset ON synset_examples(lexicon_rowid, synset_id);

CREATE TABLE sense_examples (
    lexicon_rowid INTEGER NOT NULL,
    sense_id      TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    text          TEXT NOT NULL,
    language      TEXT,
    FOREIGN KEY (lexicon_rowid, sense_id) REFERENCES senses(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX sense_examples_sense ON sense_examples(lexicon_rowid, sense_id);

CREATE TABLE synset_relations (
    lexicon_rowid INTEGER NOT NULL,
    source_id     TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    type          TEXT NOT NULL,
    target_id     TEXT NOT NULL,
    FOREIGN KEY (lexicon_rowid, source_id) REFERENCES synsets(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX synset_relations_source ON synset_relations(lexicon_rowid, source_id, type);
CREATE INDEX synset_relations_target ON synset_relations(lexicon_rowid, target_id, type);

CREATE TABLE sense_relations (
    lexicon_rowid INTEGER NOT NULL,
    source_id     TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    type          TEXT NOT NULL,
    target_id     TEXT NOT NULL,
    FOREIGN KEY (lexicon_rowid, source_id) REFERENCES senses(lexicon_rowid, id) ON DELETE CASCADE
);
CREATE INDEX sense_relations_source ON sense_relations(lexicon_rowid, source_id, type);
CREATE INDEX sense_relations_target ON sense_relations(lexicon_rowid, target_id, type);
)SQL";

} // namespace

void ensure_schema(SqliteConnection& db) {
    int version = std::stoi(db.query_single("PRAGMA user_version").value_or("0"));
    if (version == SCHEMA_VERSION) {
        return;
    }

    if (version != 0) {
        throw CorruptStoreError("Store schema version " + std::to_string(version) +
                                " does not match expected " + std::to_string(SCHEMA_VERSION));
    }

    auto tables = db.query_single("SELECT count(*) FROM sqlite_master WHERE type = 'table'");
    if (tables && *tables != "0") {
        throw CorruptStoreError("Store has tables but no schema version: " + db.path().string());
    }

    Logger::debug("Creating store schema v" + std::to_string(SCHEMA_VERSION) + " in " + db.path().string());
    db.execute(kSchema);
    db.execute("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION));
}

} // namespace Lexicore
