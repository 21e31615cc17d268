/**
 * @file entity_reader.hpp
 * @brief Read access paths over one store connection
 */

#pragma once

#include <core/types.hpp>
#include <database/sqlite_connection.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lexicore {

/// Installation metadata for one lexicon.
struct LexiconInfo {
    long long rowid = 0;        // installation order
    Lexicon lexicon;
    std::string lmf_version;
    std::string installed_at;
};

/**
 * @brief Resolves entities of one lexicon at a time.
 *
 * Every lookup is scoped to a lexicon; fan-out across lexicons is the
 * caller's loop. Results within a lexicon are in id order unless noted.
 */
class EntityReader {
public:
    explicit EntityReader(SqliteConnection& db) : db_(db) {}

    /// All installed lexicons in installation order.
    std::vector<LexiconInfo> lexicons();
    std::optional<LexiconInfo> lexicon(const std::string& id);

    /// Words whose lemma or any form equals `form`. Empty form lists every word.
    std::vector<std::string> word_ids(const LexiconInfo& lex, const std::string& form,
                                      std::optional<PartOfSpeech> pos);

    /// Synsets in id order. Empty form lists every synset.
    std::vector<std::string> synset_ids(const LexiconInfo& lex, const std::string& form,
                                        std::optional<PartOfSpeech> pos);

    std::vector<std::string> synset_ids_by_ili(const LexiconInfo& lex, const std::string& ili);

    std::optional<Word> word(const LexiconInfo& lex, const std::string& id);
    std::optional<Sense> sense(const LexiconInfo& lex, const std::string& id);
    std::optional<Synset> synset(const LexiconInfo& lex, const std::string& id);

    std::optional<IliEntry> ili(const std::string& id);

    /// Every ILI entry, optionally filtered by status, in id order.
    std::vector<IliEntry> ilis(const std::string& status);

    /**
     * @brief Targets reachable by `type`: stated edges plus sources of incoming
     * edges of the inverse type. Deduplicated, id order.
     */
    std::vector<std::string> related_synset_ids(const LexiconInfo& lex, const std::string& synset_id,
                                                const std::string& type);
    std::vector<std::string> related_sense_ids(const LexiconInfo& lex, const std::string& sense_id,
                                               const std::string& type);

    /// Whole lexicon in document order, for export.
    Document load_lexicon(const LexiconInfo& lex);

private:
    std::vector<std::string> related_ids(const char* table, const LexiconInfo& lex,
                                         const std::string& id, const std::string& type);
    std::vector<std::string> column(const std::string& sql, const std::vector<SqlParam>& params);

    SqliteConnection& db_;
};

} // namespace Lexicore
