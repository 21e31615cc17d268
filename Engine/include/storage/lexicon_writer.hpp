/**
 * @file lexicon_writer.hpp
 * @brief Whole-lexicon insertion and cascading removal
 */

#pragma once

#include <core/types.hpp>
#include <database/sqlite_connection.hpp>
#include <functional>
#include <string>

namespace Lexicore {

/**
 * @brief Write-side operations. Callers provide the transaction (Store::write).
 */
class LexiconWriter {
public:
    explicit LexiconWriter(SqliteConnection& db) : db_(db) {}

    bool exists(const std::string& lexicon_id);

    /// Inserts every lexicon in the document. Referenced ILI ids are added as
    /// "presupposed" unless already known.
    void insert(const Document& doc);

    /// Cascade-deletes one lexicon. ILI rows are left untouched.
    /// @throws NotFoundError when the id is not installed
    void remove(const std::string& lexicon_id);

    /**
     * @brief Upsert ILI entries from a stream of rows.
     * @return Number of rows written
     */
    std::size_t upsert_ilis(const std::function<void(const std::function<void(IliEntry&&)>&)>& producer);

private:
    long long insert_lexicon_row(const Lexicon& lex, const std::string& lmf_version);

    SqliteConnection& db_;
};

} // namespace Lexicore
