/**
 * @file statistics.hpp
 * @brief Derived analytics computed from the store's indices
 */

#pragma once

#include <database/sqlite_connection.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Lexicore {

struct StoreTotals {
    long long total_words = 0;
    long long total_synsets = 0;
    long long total_senses = 0;
    long long total_ilis = 0;
    long long total_lexicons = 0;
};

struct DataQuality {
    long long synsets_with_ili = 0;
    long long synsets_without_ili = 0;
    double ili_coverage_percent = 0.0;     // synsets with ILI / all synsets * 100
    long long empty_synsets = 0;           // no member senses
    long long synsets_with_definitions = 0;
    long long synsets_without_definitions = 0;
};

struct LexiconStats {
    std::string lexicon;
    long long words = 0;
    long long senses = 0;
    long long synsets = 0;
    long long relations = 0;
};

struct SynsetSizeStats {
    double average = 0.0;
    long long min = 0;
    long long max = 0;
    std::map<long long, long long> histogram;   // member count -> synsets
};

/**
 * @brief Read-only analytics. Nothing here is persisted; every call queries.
 *
 * An empty lexicon filter covers the whole store.
 */
class Statistics {
public:
    explicit Statistics(SqliteConnection& db) : db_(db) {}

    StoreTotals totals();
    DataQuality quality(const std::string& lexicon = {});

    /// POS code ("n", "v", ...) -> synset count.
    std::map<std::string, long long> pos_distribution(const std::string& lexicon = {});

    std::optional<LexiconStats> lexicon(const std::string& id);
    std::vector<LexiconStats> per_lexicon();

    SynsetSizeStats synset_sizes(const std::string& lexicon = {});

private:
    long long count(const std::string& sql, const std::vector<SqlParam>& params = {});

    SqliteConnection& db_;
};

} // namespace Lexicore
