/**
 * @file statistics.cpp
 * @brief Store analytics queries
 */

#include <storage/statistics.hpp>

namespace Lexicore {

namespace {

// Restricts a synsets query (alias s) to one lexicon when a filter is given.
std::string lexicon_filter(const std::string& lexicon, std::vector<SqlParam>& params) {
    if (lexicon.empty()) return "";
    params.push_back(lexicon);
    return " AND s.lexicon_rowid = (SELECT rowid FROM lexicons WHERE id = ?)";
}

} // namespace

long long Statistics::count(const std::string& sql, const std::vector<SqlParam>& params) {
    auto v = db_.query_single(sql, params);
    return v && !v->empty() ? std::stoll(*v) : 0;
}

StoreTotals Statistics::totals() {
    StoreTotals t;
    t.total_words = count("SELECT count(*) FROM words");
    t.total_synsets = count("SELECT count(*) FROM synsets");
    t.total_senses = count("SELECT count(*) FROM senses");
    t.total_ilis = count("SELECT count(*) FROM ilis");
    t.total_lexicons = count("SELECT count(*) FROM lexicons");
    return t;
}

DataQuality Statistics::quality(const std::string& lexicon) {
    std::vector<SqlParam> params;
    const std::string where = lexicon_filter(lexicon, params);

    DataQuality q;
    long long total = count("SELECT count(*) FROM synsets s WHERE 1" + where, params);
    q.synsets_with_ili = count("SELECT count(*) FROM synsets s WHERE s.ili IS NOT NULL" + where, params);
    q.synsets_without_ili = total - q.synsets_with_ili;
    q.ili_coverage_percent = total > 0 ? 100.0 * static_cast<double>(q.synsets_with_ili) / static_cast<double>(total) : 0.0;
    q.empty_synsets = count(
        "SELECT count(*) FROM synsets s WHERE NOT EXISTS (SELECT 1 FROM senses x "
        "WHERE x.lexicon_rowid = s.lexicon_rowid AND x.synset_id = s.id)" + where, params);
    q.synsets_with_definitions = count(
        "SELECT count(*) FROM synsets s WHERE EXISTS (SELECT 1 FROM definitions d "
        "WHERE d.lexicon_rowid = s.lexicon_rowid AND d.synset_id = s.id)" + where, params);
    q.synsets_without_definitions = total - q.synsets_with_definitions;
    return q;
}

std::map<std::string, long long> Statistics::pos_distribution(const std::string& lexicon) {
    std::vector<SqlParam> params;
    const std::string where = lexicon_filter(lexicon, params);
    std::map<std::string, long long> out;
    db_.query("SELECT s.pos, count(*) FROM synsets s WHERE 1" + where + " GROUP BY s.pos", params,
              [&](const SqlRow& r) { out[r[0]] = std::stoll(r[1]); });
    return out;
}

std::optional<LexiconStats> Statistics::lexicon(const std::string& id) {
    auto rowid = db_.query_single("SELECT rowid FROM lexicons WHERE id = ?", {id});
    if (!rowid) return std::nullopt;

    LexiconStats st;
    st.lexicon = id;
    st.words = count("SELECT count(*) FROM words WHERE lexicon_rowid = ?", {*rowid});
    st.senses = count("SELECT count(*) FROM senses WHERE lexicon_rowid = ?", {*rowid});
    st.synsets = count("SELECT count(*) FROM synsets WHERE lexicon_rowid = ?", {*rowid});
    st.relations = count("SELECT count(*) FROM synset_relations WHERE lexicon_rowid = ?", {*rowid})
                 + count("SELECT count(*) FROM sense_relations WHERE lexicon_rowid = ?", {*rowid});
    return st;
}

std::vector<LexiconStats> Statistics::per_lexicon() {
    std::vector<std::string> ids;
    db_.query("SELECT id FROM lexicons ORDER BY rowid", [&](const SqlRow& r) { ids.push_back(r[0]); });
    std::vector<LexiconStats> out;
    for (const auto& id : ids) {
        if (auto st = lexicon(id)) out.push_back(std::move(*st));
    }
    return out;
}

SynsetSizeStats Statistics::synset_sizes(const std::string& lexicon) {
    std::vector<SqlParam> params;
    const std::string where = lexicon_filter(lexicon, params);

    SynsetSizeStats st;
    long long synsets = 0;
    long long members = 0;
    db_.query(
        "SELECT size, count(*) FROM ("
        "  SELECT (SELECT count(*) FROM senses x WHERE x.lexicon_rowid = s.lexicon_rowid AND x.synset_id = s.id) AS size"
        "  FROM synsets s WHERE 1" + where +
        ") GROUP BY size ORDER BY size",
        params, [&](const SqlRow& r) {
            long long size = std::stoll(r[0]);
            long long n = std::stoll(r[1]);
            if (synsets == 0) st.min = size;
            st.max = size;
            st.histogram[size] = n;
            synsets += n;
            members += size * n;
        });
    st.average = synsets > 0 ? static_cast<double>(members) / static_cast<double>(synsets) : 0.0;
    return st;
}

} // namespace Lexicore
