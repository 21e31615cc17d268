/**
 * @file information_content.cpp
 * @brief IC weight computation, IC file loading, probabilities
 */

#include <query/information_content.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace Lexicore {

namespace {

constexpr const char* IC_POS[] = {"n", "v", "a", "r"};

std::string table_code(PartOfSpeech pos) {
    return pos == PartOfSpeech::AdjectiveSatellite ? "a" : pos_code(pos);
}

IcWeights initialize(Wordnet& wn, double smoothing) {
    IcWeights ic;
    for (const char* code : IC_POS) ic.tables[code].total = smoothing;
    for (const auto& synset : wn.synsets()) {
        auto it = ic.tables.find(table_code(synset.pos));
        if (it != ic.tables.end()) it->second.weights[synset.id] = smoothing;
    }
    return ic;
}

std::string synset_key(const Synset& s) {
    return s.lexicon + '\x1f' + s.id;
}

} // namespace

IcWeights compute_ic(Wordnet& wn, const std::vector<std::string>& corpus, bool distribute_weight, double smoothing) {
    IcWeights ic = initialize(wn, smoothing);

    std::map<std::string, long long> counts;
    for (const auto& token : corpus) ++counts[token];

    std::unordered_map<std::string, std::vector<Synset>> hypernym_cache;
    auto hypernyms_of = [&](const Synset& s) -> const std::vector<Synset>& {
        auto key = synset_key(s);
        auto it = hypernym_cache.find(key);
        if (it == hypernym_cache.end()) it = hypernym_cache.emplace(key, wn.hypernyms(s)).first;
        return it->second;
    };

    for (const auto& [token, count] : counts) {
        auto synsets = wn.synsets(token);
        if (synsets.empty()) continue;
        const double weight = distribute_weight ? static_cast<double>(count) / static_cast<double>(synsets.size())
                                                : static_cast<double>(count);

        for (const auto& synset : synsets) {
            auto table = ic.tables.find(table_code(synset.pos));
            if (table == ic.tables.end()) continue;
            table->second.total += weight;

            // Each path carries its own visited set so a synset reached by two routes counts twice.
            std::vector<std::pair<Synset, std::unordered_set<std::string>>> agenda{{synset, {}}};
            while (!agenda.empty()) {
                auto [current, seen] = std::move(agenda.back());
                agenda.pop_back();
                auto key = synset_key(current);
                if (seen.count(key)) continue;
                table->second.weights[current.id] += weight;
                seen.insert(key);
                for (const auto& parent : hypernyms_of(current)) {
                    agenda.emplace_back(parent, seen);
                }
            }
        }
    }

    Logger::debug("Computed IC weights from " + std::to_string(corpus.size()) + " tokens");
    return ic;
}

IcWeights load_ic(Wordnet& wn, const std::filesystem::path& path, IcSynsetMapper mapper) {
    auto lexicons = wn.lexicons();
    if (lexicons.size() != 1) {
        throw Error("IC weights can only be loaded for a wordnet with exactly one lexicon, found " +
                    std::to_string(lexicons.size()));
    }
    if (!mapper) {
        std::string lexid = lexicons.front().lexicon.id;
        mapper = [lexid](unsigned long offset, char pos) {
            char digits[32];
            std::snprintf(digits, sizeof digits, "%08lu", offset);
            return lexid + "-" + digits + "-" + pos;
        };
    }

    std::ifstream in(path);
    if (!in) {
        throw NotFoundError("Cannot open IC file: " + path.string());
    }

    IcWeights ic = initialize(wn, 0.0);
    std::string line;
    std::getline(in, line);  // header
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        std::istringstream fields(line);
        std::string key, weight_text, marker;
        if (!(fields >> key)) continue;
        if (!(fields >> weight_text)) {
            throw ParseError("IC line has no weight", "", line_no, 0);
        }
        fields >> marker;

        char pos = key.back();
        if (pos == 's') pos = 'a';
        unsigned long offset = 0;
        auto [end, ec] = std::from_chars(key.data(), key.data() + key.size() - 1, offset);
        double weight = 0.0;
        std::size_t used = 0;
        try {
            weight = std::stod(weight_text, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        auto table = ic.tables.find(std::string(1, pos));
        if (key.size() < 2 || ec != std::errc() || end != key.data() + key.size() - 1 || table == ic.tables.end() ||
            used != weight_text.size() || (!marker.empty() && marker != "ROOT")) {
            throw ParseError("Malformed IC line: '" + line + "'", "", line_no, 0);
        }

        table->second.weights[mapper(offset, pos)] = weight;
        if (marker == "ROOT") table->second.total += weight;
    }

    Logger::info("Loaded IC weights from " + path.string());
    return ic;
}

double synset_probability(const Synset& synset, const IcWeights& ic) {
    auto table = ic.tables.find(table_code(synset.pos));
    if (table == ic.tables.end()) return 0.0;
    const double total = table->second.total == 0.0 ? 1.0 : table->second.total;
    auto it = table->second.weights.find(synset.id);
    return it == table->second.weights.end() ? 0.0 : it->second / total;
}

double information_content(const Synset& synset, const IcWeights& ic) {
    double p = synset_probability(synset, ic);
    if (p <= 0.0) return 0.0;
    return -std::log(p);
}

} // namespace Lexicore
