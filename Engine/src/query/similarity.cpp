/**
 * @file similarity.cpp
 * @brief wup, lch, res, jcn and lin over the hypernym graph
 */

#include <query/similarity.hpp>
#include <query/taxonomy.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>

namespace Lexicore {

namespace {

void require_same_pos(const Synset& a, const Synset& b) {
    if (a.pos != b.pos) {
        throw Error(std::string("Parts of speech must match: ") + pos_code(a.pos) + " != " + pos_code(b.pos));
    }
}

bool same_synset(const Synset& a, const Synset& b) {
    return a.lexicon == b.lexicon && a.id == b.id;
}

int edges_between(Wordnet& wn, const Synset& a, const Synset& b) {
    auto path = shortest_path(wn, a, b);
    return path ? static_cast<int>(path->size()) - 1 : -1;
}

/// Common hypernym with the highest information content; the first by id on ties.
std::optional<Synset> most_informative_lcs(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic) {
    auto candidates = lowest_common_hypernyms(wn, a, b);
    if (candidates.empty()) return std::nullopt;
    auto best = candidates.begin();
    double best_ic = information_content(*best, ic);
    for (auto it = std::next(candidates.begin()); it != candidates.end(); ++it) {
        double value = information_content(*it, ic);
        if (value > best_ic) {
            best_ic = value;
            best = it;
        }
    }
    return *best;
}

} // namespace

double wup_similarity(Wordnet& wn, const Synset& a, const Synset& b) {
    require_same_pos(a, b);
    if (same_synset(a, b)) return 1.0;
    auto lcs = lowest_common_hypernyms(wn, a, b);
    if (lcs.empty()) return 0.0;

    const double i = edges_between(wn, a, lcs.front());
    const double j = edges_between(wn, b, lcs.front());
    const double k = max_depth(wn, lcs.front()) + 1;
    return 2.0 * k / (i + j + 2.0 * k);
}

double lch_similarity(Wordnet& wn, const Synset& a, const Synset& b, int taxonomy_depth) {
    require_same_pos(a, b);
    if (taxonomy_depth <= 0) {
        throw Error("taxonomy depth must be greater than 0, got " + std::to_string(taxonomy_depth));
    }
    int edges = edges_between(wn, a, b);
    if (edges < 0) return 0.0;
    return -std::log((edges + 1.0) / (2.0 * taxonomy_depth));
}

double res_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic) {
    require_same_pos(a, b);
    auto lcs = most_informative_lcs(wn, a, b, ic);
    return lcs ? information_content(*lcs, ic) : 0.0;
}

double jcn_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic) {
    require_same_pos(a, b);
    if (same_synset(a, b)) return 1.0;
    auto lcs = most_informative_lcs(wn, a, b, ic);
    if (!lcs) return 0.0;

    const double ic_a = information_content(a, ic);
    const double ic_b = information_content(b, ic);
    const double ic_lcs = information_content(*lcs, ic);
    if (ic_a == 0.0 && ic_b == 0.0 && ic_lcs == 0.0) return 0.0;
    const double denominator = ic_a + ic_b - 2.0 * ic_lcs;
    if (denominator <= 0.0) return 0.0;
    return 1.0 / denominator;
}

double lin_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic) {
    require_same_pos(a, b);
    if (same_synset(a, b)) return 1.0;
    auto lcs = most_informative_lcs(wn, a, b, ic);
    if (!lcs) return 0.0;

    const double denominator = information_content(a, ic) + information_content(b, ic);
    if (denominator == 0.0) return 0.0;
    return std::min(1.0, 2.0 * information_content(*lcs, ic) / denominator);
}

} // namespace Lexicore
