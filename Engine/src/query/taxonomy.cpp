/**
 * @file taxonomy.cpp
 * @brief Hypernym graph walks
 */

#include <query/taxonomy.hpp>
#include <algorithm>
#include <deque>
#include <limits>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Lexicore {

namespace {

std::string key_of(const Synset& s) {
    return s.lexicon + '\x1f' + s.id;
}

/**
 * @brief Memoizes hypernym lookups for one computation.
 */
class HypernymCache {
public:
    explicit HypernymCache(Wordnet& wn) : wn_(wn) {}

    const std::vector<Synset>& of(const Synset& s) {
        auto key = key_of(s);
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            it = cache_.emplace(key, wn_.hypernyms(s)).first;
        }
        return it->second;
    }

private:
    Wordnet& wn_;
    std::unordered_map<std::string, std::vector<Synset>> cache_;
};

void collect_paths(HypernymCache& cache, const Synset& s, std::vector<Synset>& path,
                   std::unordered_set<std::string>& on_path, std::vector<std::vector<Synset>>& out) {
    const auto& parents = cache.of(s);
    bool extended = false;
    for (const auto& parent : parents) {
        auto key = key_of(parent);
        if (on_path.count(key)) continue;
        extended = true;
        path.push_back(parent);
        on_path.insert(key);
        collect_paths(cache, parent, path, on_path, out);
        on_path.erase(key);
        path.pop_back();
    }
    if (!extended && !path.empty()) {
        out.push_back(path);
    }
}

struct Ancestor {
    Synset synset;
    int distance = 0;
    std::string parent;  // key of the child it was reached from
};

/// Breadth-first ancestors including the start synset at distance 0.
std::unordered_map<std::string, Ancestor> ancestors(HypernymCache& cache, const Synset& start) {
    std::unordered_map<std::string, Ancestor> seen;
    std::deque<std::string> queue;
    auto start_key = key_of(start);
    seen.emplace(start_key, Ancestor{start, 0, {}});
    queue.push_back(start_key);

    while (!queue.empty()) {
        auto key = queue.front();
        queue.pop_front();
        Synset current = seen.at(key).synset;
        int distance = seen.at(key).distance;
        for (const auto& parent : cache.of(current)) {
            auto pkey = key_of(parent);
            if (seen.count(pkey)) continue;
            seen.emplace(pkey, Ancestor{parent, distance + 1, key});
            queue.push_back(pkey);
        }
    }
    return seen;
}

/// start -> ... -> key, following parent links back from key.
std::vector<Synset> chain(const std::unordered_map<std::string, Ancestor>& tree, std::string key) {
    std::vector<Synset> out;
    while (!key.empty()) {
        const auto& node = tree.at(key);
        out.push_back(node.synset);
        key = node.parent;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

std::vector<std::vector<Synset>> hypernym_paths(Wordnet& wn, const Synset& synset) {
    HypernymCache cache(wn);
    std::vector<Synset> path;
    std::unordered_set<std::string> on_path{key_of(synset)};
    std::vector<std::vector<Synset>> out;
    collect_paths(cache, synset, path, on_path, out);
    return out;
}

int max_depth(Wordnet& wn, const Synset& synset) {
    int depth = 0;
    for (const auto& path : hypernym_paths(wn, synset)) {
        depth = std::max(depth, static_cast<int>(path.size()));
    }
    return depth;
}

int min_depth(Wordnet& wn, const Synset& synset) {
    auto paths = hypernym_paths(wn, synset);
    if (paths.empty()) return 0;
    std::size_t depth = std::numeric_limits<std::size_t>::max();
    for (const auto& path : paths) depth = std::min(depth, path.size());
    return static_cast<int>(depth);
}

std::optional<std::vector<Synset>> shortest_path(Wordnet& wn, const Synset& a, const Synset& b) {
    HypernymCache cache(wn);
    auto up_a = ancestors(cache, a);
    auto up_b = ancestors(cache, b);

    std::string best;
    int best_len = std::numeric_limits<int>::max();
    for (const auto& [key, node] : up_a) {
        auto it = up_b.find(key);
        if (it == up_b.end()) continue;
        int len = node.distance + it->second.distance;
        if (len < best_len || (len == best_len && key < best)) {
            best_len = len;
            best = key;
        }
    }
    if (best.empty()) return std::nullopt;

    auto left = chain(up_a, best);    // a ... common
    auto right = chain(up_b, best);   // b ... common
    right.pop_back();
    std::reverse(right.begin(), right.end());
    left.insert(left.end(), right.begin(), right.end());
    return left;
}

std::vector<Synset> lowest_common_hypernyms(Wordnet& wn, const Synset& a, const Synset& b) {
    HypernymCache cache(wn);
    auto up_a = ancestors(cache, a);
    auto up_b = ancestors(cache, b);

    std::vector<Synset> common;
    for (const auto& [key, node] : up_a) {
        if (up_b.count(key)) common.push_back(node.synset);
    }
    if (common.empty()) return common;

    std::vector<int> depths;
    int deepest = 0;
    for (const auto& s : common) {
        depths.push_back(max_depth(wn, s));
        deepest = std::max(deepest, depths.back());
    }
    std::vector<Synset> out;
    for (std::size_t i = 0; i < common.size(); ++i) {
        if (depths[i] == deepest) out.push_back(std::move(common[i]));
    }
    std::sort(out.begin(), out.end(), [](const Synset& x, const Synset& y) { return x.id < y.id; });
    return out;
}

double path_similarity(Wordnet& wn, const Synset& a, const Synset& b) {
    auto path = shortest_path(wn, a, b);
    if (!path) return 0.0;
    return 1.0 / static_cast<double>(path->size());
}

std::vector<Synset> roots(Wordnet& wn, std::optional<PartOfSpeech> pos) {
    std::vector<Synset> out;
    for (auto& synset : wn.synsets("", pos)) {
        if (wn.hypernyms(synset).empty()) out.push_back(std::move(synset));
    }
    return out;
}

std::vector<Synset> leaves(Wordnet& wn, std::optional<PartOfSpeech> pos) {
    std::vector<Synset> out;
    for (auto& synset : wn.synsets("", pos)) {
        if (wn.hyponyms(synset).empty()) out.push_back(std::move(synset));
    }
    return out;
}

int taxonomy_depth(Wordnet& wn, PartOfSpeech pos) {
    int depth = 0;
    for (const auto& synset : wn.synsets("", pos)) {
        depth = std::max(depth, max_depth(wn, synset));
    }
    return depth;
}

} // namespace Lexicore
