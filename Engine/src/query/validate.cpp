/**
 * @file validate.cpp
 * @brief Lexicon graph validation
 */

#include <query/validate.hpp>
#include <core/errors.hpp>
#include <storage/entity_reader.hpp>
#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace Lexicore {

namespace {

template <typename Entity>
void check_edges(const std::vector<Entity>& entities, const std::unordered_set<std::string>& ids,
                 const char* kind, std::vector<ValidationIssue>& issues) {
    for (const auto& e : entities) {
        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& rel : e.relations) {
            if (!ids.count(rel.target)) {
                issues.push_back({"dangling-target", e.id,
                                  std::string(kind) + " relation " + rel.type + " points to unknown " +
                                  rel.target});
            }
            if (rel.target == e.id) {
                issues.push_back({"self-loop", e.id, rel.type + " relation points back to " + e.id});
            }
            if (!seen.emplace(rel.type, rel.target).second) {
                issues.push_back({"duplicate-relation", e.id,
                                  "relation " + rel.type + " -> " + rel.target + " is stated twice"});
            }
        }
    }
}

/// synset -> hypernyms, from stated hypernym edges and inverted hyponym edges.
std::unordered_map<std::string, std::vector<std::string>> hypernym_graph(const Document& doc) {
    std::unordered_map<std::string, std::vector<std::string>> up;
    for (const auto& ss : doc.synsets) {
        for (const auto& rel : ss.relations) {
            if (rel.type == "hypernym" || rel.type == "instance_hypernym") {
                up[ss.id].push_back(rel.target);
            } else if (rel.type == "hyponym" || rel.type == "instance_hyponym") {
                up[rel.target].push_back(ss.id);
            }
        }
    }
    for (auto& [id, targets] : up) {
        std::sort(targets.begin(), targets.end());
        targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
    }
    return up;
}

void check_cycles(const Document& doc, std::vector<ValidationIssue>& issues) {
    auto up = hypernym_graph(doc);

    enum class Mark { White, Grey, Black };
    std::unordered_map<std::string, Mark> marks;
    struct Frame {
        std::string id;
        std::size_t next = 0;
    };

    for (const auto& root : doc.synsets) {
        if (marks[root.id] != Mark::White) continue;

        std::vector<Frame> stack{{root.id, 0}};
        marks[root.id] = Mark::Grey;
        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& parents = up[top.id];
            if (top.next == parents.size()) {
                marks[top.id] = Mark::Black;
                stack.pop_back();
                continue;
            }
            const std::string parent = parents[top.next++];
            Mark& m = marks[parent];
            if (m == Mark::Grey) {
                issues.push_back({"hypernym-cycle", top.id,
                                  "hypernym of " + top.id + " leads back to " + parent});
            } else if (m == Mark::White) {
                m = Mark::Grey;
                stack.push_back({parent, 0});
            }
        }
    }
}

} // namespace

std::vector<ValidationIssue> validate(const Document& doc) {
    std::vector<ValidationIssue> issues;

    std::unordered_set<std::string> synset_ids;
    std::unordered_set<std::string> sense_ids;
    for (const auto& ss : doc.synsets) synset_ids.insert(ss.id);
    for (const auto& s : doc.senses) sense_ids.insert(s.id);

    check_edges(doc.synsets, synset_ids, "synset", issues);
    check_edges(doc.senses, sense_ids, "sense", issues);
    check_cycles(doc, issues);

    for (const auto& ss : doc.synsets) {
        if (ss.members.empty()) {
            issues.push_back({"empty-synset", ss.id, "synset has no member senses"});
        }
    }
    return issues;
}

std::vector<ValidationIssue> validate_lexicon(Session& session, const std::string& lexicon_id) {
    Document doc;
    session.store().read([&](SqliteConnection& db) {
        EntityReader reader(db);
        auto info = reader.lexicon(lexicon_id);
        if (!info) {
            throw NotFoundError("Lexicon not installed: " + lexicon_id);
        }
        doc = reader.load_lexicon(*info);
    });
    return validate(doc);
}

} // namespace Lexicore
