/**
 * @file morphy.cpp
 * @brief Suffix detachment and lemma filtering
 */

#include <query/morphy.hpp>
#include <utils/logger.hpp>
#include <array>
#include <vector>

namespace Lexicore {

namespace {

struct Rule {
    const char* suffix;
    const char* replacement;
};

const std::vector<Rule>& rules_for(const std::string& pos) {
    static const std::map<std::string, std::vector<Rule>> rules = {
        {"n", {{"s", ""}, {"ces", "x"}, {"ses", "s"}, {"ves", "f"}, {"ives", "ife"}, {"xes", "x"},
               {"xes", "xis"}, {"zes", "z"}, {"ches", "ch"}, {"shes", "sh"}, {"men", "man"}, {"ies", "y"}}},
        {"v", {{"s", ""}, {"ies", "y"}, {"es", "e"}, {"es", ""}, {"ed", "e"}, {"ed", ""}, {"ing", "e"},
               {"ing", ""}}},
        {"a", {{"er", ""}, {"est", ""}, {"er", "e"}, {"est", "e"}}},
        {"r", {{"er", ""}, {"est", ""}, {"er", "e"}, {"est", "e"}}},
    };
    return rules.at(pos);
}

constexpr std::array<const char*, 4> ANALYZED_POS = {"n", "v", "a", "r"};

std::string analyzed_code(PartOfSpeech pos) {
    return pos == PartOfSpeech::AdjectiveSatellite ? "a" : pos_code(pos);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Morphy::Morphy(Wordnet& wn) : initialized_(true) {
    for (const char* code : ANALYZED_POS) {
        lemmas_[code];
        exceptions_[code];
    }
    std::size_t count = 0;
    for (const auto& word : wn.words()) {
        auto code = analyzed_code(word.pos);
        lemmas_[code].insert(word.lemma);
        for (const auto& form : word.forms) {
            exceptions_[code][form.written_form].insert(word.lemma);
        }
        ++count;
    }
    Logger::debug("Morphy loaded " + std::to_string(count) + " words");
}

std::set<std::string> Morphy::candidates(const std::string& form, const std::string& pos) const {
    std::set<std::string> out;
    const std::set<std::string>* known = nullptr;
    if (initialized_) {
        known = &lemmas_.at(pos);
        if (known->count(form)) out.insert(form);
        const auto& exceptions = exceptions_.at(pos);
        if (auto it = exceptions.find(form); it != exceptions.end()) {
            for (const auto& lemma : it->second) {
                if (known->count(lemma)) out.insert(lemma);
            }
        }
    }

    for (const auto& rule : rules_for(pos)) {
        std::string suffix = rule.suffix;
        if (suffix.size() >= form.size() || !ends_with(form, suffix)) continue;
        auto candidate = form.substr(0, form.size() - suffix.size()) + rule.replacement;
        if (!known || known->count(candidate)) out.insert(std::move(candidate));
    }

    if (!initialized_) out.insert(form);
    return out;
}

LemmaCandidates Morphy::analyze(const std::string& form, std::optional<PartOfSpeech> pos) const {
    LemmaCandidates out;
    if (pos) {
        auto code = analyzed_code(*pos);
        out[code] = candidates(form, code);
        return out;
    }
    for (const char* code : ANALYZED_POS) {
        out[code] = candidates(form, code);
    }
    if (!initialized_) out[""] = {form};
    return out;
}

} // namespace Lexicore
