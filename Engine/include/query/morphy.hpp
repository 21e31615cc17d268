/**
 * @file morphy.hpp
 * @brief Rule-based lemmatizer for English inflections
 *
 * Strips regular suffixes per part of speech (cats -> cat, runs -> run,
 * smaller -> small). Built over a Wordnet, candidates are kept only when
 * they are lemmas of that wordnet, and a word's other forms map back to its
 * lemma as irregular exceptions. Without a Wordnet every rule output is
 * returned together with the form itself.
 *
 * A Morphy is a valid WordnetOptions::lemmatizer.
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <query/wordnet.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace Lexicore {

class LEXICORE_API Morphy {
public:
    Morphy() = default;
    explicit Morphy(Wordnet& wn);

    bool initialized() const { return initialized_; }

    /**
     * @brief Candidate lemmas of form, keyed by part-of-speech code.
     *
     * Without pos, "n", "v", "a" and "r" are all present (possibly empty).
     * Adjective satellites are analyzed as adjectives.
     */
    LemmaCandidates analyze(const std::string& form, std::optional<PartOfSpeech> pos = std::nullopt) const;

    LemmaCandidates operator()(const std::string& form, std::optional<PartOfSpeech> pos) const {
        return analyze(form, pos);
    }

private:
    std::set<std::string> candidates(const std::string& form, const std::string& pos) const;

    bool initialized_ = false;
    std::map<std::string, std::set<std::string>> lemmas_;                            // pos -> lemmas
    std::map<std::string, std::map<std::string, std::set<std::string>>> exceptions_; // pos -> form -> lemmas
};

} // namespace Lexicore
