/**
 * @file types.hpp
 * @brief Lexical data model: lexicons, words, senses, synsets and ILI entries
 *
 * Entities refer to each other by id only. The relation graph is cyclic
 * (hypernym/hyponym pairs, sense <-> synset membership) so nothing here
 * holds a pointer to another entity.
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lexicore {

enum class PartOfSpeech {
    Noun,
    Verb,
    Adjective,
    AdjectiveSatellite,
    Adverb
};

/// "n", "v", "a", "s", "r" -> enum. Anything else yields nullopt.
LEXICORE_API std::optional<PartOfSpeech> pos_from_code(std::string_view code);
LEXICORE_API const char* pos_code(PartOfSpeech pos);
LEXICORE_API const char* pos_name(PartOfSpeech pos);

struct Tag {
    std::string category;
    std::string text;
    bool operator==(const Tag&) const = default;
};

struct Form {
    std::string id;
    std::string written_form;
    std::string script;
    std::vector<Tag> tags;
    bool operator==(const Form&) const = default;
};

struct Pronunciation {
    std::string text;
    std::string variety;
    std::string notation;
    bool phonemic = true;
    std::string audio;
    bool operator==(const Pronunciation&) const = default;
};

struct Example {
    std::string text;
    std::string language;
    bool operator==(const Example&) const = default;
};

struct Definition {
    std::string text;
    std::string language;
    std::string source_sense;
    bool operator==(const Definition&) const = default;
};

/// Directed, typed edge as stated in the source document.
struct RelationEdge {
    std::string type;
    std::string target;
    bool operator==(const RelationEdge&) const = default;
};

struct Lexicon {
    std::string id;
    std::string label;
    std::string language;
    std::string email;
    std::string license;
    std::string version;
    std::string url;
    std::string citation;
    std::string logo;
    bool operator==(const Lexicon&) const = default;
};

struct Word {
    std::string id;
    std::string lexicon;
    std::string lemma;
    PartOfSpeech pos = PartOfSpeech::Noun;
    std::string script;
    std::vector<Form> forms;
    std::vector<Pronunciation> pronunciations;
    std::vector<Tag> tags;
    std::vector<std::string> senses;   // ordered by rank
    bool operator==(const Word&) const = default;
};

struct Sense {
    std::string id;
    std::string lexicon;
    std::string word;
    std::string synset;
    int rank = 0;                      // 0-based position among the word's senses
    std::string sensekey;
    std::string adjposition;
    bool lexicalized = true;
    std::vector<Example> examples;
    std::vector<RelationEdge> relations;
    std::vector<int> counts;
    bool operator==(const Sense&) const = default;
};

struct Synset {
    std::string id;
    std::string lexicon;
    PartOfSpeech pos = PartOfSpeech::Noun;
    std::string ili;                   // empty when the synset has no ILI link
    std::string ili_definition;        // proposed ILI (ili="in")
    bool lexicalized = true;
    std::vector<std::string> members;  // sense ids, document order
    std::vector<Definition> definitions;
    std::vector<Example> examples;
    std::vector<RelationEdge> relations;
    bool operator==(const Synset&) const = default;
};

struct IliEntry {
    std::string id;
    std::string status;                // standard, proposed, deprecated, presupposed
    std::string definition;
    bool operator==(const IliEntry&) const = default;
};

/**
 * @brief Output of every LMF parser strategy.
 */
struct Document {
    std::string lmf_version;
    std::vector<Lexicon> lexicons;
    std::vector<Word> words;
    std::vector<Sense> senses;
    std::vector<Synset> synsets;
    std::vector<std::string> ili_refs; // distinct, first-seen order

    const Synset* find_synset(std::string_view id) const;
    const Word* find_word(std::string_view id) const;
    const Sense* find_sense(std::string_view id) const;
};

/**
 * @brief Entity-set equality: same lexicons, words, senses, synsets and ILI
 * references, irrespective of the order entities were emitted in.
 */
LEXICORE_API bool equivalent(const Document& a, const Document& b);

} // namespace Lexicore
