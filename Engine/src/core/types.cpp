/**
 * @file types.cpp
 * @brief Part-of-speech codes and document comparison
 */

#include <core/types.hpp>
#include <algorithm>
#include <tuple>

namespace Lexicore {

std::optional<PartOfSpeech> pos_from_code(std::string_view code) {
    if (code.size() != 1) return std::nullopt;
    switch (code[0]) {
        case 'n': return PartOfSpeech::Noun;
        case 'v': return PartOfSpeech::Verb;
        case 'a': return PartOfSpeech::Adjective;
        case 's': return PartOfSpeech::AdjectiveSatellite;
        case 'r': return PartOfSpeech::Adverb;
        default:  return std::nullopt;
    }
}

const char* pos_code(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun:               return "n";
        case PartOfSpeech::Verb:               return "v";
        case PartOfSpeech::Adjective:          return "a";
        case PartOfSpeech::AdjectiveSatellite: return "s";
        case PartOfSpeech::Adverb:             return "r";
    }
    return "n";
}

const char* pos_name(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun:               return "noun";
        case PartOfSpeech::Verb:               return "verb";
        case PartOfSpeech::Adjective:          return "adjective";
        case PartOfSpeech::AdjectiveSatellite: return "adjective satellite";
        case PartOfSpeech::Adverb:             return "adverb";
    }
    return "noun";
}

namespace {

template <typename T>
const T* find_by_id(const std::vector<T>& items, std::string_view id) {
    auto it = std::find_if(items.begin(), items.end(), [&](const T& x) { return x.id == id; });
    return it == items.end() ? nullptr : &*it;
}

template <typename T>
std::vector<T> sorted_by_key(std::vector<T> items) {
    std::sort(items.begin(), items.end(), [](const T& a, const T& b) {
        return std::tie(a.lexicon, a.id) < std::tie(b.lexicon, b.id);
    });
    return items;
}

} // namespace

const Synset* Document::find_synset(std::string_view id) const { return find_by_id(synsets, id); }
const Word* Document::find_word(std::string_view id) const { return find_by_id(words, id); }
const Sense* Document::find_sense(std::string_view id) const { return find_by_id(senses, id); }

bool equivalent(const Document& a, const Document& b) {
    auto lex_a = a.lexicons;
    auto lex_b = b.lexicons;
    auto by_id = [](const Lexicon& x, const Lexicon& y) { return x.id < y.id; };
    std::sort(lex_a.begin(), lex_a.end(), by_id);
    std::sort(lex_b.begin(), lex_b.end(), by_id);
    if (lex_a != lex_b) return false;

    auto ili_a = a.ili_refs;
    auto ili_b = b.ili_refs;
    std::sort(ili_a.begin(), ili_a.end());
    std::sort(ili_b.begin(), ili_b.end());
    if (ili_a != ili_b) return false;

    return sorted_by_key(a.words) == sorted_by_key(b.words)
        && sorted_by_key(a.senses) == sorted_by_key(b.senses)
        && sorted_by_key(a.synsets) == sorted_by_key(b.synsets);
}

} // namespace Lexicore
