/**
 * @file information_content.hpp
 * @brief Corpus-derived synset weights for the information-content similarity measures
 *
 * Weights live in one table per part of speech ("n", "v", "a", "r";
 * adjective satellites count as adjectives), keyed by synset id. A synset's
 * probability is its weight over the table total and its information
 * content is -log(probability).
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <query/wordnet.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexicore {

struct IcTable {
    double total = 0.0;
    std::unordered_map<std::string, double> weights;
};

struct IcWeights {
    std::map<std::string, IcTable> tables;   // by part-of-speech code
};

/**
 * @brief Counts corpus tokens against the wordnet and propagates them up the hypernym graph.
 *
 * Every synset starts at smoothing. Each token adds its count to every
 * synset it names and to all of their hypernyms; with distribute_weight the
 * count is split evenly over those synsets.
 */
LEXICORE_API IcWeights compute_ic(Wordnet& wn, const std::vector<std::string>& corpus,
                                  bool distribute_weight = true, double smoothing = 1.0);

/// Maps a file's (offset, part-of-speech) pair to a synset id.
using IcSynsetMapper = std::function<std::string(unsigned long offset, char pos)>;

/**
 * @brief Reads an NLTK-style IC file ("<offset><pos> <weight> [ROOT]" per line, one header line).
 *
 * ROOT lines also add their weight to the part-of-speech total. The default
 * mapper yields "<lexicon>-<offset, 8 digits>-<pos>".
 * @throws Error unless the wordnet selects exactly one lexicon
 * @throws NotFoundError when the file cannot be opened
 * @throws ParseError on a malformed line
 */
LEXICORE_API IcWeights load_ic(Wordnet& wn, const std::filesystem::path& path, IcSynsetMapper mapper = {});

/// weight / total for the synset's part of speech; 0 when it has no table.
LEXICORE_API double synset_probability(const Synset& synset, const IcWeights& ic);

/// -log(probability); 0 when the probability is not positive.
LEXICORE_API double information_content(const Synset& synset, const IcWeights& ic);

} // namespace Lexicore
