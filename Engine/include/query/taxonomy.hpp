/**
 * @file taxonomy.hpp
 * @brief Hypernym-graph measures: paths, depths, common ancestors, similarity
 *
 * Every function follows hypernym and instance_hypernym edges (stated or
 * derived from the inverse) within the synset's own lexicon. Cycles in the
 * data are tolerated: a synset is never visited twice on one path.
 */

#pragma once

#include <core/types.hpp>
#include <query/wordnet.hpp>
#include <optional>
#include <vector>

namespace Lexicore {

/// Every path from the synset's hypernyms up to a root, excluding the synset itself.
LEXICORE_API std::vector<std::vector<Synset>> hypernym_paths(Wordnet& wn, const Synset& synset);

/// Length of the longest hypernym path; 0 for a root.
LEXICORE_API int max_depth(Wordnet& wn, const Synset& synset);

/// Length of the shortest hypernym path; 0 for a root.
LEXICORE_API int min_depth(Wordnet& wn, const Synset& synset);

/**
 * @brief Shortest path a -> common hypernym -> b, both ends included.
 * @return std::nullopt when the synsets share no hypernym
 */
LEXICORE_API std::optional<std::vector<Synset>> shortest_path(Wordnet& wn, const Synset& a, const Synset& b);

/// Common hypernyms (a synset counts as its own) with the greatest max_depth.
LEXICORE_API std::vector<Synset> lowest_common_hypernyms(Wordnet& wn, const Synset& a, const Synset& b);

/// 1 / (edges on the shortest path + 1); 0.0 when there is no path.
LEXICORE_API double path_similarity(Wordnet& wn, const Synset& a, const Synset& b);

/// Synsets with no hypernym, optionally of one part of speech.
LEXICORE_API std::vector<Synset> roots(Wordnet& wn, std::optional<PartOfSpeech> pos = std::nullopt);

/// Synsets with no hyponym, optionally of one part of speech.
LEXICORE_API std::vector<Synset> leaves(Wordnet& wn, std::optional<PartOfSpeech> pos = std::nullopt);

/// Greatest max_depth over the part of speech; 0 when it has no synsets.
LEXICORE_API int taxonomy_depth(Wordnet& wn, PartOfSpeech pos);

} // namespace Lexicore
