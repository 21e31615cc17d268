/**
 * @file similarity.hpp
 * @brief Taxonomy and information-content similarity between two synsets
 *
 * Both synsets must share a part of speech; otherwise Error is thrown.
 * Synsets with no common hypernym score 0.0 on every measure.
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <query/information_content.hpp>
#include <query/wordnet.hpp>

namespace Lexicore {

/// Wu-Palmer: 2k / (i + j + 2k), k = depth of the lowest common hypernym + 1.
LEXICORE_API double wup_similarity(Wordnet& wn, const Synset& a, const Synset& b);

/**
 * @brief Leacock-Chodorow: -log((edges + 1) / (2 * taxonomy_depth)).
 * @throws Error when taxonomy_depth is not positive
 */
LEXICORE_API double lch_similarity(Wordnet& wn, const Synset& a, const Synset& b, int taxonomy_depth);

/// Resnik: information content of the most informative common hypernym.
LEXICORE_API double res_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic);

/// Jiang-Conrath: 1 / (ic(a) + ic(b) - 2 ic(lcs)).
LEXICORE_API double jcn_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic);

/// Lin: 2 ic(lcs) / (ic(a) + ic(b)), capped at 1.
LEXICORE_API double lin_similarity(Wordnet& wn, const Synset& a, const Synset& b, const IcWeights& ic);

} // namespace Lexicore
