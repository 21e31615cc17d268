/**
 * @file relations.hpp
 * @brief Closed WN-LMF relation vocabulary and inverse mapping
 *
 * Only edges stated in a document are persisted. Inverse edges are derived
 * at query time: traversing type T returns outgoing T edges plus the sources
 * of incoming edges whose type is inverse(T).
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace Lexicore {

enum class RelationScope {
    Synset,
    Sense
};

LEXICORE_API bool is_known_relation(std::string_view type, RelationScope scope);

/// Inverse type; symmetric types return themselves. nullopt when no inverse is defined.
LEXICORE_API std::optional<std::string_view> inverse_relation(std::string_view type);

LEXICORE_API bool is_symmetric_relation(std::string_view type);

/// All types valid in the given scope, in vocabulary order.
LEXICORE_API std::vector<std::string_view> relation_types(RelationScope scope);

} // namespace Lexicore
