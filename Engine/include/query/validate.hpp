/**
 * @file validate.hpp
 * @brief Structural checks over a lexicon's relation graph
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <session/session.hpp>
#include <string>
#include <vector>

namespace Lexicore {

struct ValidationIssue {
    /// dangling-target, self-loop, hypernym-cycle, empty-synset, duplicate-relation
    std::string code;
    std::string entity;
    std::string message;
};

/**
 * @brief Check a parsed document. Issues are reported in entity order;
 * nothing is thrown for problems found.
 */
LEXICORE_API std::vector<ValidationIssue> validate(const Document& doc);

/**
 * @brief Check an installed lexicon.
 * @throws NotFoundError when the lexicon is not installed
 */
LEXICORE_API std::vector<ValidationIssue> validate_lexicon(Session& session, const std::string& lexicon_id);

} // namespace Lexicore
