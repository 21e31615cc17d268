/**
 * @file tree_parser.hpp
 * @brief Whole-document LMF strategy for small and known-size inputs
 */

#pragma once

#include <export.hpp>
#include <lmf/lmf_parser.hpp>

namespace Lexicore {

/**
 * @brief Loads the full file into a libxml2 tree, then walks it.
 *
 * Fastest on kilobyte-to-megabyte inputs; memory grows with file size.
 */
class LEXICORE_API TreeLmfParser : public LmfParser {
public:
    using LmfParser::parse;

    const char* name() const override { return "tree"; }
    void parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) override;
};

} // namespace Lexicore
