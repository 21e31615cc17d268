/**
 * @file reader_parser.hpp
 * @brief Pull-based LMF strategy using libxml2's xmlTextReader
 */

#pragma once

#include <export.hpp>
#include <lmf/lmf_parser.hpp>

namespace Lexicore {

/**
 * @brief Constant-memory strategy that pulls nodes one at a time.
 *
 * Shares the event builder with the push strategy; useful when the caller
 * wants a synchronous loop instead of callbacks.
 */
class LEXICORE_API ReaderLmfParser : public LmfParser {
public:
    using LmfParser::parse;

    const char* name() const override { return "reader"; }
    void parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) override;
};

} // namespace Lexicore
