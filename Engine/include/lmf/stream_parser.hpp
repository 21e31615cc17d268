/**
 * @file stream_parser.hpp
 * @brief Incremental LMF parsing on top of the libxml2 SAX2 push parser
 */

#pragma once

#include <export.hpp>
#include <lmf/lmf_builder.hpp>
#include <lmf/lmf_parser.hpp>
#include <cstddef>
#include <exception>
#include <string>
#include <libxml/parser.h>

namespace Lexicore {

/**
 * @brief Push parser accepting arbitrary byte chunks as they arrive.
 *
 * Usage:
 *   LmfPushParser p(sink, options);
 *   while (more) p.feed(buf, n);
 *   p.finish();
 *
 * Entities reach the sink as soon as their closing tag has been parsed.
 * Memory is bounded by the largest single entry/synset plus the per-lexicon
 * id registry; the file content itself is never buffered.
 */
class LEXICORE_API LmfPushParser {
public:
    LmfPushParser(DocumentSink& sink, const ParseOptions& options, const std::string& name = "<stream>");
    ~LmfPushParser();

    LmfPushParser(const LmfPushParser&) = delete;
    LmfPushParser& operator=(const LmfPushParser&) = delete;

    /// Throws ParseError on malformed input or a schema violation.
    void feed(const char* data, std::size_t size);

    /// Signals end of input and runs end-of-document checks.
    void finish();

    std::size_t bytes_fed() const { return bytes_fed_; }

private:
    static void on_start(void* ctx, const xmlChar* localname, const xmlChar* prefix,
                         const xmlChar* uri, int nb_namespaces, const xmlChar** namespaces,
                         int nb_attributes, int nb_defaulted, const xmlChar** attributes);
    static void on_end(void* ctx, const xmlChar* localname, const xmlChar* prefix, const xmlChar* uri);
    static void on_characters(void* ctx, const xmlChar* ch, int len);
    static void on_internal_subset(void* ctx, const xmlChar* name, const xmlChar* external_id,
                                   const xmlChar* system_id);

    template <typename Fn>
    void guarded(Fn&& fn);

    void check(int rc);
    Position position() const;

    xmlParserCtxtPtr ctxt_ = nullptr;
    LmfEventBuilder builder_;
    AttributeMap attrs_;
    std::exception_ptr pending_;
    std::size_t bytes_fed_ = 0;
    bool finished_ = false;
};

/**
 * @brief Production strategy: reads the source in fixed chunks and drives LmfPushParser.
 */
class LEXICORE_API StreamingLmfParser : public LmfParser {
public:
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    using LmfParser::parse;

    const char* name() const override { return "stream"; }
    void parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) override;
};

} // namespace Lexicore
