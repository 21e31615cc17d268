/**
 * @file stream_parser.cpp
 * @brief SAX2 push-parser strategy
 */

#include <lmf/stream_parser.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <climits>
#include <cstring>
#include <vector>
#include <libxml/SAX2.h>
#include <libxml/xmlerror.h>

namespace Lexicore {

namespace {

std::string as_string(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

std::string trimmed_message(const char* msg) {
    std::string m = msg ? msg : "malformed XML";
    while (!m.empty() && (m.back() == '\n' || m.back() == ' ')) m.pop_back();
    return m;
}

} // namespace

LmfPushParser::LmfPushParser(DocumentSink& sink, const ParseOptions& options, const std::string& name)
    : builder_(sink, options) {
    xmlSAXHandler sax;
    std::memset(&sax, 0, sizeof(sax));
    sax.initialized = XML_SAX2_MAGIC;
    sax.startElementNs = &LmfPushParser::on_start;
    sax.endElementNs = &LmfPushParser::on_end;
    sax.characters = &LmfPushParser::on_characters;
    sax.cdataBlock = &LmfPushParser::on_characters;
    sax.internalSubset = &LmfPushParser::on_internal_subset;

    ctxt_ = xmlCreatePushParserCtxt(&sax, this, nullptr, 0, name.c_str());
    if (!ctxt_) {
        throw Error("Failed to create XML push parser");
    }
    xmlCtxtUseOptions(ctxt_, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_HUGE);
}

LmfPushParser::~LmfPushParser() {
    if (ctxt_) {
        xmlFreeParserCtxt(ctxt_);
        ctxt_ = nullptr;
    }
}

template <typename Fn>
void LmfPushParser::guarded(Fn&& fn) {
    if (pending_) return;
    try {
        fn();
    } catch (...) {
        // Exceptions must not unwind through libxml2; rethrown from check().
        pending_ = std::current_exception();
        xmlStopParser(ctxt_);
    }
}

Position LmfPushParser::position() const {
    return {static_cast<std::size_t>(xmlSAX2GetLineNumber(ctxt_)),
            static_cast<std::size_t>(xmlSAX2GetColumnNumber(ctxt_))};
}

void LmfPushParser::on_start(void* ctx, const xmlChar* localname, const xmlChar* /*prefix*/,
                             const xmlChar* /*uri*/, int /*nb_namespaces*/, const xmlChar** /*namespaces*/,
                             int nb_attributes, int /*nb_defaulted*/, const xmlChar** attributes) {
    auto* self = static_cast<LmfPushParser*>(ctx);
    self->guarded([&] {
        self->attrs_.clear();
        for (int i = 0; i < nb_attributes; ++i) {
            const xmlChar** a = attributes + i * 5;
            std::string key = a[1] ? as_string(a[1]) + ":" + as_string(a[0]) : as_string(a[0]);
            const char* begin = reinterpret_cast<const char*>(a[3]);
            const char* end = reinterpret_cast<const char*>(a[4]);
            self->attrs_.add(std::move(key), std::string(begin, end));
        }
        self->builder_.start_element(reinterpret_cast<const char*>(localname), self->attrs_,
                                     self->position());
    });
}

void LmfPushParser::on_end(void* ctx, const xmlChar* localname, const xmlChar* /*prefix*/,
                           const xmlChar* /*uri*/) {
    auto* self = static_cast<LmfPushParser*>(ctx);
    self->guarded([&] {
        self->builder_.end_element(reinterpret_cast<const char*>(localname), self->position());
    });
}

void LmfPushParser::on_characters(void* ctx, const xmlChar* ch, int len) {
    auto* self = static_cast<LmfPushParser*>(ctx);
    self->guarded([&] {
        self->builder_.characters(std::string_view(reinterpret_cast<const char*>(ch),
                                                   static_cast<std::size_t>(len)));
    });
}

void LmfPushParser::on_internal_subset(void* ctx, const xmlChar* /*name*/, const xmlChar* /*external_id*/,
                                       const xmlChar* system_id) {
    auto* self = static_cast<LmfPushParser*>(ctx);
    self->guarded([&] { self->builder_.doctype(as_string(system_id)); });
}

void LmfPushParser::check(int rc) {
    if (pending_) {
        std::exception_ptr e = pending_;
        pending_ = nullptr;
        finished_ = true;
        std::rethrow_exception(e);
    }
    if (rc != 0 || !ctxt_->wellFormed) {
        finished_ = true;
        const xmlError* err = xmlCtxtGetLastError(ctxt_);
        if (err) {
            throw ParseError(trimmed_message(err->message), "",
                             static_cast<std::size_t>(err->line), static_cast<std::size_t>(err->int2));
        }
        Position pos = position();
        throw ParseError("malformed XML", "", pos.line, pos.column);
    }
}

void LmfPushParser::feed(const char* data, std::size_t size) {
    if (finished_) {
        throw Error("feed() after finish() or a parse error");
    }
    while (size > 0) {
        int n = static_cast<int>(std::min<std::size_t>(size, INT_MAX / 2));
        check(xmlParseChunk(ctxt_, data, n, 0));
        data += n;
        size -= static_cast<std::size_t>(n);
        bytes_fed_ += static_cast<std::size_t>(n);
    }
}

void LmfPushParser::finish() {
    if (finished_) {
        throw Error("finish() called twice or after a parse error");
    }
    check(xmlParseChunk(ctxt_, nullptr, 0, 1));
    finished_ = true;
    builder_.end_document(position());
}

void StreamingLmfParser::parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) {
    std::istream& in = source.stream();
    LmfPushParser parser(sink, options, source.name());

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        parser.feed(buffer.data(), static_cast<std::size_t>(n));
        if (options.on_progress) options.on_progress(parser.bytes_fed(), source.size_hint());
    }
    if (in.bad()) {
        throw Error("Read failure on " + source.name());
    }
    parser.finish();
}

} // namespace Lexicore
