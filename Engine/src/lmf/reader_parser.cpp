/**
 * @file reader_parser.cpp
 * @brief xmlTextReader strategy
 */

#include <lmf/reader_parser.hpp>
#include <core/errors.hpp>
#include <lmf/lmf_builder.hpp>
#include <exception>
#include <memory>
#include <libxml/xmlerror.h>
#include <libxml/xmlreader.h>

namespace Lexicore {

namespace {

struct ReadContext {
    std::istream* in = nullptr;
    std::size_t consumed = 0;
    std::exception_ptr error;
};

int read_callback(void* context, char* buffer, int len) {
    auto* rc = static_cast<ReadContext*>(context);
    try {
        rc->in->read(buffer, len);
        if (rc->in->bad()) return -1;
        auto n = static_cast<int>(rc->in->gcount());
        rc->consumed += static_cast<std::size_t>(n);
        return n;
    } catch (...) {
        rc->error = std::current_exception();
        return -1;
    }
}

int close_callback(void*) {
    return 0;
}

const char* text_of(const xmlChar* s) {
    return s ? reinterpret_cast<const char*>(s) : "";
}

struct ReaderDeleter {
    void operator()(xmlTextReaderPtr r) const { xmlFreeTextReader(r); }
};

} // namespace

void ReaderLmfParser::parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) {
    ReadContext ctx;
    ctx.in = &source.stream();

    xmlResetLastError();
    std::unique_ptr<xmlTextReader, ReaderDeleter> reader(
        xmlReaderForIO(&read_callback, &close_callback, &ctx, source.name().c_str(), nullptr,
                       XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_HUGE));
    if (!reader) {
        throw Error("Failed to create XML reader for " + source.name());
    }
    xmlTextReaderPtr r = reader.get();

    LmfEventBuilder builder(sink, options);
    AttributeMap attrs;
    std::size_t last_reported = 0;

    auto position = [&]() -> Position {
        return {static_cast<std::size_t>(xmlTextReaderGetParserLineNumber(r)),
                static_cast<std::size_t>(xmlTextReaderGetParserColumnNumber(r))};
    };

    int rc = 0;
    while ((rc = xmlTextReaderRead(r)) == 1) {
        switch (xmlTextReaderNodeType(r)) {
            case XML_READER_TYPE_ELEMENT: {
                const char* name = text_of(xmlTextReaderConstLocalName(r));
                bool empty = xmlTextReaderIsEmptyElement(r) == 1;
                attrs.clear();
                while (xmlTextReaderMoveToNextAttribute(r) == 1) {
                    if (xmlTextReaderIsNamespaceDecl(r) == 1) continue;
                    attrs.add(text_of(xmlTextReaderConstName(r)), text_of(xmlTextReaderConstValue(r)));
                }
                xmlTextReaderMoveToElement(r);
                Position pos = position();
                builder.start_element(name, attrs, pos);
                if (empty) builder.end_element(name, pos);
                break;
            }
            case XML_READER_TYPE_END_ELEMENT:
                builder.end_element(text_of(xmlTextReaderConstLocalName(r)), position());
                break;
            case XML_READER_TYPE_TEXT:
            case XML_READER_TYPE_CDATA:
            case XML_READER_TYPE_WHITESPACE:
            case XML_READER_TYPE_SIGNIFICANT_WHITESPACE:
                builder.characters(text_of(xmlTextReaderConstValue(r)));
                break;
            case XML_READER_TYPE_DOCUMENT_TYPE: {
                auto* dtd = reinterpret_cast<xmlDtdPtr>(xmlTextReaderCurrentNode(r));
                if (dtd && dtd->SystemID) builder.doctype(text_of(dtd->SystemID));
                break;
            }
            default:
                break;
        }

        if (options.on_progress && ctx.consumed != last_reported) {
            last_reported = ctx.consumed;
            options.on_progress(ctx.consumed, source.size_hint());
        }
    }

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (rc != 0) {
        const xmlError* err = xmlGetLastError();
        std::string message = err && err->message ? err->message : "malformed XML";
        while (!message.empty() && message.back() == '\n') message.pop_back();
        if (err) {
            throw ParseError(message, "", static_cast<std::size_t>(err->line),
                             static_cast<std::size_t>(err->int2));
        }
        Position pos = position();
        throw ParseError(message, "", pos.line, pos.column);
    }
    builder.end_document(position());
}

} // namespace Lexicore
