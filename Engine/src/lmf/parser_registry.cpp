/**
 * @file parser_registry.cpp
 * @brief Strategy construction and LMF sniffing
 */

#include <lmf/parser_registry.hpp>
#include <core/errors.hpp>
#include <lmf/reader_parser.hpp>
#include <lmf/stream_parser.hpp>
#include <lmf/tree_parser.hpp>
#include <fstream>

namespace Lexicore {

std::optional<ParserKind> parser_kind_from_name(std::string_view name) {
    if (name == "auto")   return ParserKind::Auto;
    if (name == "stream") return ParserKind::Stream;
    if (name == "reader") return ParserKind::Reader;
    if (name == "tree")   return ParserKind::Tree;
    return std::nullopt;
}

const char* parser_kind_name(ParserKind kind) {
    switch (kind) {
        case ParserKind::Auto:   return "auto";
        case ParserKind::Stream: return "stream";
        case ParserKind::Reader: return "reader";
        case ParserKind::Tree:   return "tree";
    }
    return "auto";
}

std::vector<std::string> parser_names() {
    return {"auto", "stream", "reader", "tree"};
}

ParserKind resolve_parser_kind(ParserKind configured, std::size_t size_hint, std::size_t stream_threshold) {
    if (configured != ParserKind::Auto) return configured;
    if (size_hint == 0 || size_hint >= stream_threshold) return ParserKind::Stream;
    return ParserKind::Tree;
}

std::unique_ptr<LmfParser> make_parser(ParserKind kind) {
    switch (kind) {
        case ParserKind::Stream: return std::make_unique<StreamingLmfParser>();
        case ParserKind::Reader: return std::make_unique<ReaderLmfParser>();
        case ParserKind::Tree:   return std::make_unique<TreeLmfParser>();
        case ParserKind::Auto:   break;
    }
    throw ConfigurationError("make_parser: resolve 'auto' before constructing a parser");
}

std::unique_ptr<LmfParser> make_parser(std::string_view name) {
    auto kind = parser_kind_from_name(name);
    if (!kind || *kind == ParserKind::Auto) {
        throw ConfigurationError("Unknown parser strategy: " + std::string(name));
    }
    return make_parser(*kind);
}

bool is_lmf(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::string head(4096, '\0');
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(in.gcount()));
    return head.find("<LexicalResource") != std::string::npos ||
           head.find("WN-LMF") != std::string::npos;
}

} // namespace Lexicore
