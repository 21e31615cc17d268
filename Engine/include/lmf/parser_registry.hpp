/**
 * @file parser_registry.hpp
 * @brief Strategy lookup by name and the file-size heuristic for "auto"
 */

#pragma once

#include <export.hpp>
#include <lmf/lmf_parser.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lexicore {

enum class ParserKind {
    Auto,
    Stream,
    Reader,
    Tree
};

LEXICORE_API std::optional<ParserKind> parser_kind_from_name(std::string_view name);
LEXICORE_API const char* parser_kind_name(ParserKind kind);

/// Names accepted by parser_kind_from_name, "auto" first.
LEXICORE_API std::vector<std::string> parser_names();

/**
 * @brief Resolve Auto: unknown size or size >= threshold selects Stream,
 * anything smaller selects Tree. Explicit kinds are returned unchanged.
 */
LEXICORE_API ParserKind resolve_parser_kind(ParserKind configured, std::size_t size_hint,
                                            std::size_t stream_threshold);

/// Kind must not be Auto.
LEXICORE_API std::unique_ptr<LmfParser> make_parser(ParserKind kind);

/// Throws ConfigurationError on an unknown name.
LEXICORE_API std::unique_ptr<LmfParser> make_parser(std::string_view name);

/**
 * @brief Cheap sniff of the first few KiB for an LMF root or DOCTYPE.
 */
LEXICORE_API bool is_lmf(const std::filesystem::path& path);

} // namespace Lexicore
