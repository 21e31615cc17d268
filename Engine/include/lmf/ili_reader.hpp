/**
 * @file ili_reader.hpp
 * @brief Loader for tab-separated ILI distributions (e.g. CILI's ili.tsv)
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <filesystem>
#include <functional>
#include <istream>

namespace Lexicore {

/// True when the first line is a TSV header with an "ili" column.
LEXICORE_API bool is_ili_tsv(const std::filesystem::path& path);

/**
 * @brief Stream rows of an ILI file.
 *
 * The header must name an "ili" column; "status" and "definition" are
 * optional. Missing status defaults to "standard". Throws ParseError with
 * the 1-based line number on a malformed row.
 */
LEXICORE_API void read_ili_tsv(std::istream& in, const std::function<void(IliEntry&&)>& on_entry);

} // namespace Lexicore
