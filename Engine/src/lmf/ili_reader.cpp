/**
 * @file ili_reader.cpp
 * @brief ILI TSV parsing
 */

#include <lmf/ili_reader.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace Lexicore {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, '\t')) fields.push_back(field);
    if (!line.empty() && line.back() == '\t') fields.emplace_back();
    return fields;
}

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

int column_of(const std::vector<std::string>& header, const char* name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

bool is_ili_tsv(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) return false;
    strip_cr(line);
    return line.find('\t') != std::string::npos && column_of(split_tabs(line), "ili") >= 0;
}

void read_ili_tsv(std::istream& in, const std::function<void(IliEntry&&)>& on_entry) {
    std::string line;
    if (!std::getline(in, line)) {
        throw ParseError("empty ILI file", "", 1, 0);
    }
    strip_cr(line);
    auto header = split_tabs(line);
    const int ili_col = column_of(header, "ili");
    const int status_col = column_of(header, "status");
    const int def_col = column_of(header, "definition");
    if (ili_col < 0) {
        throw ParseError("ILI header has no 'ili' column", "", 1, 0);
    }

    std::size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        strip_cr(line);
        if (line.empty()) continue;
        auto fields = split_tabs(line);
        if (fields.size() != header.size()) {
            throw ParseError("expected " + std::to_string(header.size()) + " columns, found " +
                             std::to_string(fields.size()), "", line_no, 0);
        }
        IliEntry entry;
        entry.id = fields[ili_col];
        if (entry.id.empty()) {
            throw ParseError("empty ili id", "", line_no, 0);
        }
        entry.status = status_col >= 0 && !fields[status_col].empty() ? fields[status_col] : "standard";
        if (def_col >= 0) entry.definition = fields[def_col];
        on_entry(std::move(entry));
    }
}

} // namespace Lexicore
