/**
 * @file lmf_writer.hpp
 * @brief WN-LMF 1.3 serialization through libxml2's xmlTextWriter
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <filesystem>
#include <string>
#include <libxml/xmlwriter.h>

namespace Lexicore {

/**
 * @brief Writes one LexicalResource, one lexicon at a time.
 *
 * Usage:
 *   LmfWriter w(path);
 *   for (...) w.write_lexicon(doc_for_one_lexicon);
 *   w.close();
 */
class LEXICORE_API LmfWriter {
public:
    /// Write to a file.
    explicit LmfWriter(const std::filesystem::path& path);

    /// Write into an in-memory buffer; retrieve with str() after close().
    LmfWriter();

    ~LmfWriter();

    LmfWriter(const LmfWriter&) = delete;
    LmfWriter& operator=(const LmfWriter&) = delete;

    /// Serializes every lexicon in the document with its words, senses and synsets.
    void write_lexicon(const Document& doc);

    /// Ends the document and flushes. Safe to call more than once.
    void close();

    std::string str() const;

private:
    void begin();
    void start(const char* element);
    void end();
    void attr(const char* name, const std::string& value, bool omit_empty = true);
    void text(const std::string& value);

    xmlTextWriterPtr writer_ = nullptr;
    xmlBufferPtr buffer_ = nullptr;
    bool closed_ = false;
};

} // namespace Lexicore
