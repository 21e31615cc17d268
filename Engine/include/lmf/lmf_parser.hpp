/**
 * @file lmf_parser.hpp
 * @brief Strategy interface shared by all LMF parsers
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <unordered_set>

namespace Lexicore {

struct ParseOptions {
    /// Reject unknown relation types and dangling relation targets.
    bool strict = true;

    /// Strip leading/trailing whitespace from text content. Off by default:
    /// definition text and lemma casing are kept byte-for-byte.
    bool trim_text = false;

    /// Called with (bytes consumed, total bytes or 0 when unknown).
    std::function<void(std::size_t, std::size_t)> on_progress;
};

/**
 * @brief Where the XML comes from: a file, a caller-owned stream, or an owned string.
 */
class LEXICORE_API ParseSource {
public:
    static ParseSource from_file(const std::filesystem::path& path);
    static ParseSource from_stream(std::istream& in, std::string name = "<stream>");
    static ParseSource from_string(std::string xml, std::string name = "<string>");

    /// Opens the file on first use. Throws Error when it cannot be read.
    std::istream& stream();

    const std::string& name() const { return name_; }

    /// Total byte size when known up front, otherwise 0.
    std::size_t size_hint() const { return size_hint_; }

private:
    ParseSource() = default;

    std::filesystem::path path_;
    std::string name_;
    std::size_t size_hint_ = 0;
    std::unique_ptr<std::istream> owned_;
    std::istream* stream_ = nullptr;
};

/**
 * @brief Receives entities as their closing tags are reached.
 *
 * Order of calls: lexicon_begin, then the word and senses of each entry,
 * then synsets, then lexicon_end; repeated per Lexicon element.
 */
class DocumentSink {
public:
    virtual ~DocumentSink() = default;

    virtual void on_lmf_version(const std::string& /*version*/) {}
    virtual void on_lexicon_begin(const Lexicon& lexicon) = 0;
    virtual void on_word(Word&& word) = 0;
    virtual void on_sense(Sense&& sense) = 0;
    virtual void on_synset(Synset&& synset) = 0;
    virtual void on_lexicon_end(const Lexicon& lexicon) = 0;
};

/**
 * @brief Sink that accumulates everything into a Document.
 */
class LEXICORE_API DocumentCollector : public DocumentSink {
public:
    void on_lmf_version(const std::string& version) override { doc_.lmf_version = version; }
    void on_lexicon_begin(const Lexicon& lexicon) override;
    void on_word(Word&& word) override;
    void on_sense(Sense&& sense) override;
    void on_synset(Synset&& synset) override;
    void on_lexicon_end(const Lexicon& /*lexicon*/) override {}

    Document take() { return std::move(doc_); }

private:
    Document doc_;
    std::unordered_set<std::string> seen_ili_;
};

/**
 * @brief One parsing strategy. Every implementation must produce equivalent
 * documents for the same well-formed input.
 */
class LEXICORE_API LmfParser {
public:
    virtual ~LmfParser() = default;

    virtual const char* name() const = 0;

    /// Parse and push entities into the sink. Throws ParseError.
    virtual void parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) = 0;

    Document parse(ParseSource& source, const ParseOptions& options = {}) {
        DocumentCollector collector;
        parse(source, collector, options);
        return collector.take();
    }

    Document parse_file(const std::filesystem::path& path, const ParseOptions& options = {}) {
        auto source = ParseSource::from_file(path);
        return parse(source, options);
    }

    Document parse_string(std::string xml, const ParseOptions& options = {}) {
        auto source = ParseSource::from_string(std::move(xml));
        return parse(source, options);
    }
};

} // namespace Lexicore
