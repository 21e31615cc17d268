/**
 * @file lmf_builder.hpp
 * @brief Element-to-entity mapping and cross-reference validation for LMF
 *
 * LexiconAssembler owns the per-lexicon bookkeeping every strategy needs
 * (duplicate ids, sense -> synset references, member lists, relation
 * targets). LmfEventBuilder turns a flat start/characters/end event stream
 * into entities and feeds the assembler; it is shared by the SAX push and
 * text-reader strategies. The tree strategy walks its DOM and feeds the
 * assembler directly.
 */

#pragma once

#include <core/relations.hpp>
#include <core/types.hpp>
#include <lmf/lmf_parser.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Lexicore {

struct Position {
    std::size_t line = 0;
    std::size_t column = 0;
};

/**
 * @brief Attributes of one element, keyed by qualified name ("dc:identifier").
 */
class AttributeMap {
public:
    void add(std::string name, std::string value) {
        items_.emplace_back(std::move(name), std::move(value));
    }

    const std::string* find(std::string_view name) const {
        for (const auto& [k, v] : items_) {
            if (k == name) return &v;
        }
        return nullptr;
    }

    std::string get(std::string_view name) const {
        const std::string* v = find(name);
        return v ? *v : std::string();
    }

    void clear() { items_.clear(); }

private:
    std::vector<std::pair<std::string, std::string>> items_;
};

/// Extracts "1.x" from a DOCTYPE system id or namespace URI; empty when absent.
std::string detect_lmf_version(std::string_view identifier);

// Attribute-level readers. Each throws ParseError on a missing required
// attribute or an invalid value.
Lexicon read_lexicon(const AttributeMap& attrs, Position pos);
Word read_entry(const AttributeMap& attrs, Position pos);
void read_lemma(Word& word, const AttributeMap& attrs, Position pos);
Form read_form(const AttributeMap& attrs, Position pos);
Pronunciation read_pronunciation(const AttributeMap& attrs);
Tag read_tag(const AttributeMap& attrs);
Sense read_sense(const AttributeMap& attrs, Position pos);
Synset read_synset(const AttributeMap& attrs, Position pos);
RelationEdge read_relation(const AttributeMap& attrs, const char* element,
                           RelationScope scope, const ParseOptions& options, Position pos);
Definition read_definition(const AttributeMap& attrs);
Example read_example(const AttributeMap& attrs);

/// Count element text: an optionally signed decimal int, surrounding whitespace ignored.
int read_count(std::string_view raw, Position pos);

/// Applies the trim_text option to element text.
std::string finish_text(std::string text, const ParseOptions& options);

/**
 * @brief Per-lexicon id registry and reference resolution.
 */
class LexiconAssembler {
public:
    LexiconAssembler(DocumentSink& sink, const ParseOptions& options);

    void begin_lexicon(Lexicon lexicon, Position pos);

    /// One LexicalEntry with its senses in document order; assigns ranks.
    void add_entry(Word word, std::vector<Sense> senses, Position pos);

    void add_synset(Synset synset, Position pos);

    /// Verifies all deferred references, then notifies the sink.
    void end_lexicon(Position pos);

    /// Called at end of document.
    void finish(Position pos);

    bool in_lexicon() const { return in_lexicon_; }

private:
    struct PendingRef {
        std::string target;
        std::string element;
        Position pos;
    };

    void claim_id(const std::string& id, const char* element, Position pos);

    DocumentSink& sink_;
    const ParseOptions& options_;

    bool in_lexicon_ = false;
    std::size_t lexicon_count_ = 0;
    Lexicon current_;
    std::unordered_set<std::string> ids_;
    std::unordered_set<std::string> synset_ids_;
    std::unordered_map<std::string, std::vector<std::string>> members_;
    std::vector<PendingRef> sense_synset_refs_;
    std::vector<PendingRef> synset_targets_;
    std::vector<PendingRef> sense_targets_;
};

/**
 * @brief Event-driven builder keeping only the open-element context of the
 * entity under construction.
 */
class LmfEventBuilder {
public:
    LmfEventBuilder(DocumentSink& sink, const ParseOptions& options);

    void doctype(std::string_view system_id);
    void start_element(std::string_view name, const AttributeMap& attrs, Position pos);
    void characters(std::string_view text);
    void end_element(std::string_view name, Position pos);
    void end_document(Position pos);

private:
    enum class TextTarget { None, Definition, IliDefinition, Example, Tag, Pronunciation, Count };

    std::string take_text();

    DocumentSink& sink_;
    const ParseOptions& options_;
    LexiconAssembler assembler_;

    bool root_seen_ = false;
    std::vector<std::string> open_;

    bool in_entry_ = false;
    Position entry_pos_;
    Word word_;
    std::vector<Sense> senses_;
    bool in_form_ = false;

    bool in_synset_ = false;
    Position synset_pos_;
    Synset synset_;

    TextTarget text_target_ = TextTarget::None;
    std::size_t text_depth_ = 0;
    std::string text_;
    Definition definition_;
    Example example_;
    bool example_for_sense_ = false;
    Tag tag_;
    Pronunciation pronunciation_;
};

} // namespace Lexicore
