/**
 * @file lmf_builder.cpp
 * @brief LMF element mapping, id registry and event-driven entity builder
 */

#include <lmf/lmf_builder.hpp>
#include <core/errors.hpp>
#include <charconv>

namespace Lexicore {

namespace {

const std::string& require(const AttributeMap& attrs, const char* name,
                           const char* element, Position pos) {
    const std::string* v = attrs.find(name);
    if (!v || v->empty()) {
        throw ParseError(std::string("missing required attribute '") + name + "'",
                         element, pos.line, pos.column);
    }
    return *v;
}

PartOfSpeech require_pos(const AttributeMap& attrs, const char* element, Position pos) {
    const std::string& code = require(attrs, "partOfSpeech", element, pos);
    auto parsed = pos_from_code(code);
    if (!parsed) {
        throw ParseError("invalid partOfSpeech '" + code + "'", element, pos.line, pos.column);
    }
    return *parsed;
}

bool flag(const AttributeMap& attrs, const char* name, bool fallback) {
    const std::string* v = attrs.find(name);
    if (!v) return fallback;
    return *v != "false";
}

} // namespace

std::string detect_lmf_version(std::string_view identifier) {
    static constexpr std::string_view marker = "WN-LMF-";
    auto at = identifier.find(marker);
    if (at == std::string_view::npos) return {};
    std::string version;
    for (std::size_t i = at + marker.size(); i < identifier.size(); ++i) {
        char c = identifier[i];
        if ((c >= '0' && c <= '9') || c == '.') version += c;
        else break;
    }
    while (!version.empty() && version.back() == '.') version.pop_back();
    return version;
}

Lexicon read_lexicon(const AttributeMap& attrs, Position pos) {
    Lexicon lex;
    lex.id       = require(attrs, "id", "Lexicon", pos);
    lex.label    = require(attrs, "label", "Lexicon", pos);
    lex.language = require(attrs, "language", "Lexicon", pos);
    lex.email    = require(attrs, "email", "Lexicon", pos);
    lex.license  = require(attrs, "license", "Lexicon", pos);
    lex.version  = require(attrs, "version", "Lexicon", pos);
    lex.url      = attrs.get("url");
    lex.citation = attrs.get("citation");
    lex.logo     = attrs.get("logo");
    return lex;
}

Word read_entry(const AttributeMap& attrs, Position pos) {
    Word word;
    word.id = require(attrs, "id", "LexicalEntry", pos);
    return word;
}

void read_lemma(Word& word, const AttributeMap& attrs, Position pos) {
    word.lemma  = require(attrs, "writtenForm", "Lemma", pos);
    word.pos    = require_pos(attrs, "Lemma", pos);
    word.script = attrs.get("script");
}

Form read_form(const AttributeMap& attrs, Position pos) {
    Form form;
    form.written_form = require(attrs, "writtenForm", "Form", pos);
    form.id     = attrs.get("id");
    form.script = attrs.get("script");
    return form;
}

Pronunciation read_pronunciation(const AttributeMap& attrs) {
    Pronunciation p;
    p.variety  = attrs.get("variety");
    p.notation = attrs.get("notation");
    p.phonemic = flag(attrs, "phonemic", true);
    p.audio    = attrs.get("audio");
    return p;
}

Tag read_tag(const AttributeMap& attrs) {
    Tag tag;
    tag.category = attrs.get("category");
    return tag;
}

Sense read_sense(const AttributeMap& attrs, Position pos) {
    Sense sense;
    sense.id          = require(attrs, "id", "Sense", pos);
    sense.synset      = require(attrs, "synset", "Sense", pos);
    sense.sensekey    = attrs.get("dc:identifier");
    sense.adjposition = attrs.get("adjposition");
    sense.lexicalized = flag(attrs, "lexicalized", true);
    return sense;
}

Synset read_synset(const AttributeMap& attrs, Position pos) {
    Synset synset;
    synset.id  = require(attrs, "id", "Synset", pos);
    synset.pos = require_pos(attrs, "Synset", pos);
    std::string ili = attrs.get("ili");
    if (ili != "in") synset.ili = std::move(ili);
    synset.lexicalized = flag(attrs, "lexicalized", true);
    return synset;
}

RelationEdge read_relation(const AttributeMap& attrs, const char* element,
                           RelationScope scope, const ParseOptions& options, Position pos) {
    RelationEdge edge;
    edge.type   = require(attrs, "relType", element, pos);
    edge.target = require(attrs, "target", element, pos);
    if (!is_known_relation(edge.type, scope)) {
        if (options.strict) {
            throw ParseError("unknown relType '" + edge.type + "'", element, pos.line, pos.column);
        }
        edge.type = "other";
    }
    return edge;
}

Definition read_definition(const AttributeMap& attrs) {
    Definition def;
    def.language     = attrs.get("language");
    def.source_sense = attrs.get("sourceSense");
    return def;
}

Example read_example(const AttributeMap& attrs) {
    Example ex;
    ex.language = attrs.get("language");
    return ex;
}

int read_count(std::string_view raw, Position pos) {
    const char* ws = " \t\r\n";
    auto first = raw.find_first_not_of(ws);
    std::string_view digits;
    if (first != std::string_view::npos) {
        digits = raw.substr(first, raw.find_last_not_of(ws) - first + 1);
    }
    std::string_view number = digits;
    if (number.size() > 1 && number.front() == '+' && number[1] != '-') number.remove_prefix(1);

    int value = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (number.empty() || ec != std::errc() || ptr != number.data() + number.size()) {
        throw ParseError("Count is not an integer: '" + std::string(digits) + "'", "Count",
                         pos.line, pos.column);
    }
    return value;
}

std::string finish_text(std::string text, const ParseOptions& options) {
    if (!options.trim_text) return text;
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// ============================================================================
// LexiconAssembler
// ============================================================================

LexiconAssembler::LexiconAssembler(DocumentSink& sink, const ParseOptions& options)
    : sink_(sink), options_(options) {}

void LexiconAssembler::begin_lexicon(Lexicon lexicon, Position pos) {
    if (in_lexicon_) {
        throw ParseError("nested Lexicon", "Lexicon", pos.line, pos.column);
    }
    in_lexicon_ = true;
    current_ = std::move(lexicon);
    ids_.clear();
    synset_ids_.clear();
    members_.clear();
    sense_synset_refs_.clear();
    synset_targets_.clear();
    sense_targets_.clear();
    sink_.on_lexicon_begin(current_);
}

void LexiconAssembler::claim_id(const std::string& id, const char* element, Position pos) {
    if (!ids_.insert(id).second) {
        throw ParseError("duplicate id '" + id + "' in lexicon " + current_.id,
                         element, pos.line, pos.column);
    }
}

void LexiconAssembler::add_entry(Word word, std::vector<Sense> senses, Position pos) {
    if (!in_lexicon_) {
        throw ParseError("LexicalEntry outside Lexicon", "LexicalEntry", pos.line, pos.column);
    }
    if (word.lemma.empty()) {
        throw ParseError("entry '" + word.id + "' has no Lemma", "LexicalEntry", pos.line, pos.column);
    }
    claim_id(word.id, "LexicalEntry", pos);
    word.lexicon = current_.id;
    word.senses.clear();

    for (std::size_t i = 0; i < senses.size(); ++i) {
        Sense& sense = senses[i];
        claim_id(sense.id, "Sense", pos);
        if (synset_ids_.count(sense.synset)) {
            throw ParseError("sense '" + sense.id + "' references synset '" + sense.synset +
                             "' after it was closed", "Sense", pos.line, pos.column);
        }
        sense.lexicon = current_.id;
        sense.word = word.id;
        sense.rank = static_cast<int>(i);
        members_[sense.synset].push_back(sense.id);
        sense_synset_refs_.push_back({sense.synset, "Sense", pos});
        for (const auto& rel : sense.relations) {
            sense_targets_.push_back({rel.target, "SenseRelation", pos});
        }
        word.senses.push_back(sense.id);
    }

    sink_.on_word(std::move(word));
    for (auto& sense : senses) {
        sink_.on_sense(std::move(sense));
    }
}

void LexiconAssembler::add_synset(Synset synset, Position pos) {
    if (!in_lexicon_) {
        throw ParseError("Synset outside Lexicon", "Synset", pos.line, pos.column);
    }
    claim_id(synset.id, "Synset", pos);
    synset.lexicon = current_.id;

    auto it = members_.find(synset.id);
    if (it != members_.end()) {
        synset.members = std::move(it->second);
        members_.erase(it);
    }
    synset_ids_.insert(synset.id);
    for (const auto& rel : synset.relations) {
        synset_targets_.push_back({rel.target, "SynsetRelation", pos});
    }
    sink_.on_synset(std::move(synset));
}

void LexiconAssembler::end_lexicon(Position pos) {
    if (!in_lexicon_) {
        throw ParseError("unbalanced Lexicon end", "Lexicon", pos.line, pos.column);
    }
    for (const auto& ref : sense_synset_refs_) {
        if (!synset_ids_.count(ref.target)) {
            throw ParseError("sense references unknown synset '" + ref.target + "'",
                             ref.element, ref.pos.line, ref.pos.column);
        }
    }
    if (options_.strict) {
        for (const auto& ref : synset_targets_) {
            if (!synset_ids_.count(ref.target)) {
                throw ParseError("relation target '" + ref.target + "' is not a synset of " + current_.id,
                                 ref.element, ref.pos.line, ref.pos.column);
            }
        }
        for (const auto& ref : sense_targets_) {
            if (!ids_.count(ref.target)) {
                throw ParseError("relation target '" + ref.target + "' not found in " + current_.id,
                                 ref.element, ref.pos.line, ref.pos.column);
            }
        }
    }
    in_lexicon_ = false;
    ++lexicon_count_;
    sink_.on_lexicon_end(current_);
}

void LexiconAssembler::finish(Position pos) {
    if (in_lexicon_) {
        throw ParseError("document ended inside Lexicon '" + current_.id + "'", "Lexicon",
                         pos.line, pos.column);
    }
}

// ============================================================================
// LmfEventBuilder
// ============================================================================

LmfEventBuilder::LmfEventBuilder(DocumentSink& sink, const ParseOptions& options)
    : sink_(sink), options_(options), assembler_(sink, options) {}

void LmfEventBuilder::doctype(std::string_view system_id) {
    std::string version = detect_lmf_version(system_id);
    if (!version.empty()) sink_.on_lmf_version(version);
}

std::string LmfEventBuilder::take_text() {
    text_target_ = TextTarget::None;
    return finish_text(std::move(text_), options_);
}

void LmfEventBuilder::start_element(std::string_view name, const AttributeMap& attrs, Position pos) {
    if (!root_seen_) {
        if (name != "LexicalResource") {
            throw ParseError("root element must be LexicalResource", std::string(name),
                             pos.line, pos.column);
        }
        root_seen_ = true;
        open_.emplace_back(name);
        return;
    }

    // Markup inside a text element contributes its character data only.
    if (text_target_ != TextTarget::None) {
        open_.emplace_back(name);
        return;
    }

    const std::string_view parent = open_.empty() ? std::string_view() : std::string_view(open_.back());
    text_.clear();

    if (name == "LexiconExtension") {
        throw ParseError("LexiconExtension is not supported", "LexiconExtension", pos.line, pos.column);
    } else if (name == "Lexicon") {
        assembler_.begin_lexicon(read_lexicon(attrs, pos), pos);
    } else if (name == "LexicalEntry") {
        if (!assembler_.in_lexicon()) {
            throw ParseError("LexicalEntry outside Lexicon", "LexicalEntry", pos.line, pos.column);
        }
        in_entry_ = true;
        entry_pos_ = pos;
        word_ = read_entry(attrs, pos);
        senses_.clear();
    } else if (in_entry_ && name == "Lemma") {
        read_lemma(word_, attrs, pos);
    } else if (in_entry_ && name == "Form") {
        word_.forms.push_back(read_form(attrs, pos));
        in_form_ = true;
    } else if (in_entry_ && name == "Pronunciation") {
        pronunciation_ = read_pronunciation(attrs);
        text_target_ = TextTarget::Pronunciation;
    } else if (in_entry_ && name == "Tag") {
        tag_ = read_tag(attrs);
        text_target_ = TextTarget::Tag;
    } else if (in_entry_ && name == "Sense") {
        senses_.push_back(read_sense(attrs, pos));
    } else if (in_entry_ && name == "SenseRelation" && parent == "Sense") {
        senses_.back().relations.push_back(
            read_relation(attrs, "SenseRelation", RelationScope::Sense, options_, pos));
    } else if (in_entry_ && name == "Count" && parent == "Sense") {
        text_target_ = TextTarget::Count;
    } else if (name == "Synset") {
        if (!assembler_.in_lexicon()) {
            throw ParseError("Synset outside Lexicon", "Synset", pos.line, pos.column);
        }
        in_synset_ = true;
        synset_pos_ = pos;
        synset_ = read_synset(attrs, pos);
    } else if (in_synset_ && name == "Definition") {
        definition_ = read_definition(attrs);
        text_target_ = TextTarget::Definition;
    } else if (in_synset_ && name == "ILIDefinition") {
        text_target_ = TextTarget::IliDefinition;
    } else if (in_synset_ && name == "SynsetRelation") {
        synset_.relations.push_back(
            read_relation(attrs, "SynsetRelation", RelationScope::Synset, options_, pos));
    } else if (name == "Example" && ((in_entry_ && parent == "Sense") || in_synset_)) {
        example_ = read_example(attrs);
        example_for_sense_ = in_entry_;
        text_target_ = TextTarget::Example;
    }

    open_.emplace_back(name);
    if (text_target_ != TextTarget::None) text_depth_ = open_.size();
}

void LmfEventBuilder::characters(std::string_view text) {
    if (text_target_ != TextTarget::None) text_.append(text.data(), text.size());
}

void LmfEventBuilder::end_element(std::string_view name, Position pos) {
    const bool closes_text = text_target_ != TextTarget::None && open_.size() == text_depth_;
    if (!open_.empty()) open_.pop_back();
    if (text_target_ != TextTarget::None && !closes_text) return;

    switch (text_target_) {
        case TextTarget::Pronunciation:
            if (name != "Pronunciation") break;
            pronunciation_.text = take_text();
            word_.pronunciations.push_back(std::move(pronunciation_));
            return;
        case TextTarget::Tag:
            if (name != "Tag") break;
            tag_.text = take_text();
            if (in_form_) word_.forms.back().tags.push_back(std::move(tag_));
            else word_.tags.push_back(std::move(tag_));
            return;
        case TextTarget::Count:
            if (name != "Count") break;
            text_target_ = TextTarget::None;
            senses_.back().counts.push_back(read_count(text_, pos));
            text_.clear();
            return;
        case TextTarget::Definition:
            if (name != "Definition") break;
            definition_.text = take_text();
            synset_.definitions.push_back(std::move(definition_));
            return;
        case TextTarget::IliDefinition:
            if (name != "ILIDefinition") break;
            synset_.ili_definition = take_text();
            return;
        case TextTarget::Example:
            if (name != "Example") break;
            example_.text = take_text();
            if (example_for_sense_) senses_.back().examples.push_back(std::move(example_));
            else synset_.examples.push_back(std::move(example_));
            return;
        case TextTarget::None:
            break;
    }

    if (name == "Form") {
        in_form_ = false;
    } else if (name == "LexicalEntry" && in_entry_) {
        in_entry_ = false;
        in_form_ = false;
        assembler_.add_entry(std::move(word_), std::move(senses_), entry_pos_);
        word_ = Word();
        senses_.clear();
    } else if (name == "Synset" && in_synset_) {
        in_synset_ = false;
        assembler_.add_synset(std::move(synset_), synset_pos_);
        synset_ = Synset();
    } else if (name == "Lexicon") {
        assembler_.end_lexicon(pos);
    }
}

void LmfEventBuilder::end_document(Position pos) {
    if (!root_seen_) {
        throw ParseError("document has no LexicalResource element", "", pos.line, pos.column);
    }
    assembler_.finish(pos);
}

} // namespace Lexicore
