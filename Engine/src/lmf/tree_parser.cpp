/**
 * @file tree_parser.cpp
 * @brief DOM walk over xmlReadMemory output
 */

#include <lmf/tree_parser.hpp>
#include <core/errors.hpp>
#include <lmf/lmf_builder.hpp>
#include <climits>
#include <cstring>
#include <iterator>
#include <memory>
#include <string>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace Lexicore {

namespace {

struct DocDeleter {
    void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
};

bool is(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

Position position_of(const xmlNode* node) {
    return {static_cast<std::size_t>(xmlGetLineNo(node)), 0};
}

AttributeMap attributes_of(xmlDocPtr doc, const xmlNode* node) {
    AttributeMap attrs;
    for (xmlAttrPtr a = node->properties; a; a = a->next) {
        std::string key = reinterpret_cast<const char*>(a->name);
        if (a->ns && a->ns->prefix) {
            key = std::string(reinterpret_cast<const char*>(a->ns->prefix)) + ":" + key;
        }
        xmlChar* value = xmlNodeListGetString(doc, a->children, 1);
        attrs.add(std::move(key), value ? reinterpret_cast<const char*>(value) : "");
        if (value) xmlFree(value);
    }
    return attrs;
}

std::string text_of(const xmlNode* node, const ParseOptions& options) {
    xmlChar* content = xmlNodeGetContent(node);
    std::string text = content ? reinterpret_cast<const char*>(content) : "";
    if (content) xmlFree(content);
    return finish_text(std::move(text), options);
}

class TreeWalker {
public:
    TreeWalker(xmlDocPtr doc, LexiconAssembler& assembler, const ParseOptions& options)
        : doc_(doc), assembler_(assembler), options_(options) {}

    void lexicon(const xmlNode* node) {
        assembler_.begin_lexicon(read_lexicon(attributes_of(doc_, node), position_of(node)),
                                 position_of(node));
        for (const xmlNode* child = node->children; child; child = child->next) {
            if (is(child, "LexicalEntry")) entry(child);
            else if (is(child, "Synset")) synset(child);
            else if (is(child, "Lexicon")) reject(child, "nested Lexicon");
            else if (is(child, "LexiconExtension")) reject(child, "LexiconExtension is not supported");
        }
        assembler_.end_lexicon(position_of(node));
    }

    /// Elements the event strategies refuse at the same place.
    [[noreturn]] static void reject(const xmlNode* node, const std::string& message) {
        Position pos = position_of(node);
        throw ParseError(message, reinterpret_cast<const char*>(node->name), pos.line, pos.column);
    }

private:
    void tags_and_pronunciations(const xmlNode* node, Word& word, std::vector<Tag>& tags) {
        for (const xmlNode* c = node->children; c; c = c->next) {
            if (is(c, "Tag")) {
                Tag tag = read_tag(attributes_of(doc_, c));
                tag.text = text_of(c, options_);
                tags.push_back(std::move(tag));
            } else if (is(c, "Pronunciation")) {
                Pronunciation p = read_pronunciation(attributes_of(doc_, c));
                p.text = text_of(c, options_);
                word.pronunciations.push_back(std::move(p));
            }
        }
    }

    void entry(const xmlNode* node) {
        Position pos = position_of(node);
        Word word = read_entry(attributes_of(doc_, node), pos);
        std::vector<Sense> senses;

        for (const xmlNode* c = node->children; c; c = c->next) {
            if (is(c, "Lemma")) {
                read_lemma(word, attributes_of(doc_, c), position_of(c));
                tags_and_pronunciations(c, word, word.tags);
            } else if (is(c, "Form")) {
                Form form = read_form(attributes_of(doc_, c), position_of(c));
                tags_and_pronunciations(c, word, form.tags);
                word.forms.push_back(std::move(form));
            } else if (is(c, "Sense")) {
                senses.push_back(sense(c));
            }
        }
        assembler_.add_entry(std::move(word), std::move(senses), pos);
    }

    Sense sense(const xmlNode* node) {
        Sense s = read_sense(attributes_of(doc_, node), position_of(node));
        for (const xmlNode* c = node->children; c; c = c->next) {
            if (is(c, "SenseRelation")) {
                s.relations.push_back(read_relation(attributes_of(doc_, c), "SenseRelation",
                                                    RelationScope::Sense, options_, position_of(c)));
            } else if (is(c, "Example")) {
                Example ex = read_example(attributes_of(doc_, c));
                ex.text = text_of(c, options_);
                s.examples.push_back(std::move(ex));
            } else if (is(c, "Count")) {
                s.counts.push_back(read_count(text_of(c, ParseOptions{}), position_of(c)));
            }
        }
        return s;
    }

    void synset(const xmlNode* node) {
        Position pos = position_of(node);
        Synset ss = read_synset(attributes_of(doc_, node), pos);
        for (const xmlNode* c = node->children; c; c = c->next) {
            if (is(c, "Definition")) {
                Definition def = read_definition(attributes_of(doc_, c));
                def.text = text_of(c, options_);
                ss.definitions.push_back(std::move(def));
            } else if (is(c, "ILIDefinition")) {
                ss.ili_definition = text_of(c, options_);
            } else if (is(c, "SynsetRelation")) {
                ss.relations.push_back(read_relation(attributes_of(doc_, c), "SynsetRelation",
                                                     RelationScope::Synset, options_, position_of(c)));
            } else if (is(c, "Example")) {
                Example ex = read_example(attributes_of(doc_, c));
                ex.text = text_of(c, options_);
                ss.examples.push_back(std::move(ex));
            }
        }
        assembler_.add_synset(std::move(ss), pos);
    }

    xmlDocPtr doc_;
    LexiconAssembler& assembler_;
    const ParseOptions& options_;
};

} // namespace

void TreeLmfParser::parse(ParseSource& source, DocumentSink& sink, const ParseOptions& options) {
    std::istream& in = source.stream();
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Error("Read failure on " + source.name());
    }
    if (content.size() > static_cast<std::size_t>(INT_MAX)) {
        throw Error(source.name() + " is too large for the tree parser; use the stream strategy");
    }
    if (options.on_progress) options.on_progress(content.size(), source.size_hint());

    xmlResetLastError();
    std::unique_ptr<xmlDoc, DocDeleter> doc(
        xmlReadMemory(content.data(), static_cast<int>(content.size()), source.name().c_str(), nullptr,
                      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_HUGE));
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        std::string message = err && err->message ? err->message : "malformed XML";
        while (!message.empty() && message.back() == '\n') message.pop_back();
        throw ParseError(message, "", err ? static_cast<std::size_t>(err->line) : 0,
                         err ? static_cast<std::size_t>(err->int2) : 0);
    }
    content.clear();
    content.shrink_to_fit();

    if (doc->intSubset && doc->intSubset->SystemID) {
        std::string version = detect_lmf_version(reinterpret_cast<const char*>(doc->intSubset->SystemID));
        if (!version.empty()) sink.on_lmf_version(version);
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        throw ParseError("document has no LexicalResource element");
    }
    if (!is(root, "LexicalResource")) {
        Position pos = position_of(root);
        throw ParseError("root element must be LexicalResource",
                         reinterpret_cast<const char*>(root->name), pos.line, pos.column);
    }

    LexiconAssembler assembler(sink, options);
    TreeWalker walker(doc.get(), assembler, options);
    for (const xmlNode* child = root->children; child; child = child->next) {
        if (is(child, "Lexicon")) walker.lexicon(child);
        else if (is(child, "LexiconExtension")) TreeWalker::reject(child, "LexiconExtension is not supported");
        else if (is(child, "LexicalEntry")) TreeWalker::reject(child, "LexicalEntry outside Lexicon");
        else if (is(child, "Synset")) TreeWalker::reject(child, "Synset outside Lexicon");
    }
    assembler.finish(position_of(root));
}

} // namespace Lexicore
