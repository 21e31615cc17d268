/**
 * @file lmf_writer.cpp
 * @brief LMF XML output
 */

#include <lmf/lmf_writer.hpp>
#include <core/errors.hpp>
#include <unordered_map>

namespace Lexicore {

namespace {

const xmlChar* X(const char* s) {
    return reinterpret_cast<const xmlChar*>(s);
}

void check(int rc, const char* what) {
    if (rc < 0) {
        throw Error(std::string("LMF writer failed: ") + what);
    }
}

} // namespace

LmfWriter::LmfWriter(const std::filesystem::path& path) {
    writer_ = xmlNewTextWriterFilename(path.string().c_str(), 0);
    if (!writer_) {
        throw Error("Cannot open " + path.string() + " for writing");
    }
    begin();
}

LmfWriter::LmfWriter() {
    buffer_ = xmlBufferCreate();
    if (!buffer_) {
        throw Error("LMF writer: buffer allocation failed");
    }
    writer_ = xmlNewTextWriterMemory(buffer_, 0);
    if (!writer_) {
        xmlBufferFree(buffer_);
        buffer_ = nullptr;
        throw Error("LMF writer: writer allocation failed");
    }
    begin();
}

LmfWriter::~LmfWriter() {
    if (writer_) {
        xmlFreeTextWriter(writer_);
        writer_ = nullptr;
    }
    if (buffer_) {
        xmlBufferFree(buffer_);
        buffer_ = nullptr;
    }
}

void LmfWriter::begin() {
    check(xmlTextWriterSetIndent(writer_, 1), "indent");
    check(xmlTextWriterSetIndentString(writer_, X("  ")), "indent");
    check(xmlTextWriterStartDocument(writer_, "1.0", "UTF-8", nullptr), "start document");
    check(xmlTextWriterWriteDTD(writer_, X("LexicalResource"), nullptr,
                                X("http://globalwordnet.github.io/schemas/WN-LMF-1.3.dtd"), nullptr),
          "doctype");
    start("LexicalResource");
    check(xmlTextWriterWriteAttribute(writer_, X("xmlns:dc"), X("https://globalwordnet.github.io/schemas/dc/")),
          "namespace");
}

void LmfWriter::start(const char* element) {
    check(xmlTextWriterStartElement(writer_, X(element)), element);
}

void LmfWriter::end() {
    check(xmlTextWriterEndElement(writer_), "end element");
}

void LmfWriter::attr(const char* name, const std::string& value, bool omit_empty) {
    if (omit_empty && value.empty()) return;
    check(xmlTextWriterWriteAttribute(writer_, X(name), X(value.c_str())), name);
}

void LmfWriter::text(const std::string& value) {
    check(xmlTextWriterWriteString(writer_, X(value.c_str())), "text");
}

void LmfWriter::write_lexicon(const Document& doc) {
    if (closed_) {
        throw Error("LMF writer already closed");
    }

    std::unordered_map<std::string, const Sense*> senses;
    for (const auto& s : doc.senses) senses.emplace(s.lexicon + '\x1f' + s.id, &s);

    for (const auto& lex : doc.lexicons) {
        start("Lexicon");
        attr("id", lex.id, false);
        attr("label", lex.label, false);
        attr("language", lex.language, false);
        attr("email", lex.email, false);
        attr("license", lex.license, false);
        attr("version", lex.version, false);
        attr("url", lex.url);
        attr("citation", lex.citation);
        attr("logo", lex.logo);

        for (const auto& word : doc.words) {
            if (word.lexicon != lex.id) continue;
            start("LexicalEntry");
            attr("id", word.id, false);

            start("Lemma");
            attr("writtenForm", word.lemma, false);
            attr("partOfSpeech", pos_code(word.pos), false);
            attr("script", word.script);
            for (const auto& p : word.pronunciations) {
                start("Pronunciation");
                attr("variety", p.variety);
                attr("notation", p.notation);
                if (!p.phonemic) attr("phonemic", "false");
                attr("audio", p.audio);
                text(p.text);
                end();
            }
            for (const auto& t : word.tags) {
                start("Tag");
                attr("category", t.category, false);
                text(t.text);
                end();
            }
            end(); // Lemma

            for (const auto& form : word.forms) {
                start("Form");
                attr("id", form.id);
                attr("writtenForm", form.written_form, false);
                attr("script", form.script);
                for (const auto& t : form.tags) {
                    start("Tag");
                    attr("category", t.category, false);
                    text(t.text);
                    end();
                }
                end();
            }

            for (const auto& sense_id : word.senses) {
                auto it = senses.find(lex.id + '\x1f' + sense_id);
                if (it == senses.end()) {
                    throw Error("LMF writer: word " + word.id + " lists missing sense " + sense_id);
                }
                const Sense& sense = *it->second;
                start("Sense");
                attr("id", sense.id, false);
                attr("synset", sense.synset, false);
                attr("dc:identifier", sense.sensekey);
                attr("adjposition", sense.adjposition);
                if (!sense.lexicalized) attr("lexicalized", "false");
                for (const auto& rel : sense.relations) {
                    start("SenseRelation");
                    attr("relType", rel.type, false);
                    attr("target", rel.target, false);
                    end();
                }
                for (const auto& ex : sense.examples) {
                    start("Example");
                    attr("language", ex.language);
                    text(ex.text);
                    end();
                }
                for (int count : sense.counts) {
                    start("Count");
                    text(std::to_string(count));
                    end();
                }
                end();
            }
            end(); // LexicalEntry
        }

        for (const auto& ss : doc.synsets) {
            if (ss.lexicon != lex.id) continue;
            start("Synset");
            attr("id", ss.id, false);
            attr("ili", ss.ili_definition.empty() ? ss.ili : std::string("in"));
            attr("partOfSpeech", pos_code(ss.pos), false);
            if (!ss.lexicalized) attr("lexicalized", "false");
            for (const auto& def : ss.definitions) {
                start("Definition");
                attr("language", def.language);
                attr("sourceSense", def.source_sense);
                text(def.text);
                end();
            }
            if (!ss.ili_definition.empty()) {
                start("ILIDefinition");
                text(ss.ili_definition);
                end();
            }
            for (const auto& rel : ss.relations) {
                start("SynsetRelation");
                attr("relType", rel.type, false);
                attr("target", rel.target, false);
                end();
            }
            for (const auto& ex : ss.examples) {
                start("Example");
                attr("language", ex.language);
                text(ex.text);
                end();
            }
            end();
        }

        end(); // Lexicon
    }
}

void LmfWriter::close() {
    if (closed_) return;
    closed_ = true;
    check(xmlTextWriterEndDocument(writer_), "end document");
    check(xmlTextWriterFlush(writer_), "flush");
}

std::string LmfWriter::str() const {
    if (!buffer_) return {};
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer_)),
                       static_cast<std::size_t>(xmlBufferLength(buffer_)));
}

} // namespace Lexicore
