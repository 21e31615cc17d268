/**
 * @file test_lmf_writer.cpp
 * @brief LmfWriter output must parse back to the same entities
 */

#include <gtest/gtest.h>
#include <lmf/lmf_writer.hpp>
#include <lmf/parser_registry.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <string>

using namespace Lexicore;

namespace {

std::string serialize(const Document& doc) {
    LmfWriter writer;
    writer.write_lexicon(doc);
    writer.close();
    return writer.str();
}

} // namespace

TEST(LmfWriterTest, ReparsesToEquivalentDocument) {
    for (const std::string* xml : {&Fixtures::CAT_FELINE, &Fixtures::MINI_EN, &Fixtures::MINI_FR}) {
        Document original = make_parser("tree")->parse_string(*xml);
        Document again = make_parser("stream")->parse_string(serialize(original));
        EXPECT_TRUE(equivalent(original, again));
        EXPECT_EQ(again.lmf_version, "1.3");
    }
}

TEST(LmfWriterTest, KeepsWhitespaceAndEscapes) {
    std::string xml = Fixtures::lmf_document(Fixtures::lexicon_open("esc-en") + R"(
      <LexicalEntry id="w-1"><Lemma writtenForm="R&amp;D" partOfSpeech="n"/><Sense id="s-1" synset="ss-1"/></LexicalEntry>
      <Synset id="ss-1" partOfSpeech="n"><Definition>  a &lt;quoted&gt; "thing"  </Definition></Synset>
    </Lexicon>)");
    Document original = make_parser("tree")->parse_string(xml);
    std::string out = serialize(original);
    EXPECT_NE(out.find("R&amp;D"), std::string::npos);

    Document again = make_parser("reader")->parse_string(out);
    EXPECT_EQ(again.find_word("w-1")->lemma, "R&D");
    EXPECT_EQ(again.find_synset("ss-1")->definitions[0].text, "  a <quoted> \"thing\"  ");
}

TEST(LmfWriterTest, CloseIsIdempotent) {
    Document doc = make_parser("tree")->parse_string(Fixtures::CAT_FELINE);
    LmfWriter writer;
    writer.write_lexicon(doc);
    writer.close();
    std::string first = writer.str();
    writer.close();
    EXPECT_EQ(writer.str(), first);
}

TEST(LmfWriterTest, WritesFile) {
    Fixtures::TempDir tmp;
    auto file = tmp.path() / "out.xml";
    Document doc = make_parser("tree")->parse_string(Fixtures::MINI_EN);
    {
        LmfWriter writer(file);
        writer.write_lexicon(doc);
        writer.close();
    }
    EXPECT_TRUE(is_lmf(file));
    EXPECT_TRUE(equivalent(doc, make_parser("stream")->parse_file(file)));
}
