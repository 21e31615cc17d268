/**
 * @file test_lmf_parsers.cpp
 * @brief Unit tests for the LMF parser strategies and registry
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <lmf/lmf_parser.hpp>
#include <lmf/parser_registry.hpp>
#include <lmf/stream_parser.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace Lexicore;
using Lexicore::Fixtures::lexicon_open;
using Lexicore::Fixtures::lmf_document;

namespace {

Document parse_with(const std::string& strategy, const std::string& xml, ParseOptions options = {}) {
    return make_parser(strategy)->parse_string(xml, options);
}

const Word& word_of(const Document& doc, const std::string& id) {
    const Word* w = doc.find_word(id);
    if (!w) throw std::runtime_error("no word " + id);
    return *w;
}

const Synset& synset_of(const Document& doc, const std::string& id) {
    const Synset* s = doc.find_synset(id);
    if (!s) throw std::runtime_error("no synset " + id);
    return *s;
}

/// Records the order of sink callbacks.
class RecordingSink : public DocumentSink {
public:
    void on_lexicon_begin(const Lexicon& lex) override { events.push_back("lexicon:" + lex.id); }
    void on_word(Word&& w) override { events.push_back("word:" + w.id); }
    void on_sense(Sense&& s) override { events.push_back("sense:" + s.id); }
    void on_synset(Synset&& s) override { events.push_back("synset:" + s.id); }
    void on_lexicon_end(const Lexicon& lex) override { events.push_back("end:" + lex.id); }

    std::vector<std::string> events;
};

} // namespace

// ============================================================================
// Per-strategy behavior
// ============================================================================

class ParserStrategyTest : public ::testing::TestWithParam<std::string> {};

TEST_P(ParserStrategyTest, ReadsLexiconMetadata) {
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN);
    ASSERT_EQ(doc.lexicons.size(), 1u);
    const Lexicon& lex = doc.lexicons[0];
    EXPECT_EQ(lex.id, "mini-en");
    EXPECT_EQ(lex.label, "Mini English");
    EXPECT_EQ(lex.language, "en");
    EXPECT_EQ(lex.version, "2.0");
    EXPECT_EQ(lex.url, "https://example.com/mini");
    EXPECT_EQ(lex.citation, "Mini, 2024");
    EXPECT_EQ(doc.lmf_version, "1.3");
}

TEST_P(ParserStrategyTest, CountsEntities) {
    Document doc = parse_with(GetParam(), Fixtures::CAT_FELINE);
    EXPECT_EQ(doc.words.size(), 2u);
    EXPECT_EQ(doc.senses.size(), 2u);
    EXPECT_EQ(doc.synsets.size(), 1u);
    EXPECT_EQ(doc.ili_refs, std::vector<std::string>{"i46360"});
}

TEST_P(ParserStrategyTest, MembersFollowSenseBackReferences) {
    Document doc = parse_with(GetParam(), Fixtures::CAT_FELINE);
    const Synset& ss = synset_of(doc, "ss-cat");
    EXPECT_EQ(ss.members, (std::vector<std::string>{"s-cat-1", "s-feline-1"}));
    for (const auto& sense : doc.senses) {
        EXPECT_EQ(sense.synset, "ss-cat");
        EXPECT_NE(std::find(ss.members.begin(), ss.members.end(), sense.id), ss.members.end());
    }
}

TEST_P(ParserStrategyTest, PreservesCasingAndWhitespace) {
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN);
    EXPECT_EQ(word_of(doc, "w-Dog").lemma, "Dog");
    const Synset& cat = synset_of(doc, "ss-cat");
    ASSERT_EQ(cat.definitions.size(), 1u);
    EXPECT_EQ(cat.definitions[0].text, "  feline mammal usually having thick soft fur  ");
}

TEST_P(ParserStrategyTest, TrimsTextOnlyWhenAsked) {
    ParseOptions options;
    options.trim_text = true;
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN, options);
    EXPECT_EQ(synset_of(doc, "ss-cat").definitions[0].text, "feline mammal usually having thick soft fur");
    EXPECT_EQ(word_of(doc, "w-Dog").lemma, "Dog");
}

TEST_P(ParserStrategyTest, SenseRankFollowsDocumentOrder) {
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN);
    const Word& run = word_of(doc, "w-run");
    EXPECT_EQ(run.pos, PartOfSpeech::Verb);
    EXPECT_EQ(run.senses, (std::vector<std::string>{"s-run-2", "s-run-1"}));
    EXPECT_EQ(doc.find_sense("s-run-2")->rank, 0);
    EXPECT_EQ(doc.find_sense("s-run-1")->rank, 1);
}

TEST_P(ParserStrategyTest, ReadsEntryDetails) {
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN);
    const Word& cat = word_of(doc, "w-cat");
    ASSERT_EQ(cat.forms.size(), 1u);
    EXPECT_EQ(cat.forms[0].written_form, "cats");
    ASSERT_EQ(cat.forms[0].tags.size(), 1u);
    EXPECT_EQ(cat.forms[0].tags[0], (Tag{"number", "plural"}));
    ASSERT_EQ(cat.pronunciations.size(), 1u);
    EXPECT_EQ(cat.pronunciations[0].text, "kæt");
    EXPECT_EQ(cat.pronunciations[0].variety, "GB");

    const Sense* sense = doc.find_sense("s-cat-1");
    ASSERT_NE(sense, nullptr);
    EXPECT_EQ(sense->sensekey, "cat%1:05:00::");
    EXPECT_EQ(sense->counts, std::vector<int>{18});
    ASSERT_EQ(sense->examples.size(), 1u);
    EXPECT_EQ(sense->examples[0].text, "the cat sat on the mat");

    const Sense* big = doc.find_sense("s-big-1");
    ASSERT_NE(big, nullptr);
    EXPECT_EQ(big->relations, (std::vector<RelationEdge>{{"antonym", "s-small-1"}}));
}

TEST_P(ParserStrategyTest, ReadsSynsetDetails) {
    Document doc = parse_with(GetParam(), Fixtures::MINI_EN);
    const Synset& cat = synset_of(doc, "ss-cat");
    EXPECT_EQ(cat.ili, "i46360");
    EXPECT_EQ(cat.pos, PartOfSpeech::Noun);
    ASSERT_EQ(cat.examples.size(), 1u);
    EXPECT_EQ(cat.examples[0].text, "cats purr");
    EXPECT_EQ(cat.relations, (std::vector<RelationEdge>{{"hypernym", "ss-mammal"}}));
    EXPECT_TRUE(synset_of(doc, "ss-dog").definitions.empty());
    EXPECT_TRUE(synset_of(doc, "ss-mammal").ili.empty());
}

TEST_P(ParserStrategyTest, ProposedIliKeepsDefinition) {
    std::string xml = lmf_document(lexicon_open("prop-en") + R"(
      <LexicalEntry id="w-x"><Lemma writtenForm="x" partOfSpeech="n"/><Sense id="s-x" synset="ss-x"/></LexicalEntry>
      <Synset id="ss-x" ili="in" partOfSpeech="n">
        <ILIDefinition>a newly proposed concept</ILIDefinition>
      </Synset>
    </Lexicon>)");
    Document doc = parse_with(GetParam(), xml);
    const Synset& ss = synset_of(doc, "ss-x");
    EXPECT_TRUE(ss.ili.empty());
    EXPECT_EQ(ss.ili_definition, "a newly proposed concept");
    EXPECT_TRUE(doc.ili_refs.empty());
}

TEST_P(ParserStrategyTest, MissingSynsetPosIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <Synset id="ss-1"><Definition>no pos</Definition></Synset>
    </Lexicon>)");
    try {
        parse_with(GetParam(), xml);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.element(), "Synset");
        EXPECT_GT(e.line(), 0u);
        EXPECT_NE(std::string(e.what()).find("partOfSpeech"), std::string::npos);
    }
}

TEST_P(ParserStrategyTest, InvalidPosIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <LexicalEntry id="w-1"><Lemma writtenForm="x" partOfSpeech="q"/></LexicalEntry>
    </Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);
}

TEST_P(ParserStrategyTest, SenseToUnknownSynsetIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <LexicalEntry id="w-1"><Lemma writtenForm="x" partOfSpeech="n"/><Sense id="s-1" synset="ss-missing"/></LexicalEntry>
    </Lexicon>)");
    ParseOptions lenient;
    lenient.strict = false;
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);
    EXPECT_THROW(parse_with(GetParam(), xml, lenient), ParseError);
}

TEST_P(ParserStrategyTest, SenseAfterSynsetClosedIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <Synset id="ss-1" partOfSpeech="n"/>
      <LexicalEntry id="w-1"><Lemma writtenForm="x" partOfSpeech="n"/><Sense id="s-1" synset="ss-1"/></LexicalEntry>
    </Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);
}

TEST_P(ParserStrategyTest, DuplicateIdIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <LexicalEntry id="dup"><Lemma writtenForm="x" partOfSpeech="n"/><Sense id="s-1" synset="ss-1"/></LexicalEntry>
      <Synset id="dup" partOfSpeech="n"/>
      <Synset id="ss-1" partOfSpeech="n"/>
    </Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);
}

TEST_P(ParserStrategyTest, UnknownRelationTypeDependsOnStrictness) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <Synset id="ss-1" partOfSpeech="n"><SynsetRelation relType="sibling" target="ss-2"/></Synset>
      <Synset id="ss-2" partOfSpeech="n"/>
    </Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);

    ParseOptions lenient;
    lenient.strict = false;
    Document doc = parse_with(GetParam(), xml, lenient);
    EXPECT_EQ(synset_of(doc, "ss-1").relations, (std::vector<RelationEdge>{{"other", "ss-2"}}));
}

TEST_P(ParserStrategyTest, DanglingRelationTargetDependsOnStrictness) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <Synset id="ss-1" partOfSpeech="n"><SynsetRelation relType="hypernym" target="ss-nowhere"/></Synset>
    </Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);

    ParseOptions lenient;
    lenient.strict = false;
    EXPECT_NO_THROW(parse_with(GetParam(), xml, lenient));
}

TEST_P(ParserStrategyTest, MalformedXmlCarriesPosition) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <LexicalEntry id="w-1"><Lemma writtenForm="x" partOfSpeech="n">
    </Lexicon>)");
    try {
        parse_with(GetParam(), xml);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_GT(e.line(), 0u);
    }
}

TEST_P(ParserStrategyTest, WrongRootIsRejected) {
    EXPECT_THROW(parse_with(GetParam(), "<?xml version=\"1.0\"?><Lexicon id=\"x\"/>"), ParseError);
}

TEST_P(ParserStrategyTest, MissingLexiconAttributeIsRejected) {
    std::string xml = lmf_document(R"(<Lexicon id="x" label="X" language="en" license="l" version="1"></Lexicon>)");
    EXPECT_THROW(parse_with(GetParam(), xml), ParseError);
}

TEST_P(ParserStrategyTest, ParsesFromFile) {
    Fixtures::TempDir tmp;
    auto file = tmp.write("mini.xml", Fixtures::MINI_EN);
    Document doc = make_parser(GetParam())->parse_file(file);
    EXPECT_EQ(doc.words.size(), 8u);
    EXPECT_EQ(doc.synsets.size(), 9u);
}

TEST_P(ParserStrategyTest, LexiconExtensionIsRejected) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <Synset id="ss-1" partOfSpeech="n"/>
    </Lexicon>
    <LexiconExtension id="bad-ext" label="Ext" language="en" email="ext@example.com"
                      license="https://example.com/license" version="1.0">
      <Extends id="bad-en" version="1.0"/>
      <LexicalEntry id="w-ext"><Lemma writtenForm="ext" partOfSpeech="n"/><Sense id="s-ext" synset="ss-1"/></LexicalEntry>
    </LexiconExtension>)");
    try {
        parse_with(GetParam(), xml);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.element(), "LexiconExtension");
        EXPECT_GT(e.line(), 0u);
    }
}

TEST_P(ParserStrategyTest, EntryOutsideLexiconIsRejected) {
    std::string xml = lmf_document(R"(
      <LexicalEntry id="w-1"><Lemma writtenForm="x" partOfSpeech="n"/></LexicalEntry>)");
    try {
        parse_with(GetParam(), xml);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.element(), "LexicalEntry");
    }
}

TEST_P(ParserStrategyTest, MarkupInsideTextKeepsAllCharacters) {
    std::string xml = lmf_document(lexicon_open() + R"(
      <LexicalEntry id="w-1">
        <Lemma writtenForm="x" partOfSpeech="n"/>
        <Sense id="s-1" synset="ss-1"><Example>see <b>this</b> one</Example></Sense>
      </LexicalEntry>
      <Synset id="ss-1" partOfSpeech="n">
        <Definition>a<x/>b</Definition>
        <Definition>one <em>two <i>and</i></em> three</Definition>
        <Definition>c<Definition>d</Definition>e</Definition>
      </Synset>
    </Lexicon>)");
    Document doc = parse_with(GetParam(), xml);
    const Synset& ss = synset_of(doc, "ss-1");
    ASSERT_EQ(ss.definitions.size(), 3u);
    EXPECT_EQ(ss.definitions[0].text, "ab");
    EXPECT_EQ(ss.definitions[1].text, "one two and three");
    EXPECT_EQ(ss.definitions[2].text, "cde");
    ASSERT_EQ(doc.find_sense("s-1")->examples.size(), 1u);
    EXPECT_EQ(doc.find_sense("s-1")->examples[0].text, "see this one");
}

TEST_P(ParserStrategyTest, CountAcceptsSignAndSurroundingWhitespace) {
    auto with_count = [](const std::string& counts) {
        return lmf_document(lexicon_open() + R"(
          <LexicalEntry id="w-1">
            <Lemma writtenForm="x" partOfSpeech="n"/>
            <Sense id="s-1" synset="ss-1">)" + counts + R"(</Sense>
          </LexicalEntry>
          <Synset id="ss-1" partOfSpeech="n"/>
        </Lexicon>)");
    };

    Document doc = parse_with(GetParam(), with_count("<Count>+5</Count><Count> 5 </Count><Count>-2</Count>"));
    EXPECT_EQ(doc.find_sense("s-1")->counts, (std::vector<int>{5, 5, -2}));

    EXPECT_THROW(parse_with(GetParam(), with_count("<Count>5x</Count>")), ParseError);
    EXPECT_THROW(parse_with(GetParam(), with_count("<Count>+</Count>")), ParseError);
    EXPECT_THROW(parse_with(GetParam(), with_count("<Count>+-5</Count>")), ParseError);
    EXPECT_THROW(parse_with(GetParam(), with_count("<Count>99999999999</Count>")), ParseError);
}

INSTANTIATE_TEST_SUITE_P(Strategies, ParserStrategyTest,
                         ::testing::Values("stream", "reader", "tree"));

// ============================================================================
// Cross-strategy equality
// ============================================================================

TEST(ParserEqualityTest, AllStrategiesAgree) {
    for (const std::string* xml : {&Fixtures::CAT_FELINE, &Fixtures::MINI_EN, &Fixtures::MINI_FR}) {
        Document stream = parse_with("stream", *xml);
        Document reader = parse_with("reader", *xml);
        Document tree = parse_with("tree", *xml);
        EXPECT_TRUE(equivalent(stream, reader));
        EXPECT_TRUE(equivalent(stream, tree));
        EXPECT_TRUE(equivalent(reader, tree));
    }
}

TEST(ParserEqualityTest, EquivalenceDetectsDifferences) {
    Document a = parse_with("stream", Fixtures::MINI_EN);
    Document b = a;
    EXPECT_TRUE(equivalent(a, b));
    std::reverse(b.synsets.begin(), b.synsets.end());
    EXPECT_TRUE(equivalent(a, b));
    b.synsets.front().definitions.push_back(Definition{"extra", "", ""});
    EXPECT_FALSE(equivalent(a, b));
}

// ============================================================================
// Incremental push parsing
// ============================================================================

TEST(PushParserTest, ByteAtATimeMatchesWholeParse) {
    const std::string& xml = Fixtures::MINI_EN;
    DocumentCollector collector;
    ParseOptions options;
    LmfPushParser push(collector, options);
    for (char c : xml) push.feed(&c, 1);
    push.finish();

    EXPECT_EQ(push.bytes_fed(), xml.size());
    EXPECT_TRUE(equivalent(collector.take(), parse_with("tree", xml)));
}

TEST(PushParserTest, EmitsEntriesBeforeInputEnds) {
    const std::string& xml = Fixtures::CAT_FELINE;
    auto cut = xml.find("<Synset");
    ASSERT_NE(cut, std::string::npos);

    RecordingSink sink;
    ParseOptions options;
    LmfPushParser push(sink, options);
    push.feed(xml.data(), cut);

    EXPECT_NE(std::find(sink.events.begin(), sink.events.end(), "word:w-cat"), sink.events.end());
    EXPECT_EQ(std::find(sink.events.begin(), sink.events.end(), "synset:ss-cat"), sink.events.end());

    push.feed(xml.data() + cut, xml.size() - cut);
    push.finish();
    EXPECT_EQ(sink.events.front(), "lexicon:test-en");
    EXPECT_EQ(sink.events.back(), "end:test-en");
}

TEST(PushParserTest, TruncatedInputFailsAtFinish) {
    const std::string& xml = Fixtures::CAT_FELINE;
    DocumentCollector collector;
    ParseOptions options;
    LmfPushParser push(collector, options);
    push.feed(xml.data(), xml.size() / 2);
    EXPECT_THROW(push.finish(), ParseError);
}

TEST(PushParserTest, ReportsProgress) {
    Fixtures::TempDir tmp;
    auto file = tmp.write("mini.xml", Fixtures::MINI_EN);
    std::size_t last_done = 0;
    std::size_t last_total = 0;
    ParseOptions options;
    options.on_progress = [&](std::size_t done, std::size_t total) {
        last_done = done;
        last_total = total;
    };
    make_parser("stream")->parse_file(file, options);
    EXPECT_EQ(last_done, Fixtures::MINI_EN.size());
    EXPECT_EQ(last_total, Fixtures::MINI_EN.size());
}

// ============================================================================
// Registry
// ============================================================================

TEST(ParserRegistryTest, NamesRoundTrip) {
    for (const auto& name : parser_names()) {
        auto kind = parser_kind_from_name(name);
        ASSERT_TRUE(kind.has_value()) << name;
        EXPECT_EQ(parser_kind_name(*kind), name);
    }
    EXPECT_FALSE(parser_kind_from_name("dom").has_value());
    EXPECT_THROW(make_parser("dom"), ConfigurationError);
    EXPECT_THROW(make_parser(ParserKind::Auto), ConfigurationError);
}

TEST(ParserRegistryTest, AutoPicksBySize) {
    constexpr std::size_t threshold = 1024;
    EXPECT_EQ(resolve_parser_kind(ParserKind::Auto, 10, threshold), ParserKind::Tree);
    EXPECT_EQ(resolve_parser_kind(ParserKind::Auto, 4096, threshold), ParserKind::Stream);
    EXPECT_EQ(resolve_parser_kind(ParserKind::Auto, 0, threshold), ParserKind::Stream);
    EXPECT_EQ(resolve_parser_kind(ParserKind::Reader, 10, threshold), ParserKind::Reader);
}

TEST(ParserRegistryTest, SniffsLmfFiles) {
    Fixtures::TempDir tmp;
    EXPECT_TRUE(is_lmf(tmp.write("a.xml", Fixtures::CAT_FELINE)));
    EXPECT_FALSE(is_lmf(tmp.write("b.xml", "<?xml version=\"1.0\"?><html/>")));
    EXPECT_FALSE(is_lmf(tmp.path() / "missing.xml"));
}
