/**
 * @file test_ili_reader.cpp
 * @brief Tests for the ILI tab-separated reader
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <lmf/ili_reader.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <sstream>
#include <vector>

using namespace Lexicore;

namespace {

std::vector<IliEntry> read_all(const std::string& text) {
    std::istringstream in(text);
    std::vector<IliEntry> out;
    read_ili_tsv(in, [&](IliEntry&& e) { out.push_back(std::move(e)); });
    return out;
}

} // namespace

TEST(IliReaderTest, ReadsEntries) {
    auto entries = read_all(Fixtures::ILI_TSV);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0], (IliEntry{"i35545", "standard", "that which is perceived to have its own distinct existence"}));
    EXPECT_EQ(entries[2].id, "i99999");
    EXPECT_EQ(entries[2].status, "deprecated");
    EXPECT_TRUE(entries[2].definition.empty());
}

TEST(IliReaderTest, DefaultsStatusAndToleratesCrlf) {
    auto entries = read_all("definition\tili\r\nsome concept\ti1\r\n\r\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].id, "i1");
    EXPECT_EQ(entries[0].status, "standard");
    EXPECT_EQ(entries[0].definition, "some concept");
}

TEST(IliReaderTest, RejectsBadInput) {
    EXPECT_THROW(read_all(""), ParseError);
    EXPECT_THROW(read_all("id\tdefinition\ni1\tx\n"), ParseError);
    EXPECT_THROW(read_all("ili\tstatus\ni1\n"), ParseError);
    EXPECT_THROW(read_all("ili\tstatus\n\tstandard\n"), ParseError);
}

TEST(IliReaderTest, SniffsIliFiles) {
    Fixtures::TempDir tmp;
    EXPECT_TRUE(is_ili_tsv(tmp.write("cili.tsv", Fixtures::ILI_TSV)));
    EXPECT_FALSE(is_ili_tsv(tmp.write("lex.xml", Fixtures::CAT_FELINE)));
    EXPECT_FALSE(is_ili_tsv(tmp.write("other.tsv", "a\tb\n1\t2\n")));
    EXPECT_FALSE(is_ili_tsv(tmp.path() / "missing.tsv"));
}
