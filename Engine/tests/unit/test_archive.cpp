/**
 * @file test_archive.cpp
 * @brief Tests for gzip/xz decompression, tar extraction and payload discovery
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/archive.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <lzma.h>
#include <zlib.h>

using namespace Lexicore;

namespace {

constexpr std::size_t BLOCK = 512;

void put_octal(char* dst, std::size_t len, std::uint64_t value) {
    std::snprintf(dst, len, "%0*llo", static_cast<int>(len - 1), static_cast<unsigned long long>(value));
}

std::string tar_header(const std::string& name, std::size_t size, char type) {
    std::string block(BLOCK, '\0');
    std::memcpy(block.data(), name.data(), std::min(name.size(), std::size_t{100}));
    put_octal(block.data() + 100, 8, 0644);
    put_octal(block.data() + 108, 8, 0);
    put_octal(block.data() + 116, 8, 0);
    put_octal(block.data() + 124, 12, size);
    put_octal(block.data() + 136, 12, 0);
    block[156] = type;
    std::memcpy(block.data() + 257, "ustar\0" "00", 8);
    std::memset(block.data() + 148, ' ', 8);

    unsigned sum = 0;
    for (unsigned char c : block) sum += c;
    std::snprintf(block.data() + 148, 8, "%06o", sum);
    block[155] = ' ';
    return block;
}

/// Entries are (name, content); content is ignored for directories ending in '/'.
std::string make_tar(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::string out;
    for (const auto& [name, content] : entries) {
        bool dir = !name.empty() && name.back() == '/';
        out += tar_header(name, dir ? 0 : content.size(), dir ? '5' : '0');
        if (dir) continue;
        out += content;
        out.append((BLOCK - content.size() % BLOCK) % BLOCK, '\0');
    }
    out.append(2 * BLOCK, '\0');
    return out;
}

std::string pax_record(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    std::size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) ++len;
    return std::to_string(len) + body;
}

/// A pax extended header carrying records, followed by one regular entry.
std::string make_pax_tar(const std::string& records, const std::string& name, const std::string& content) {
    std::string out = tar_header("PaxHeaders/" + name, records.size(), 'x');
    out += records;
    out.append((BLOCK - records.size() % BLOCK) % BLOCK, '\0');
    return out + make_tar({{name, content}});
}

void write_gzip(const std::filesystem::path& path, const std::string& data) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    ASSERT_EQ(gzwrite(gz, data.data(), static_cast<unsigned>(data.size())), static_cast<int>(data.size()));
    ASSERT_EQ(gzclose(gz), Z_OK);
}

void write_xz(const std::filesystem::path& path, const std::string& data) {
    std::vector<uint8_t> out(lzma_stream_buffer_bound(data.size()));
    size_t out_pos = 0;
    ASSERT_EQ(lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                      reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                                      out.data(), &out_pos, out.size()),
              LZMA_OK);
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out_pos));
}

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(ArchiveTest, DetectsCompression) {
    Fixtures::TempDir tmp;
    write_gzip(tmp.path() / "a.gz", "hello");
    write_xz(tmp.path() / "a.xz", "hello");
    auto plain = tmp.write("a.txt", "hello");
    EXPECT_EQ(detect_compression(tmp.path() / "a.gz"), Compression::Gzip);
    EXPECT_EQ(detect_compression(tmp.path() / "a.xz"), Compression::Xz);
    EXPECT_EQ(detect_compression(plain), Compression::None);
}

TEST(ArchiveTest, ReadsGzipAndXzStreams) {
    Fixtures::TempDir tmp;
    const std::string& data = Fixtures::MINI_EN;
    write_gzip(tmp.path() / "mini.xml.gz", data);
    write_xz(tmp.path() / "mini.xml.xz", data);

    for (const char* name : {"mini.xml.gz", "mini.xml.xz"}) {
        DecompressingReader reader(tmp.path() / name);
        std::string out;
        char buf[100];
        while (std::size_t n = reader.read(buf, sizeof(buf))) out.append(buf, n);
        EXPECT_EQ(out, data) << name;
    }
}

TEST(ArchiveTest, CorruptDataThrows) {
    Fixtures::TempDir tmp;
    write_gzip(tmp.path() / "good.gz", Fixtures::MINI_EN);
    std::string bytes = slurp(tmp.path() / "good.gz");
    auto truncated = tmp.write("bad.gz", bytes.substr(0, bytes.size() / 2));

    DecompressingReader reader(truncated);
    std::vector<char> buf(Fixtures::MINI_EN.size() * 2);
    EXPECT_THROW(reader.read_full(buf.data(), buf.size()), ArchiveError);
}

TEST(ArchiveTest, TarHeaderChecksum) {
    std::string header = tar_header("a.xml", 3, '0');
    EXPECT_TRUE(is_tar_header(header.data()));
    header[0] = 'b';
    EXPECT_FALSE(is_tar_header(header.data()));
    std::string zeros(BLOCK, '\0');
    EXPECT_FALSE(is_tar_header(zeros.data()));
}

TEST(ArchiveTest, ExtractsCompressedTar) {
    Fixtures::TempDir tmp;
    std::string tar = make_tar({
        {"pkg/", ""},
        {"pkg/README", "readme"},
        {"pkg/lexicon.xml", Fixtures::CAT_FELINE},
    });
    write_gzip(tmp.path() / "pkg.tar.gz", tar);
    write_xz(tmp.path() / "pkg.tar.xz", tar);

    for (const char* name : {"pkg.tar.gz", "pkg.tar.xz"}) {
        auto dest = tmp.path() / (std::string("out-") + name);
        auto written = extract_archive(tmp.path() / name, dest);
        ASSERT_EQ(written.size(), 2u) << name;
        EXPECT_EQ(slurp(dest / "pkg" / "lexicon.xml"), Fixtures::CAT_FELINE);
        EXPECT_EQ(slurp(dest / "pkg" / "README"), "readme");
    }
}

TEST(ArchiveTest, ExtractsPlainTar) {
    Fixtures::TempDir tmp;
    auto archive = tmp.write("pkg.tar", make_tar({{"one.xml", "<x/>"}}));
    auto written = extract_archive(archive, tmp.path() / "out");
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(slurp(tmp.path() / "out" / "one.xml"), "<x/>");
}

TEST(ArchiveTest, ExtractsSingleCompressedFile) {
    Fixtures::TempDir tmp;
    write_gzip(tmp.path() / "lexicon.xml.gz", Fixtures::CAT_FELINE);
    auto written = extract_archive(tmp.path() / "lexicon.xml.gz", tmp.path() / "out");
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0].filename(), "lexicon.xml");
    EXPECT_EQ(slurp(written[0]), Fixtures::CAT_FELINE);
}

TEST(ArchiveTest, RejectsEntriesOutsideDestination) {
    Fixtures::TempDir tmp;
    auto escaping = tmp.write("evil.tar", make_tar({{"../escape.xml", "x"}}));
    EXPECT_THROW(extract_archive(escaping, tmp.path() / "out"), ArchiveError);
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "escape.xml"));

    auto absolute = tmp.write("abs.tar", make_tar({{"/tmp/abs.xml", "x"}}));
    EXPECT_THROW(extract_archive(absolute, tmp.path() / "out2"), ArchiveError);
}

TEST(ArchiveTest, PaxPathOverridesHeaderName) {
    Fixtures::TempDir tmp;
    std::string records = pax_record("mtime", "1700000000.5") + pax_record("path", "long/dir/renamed.xml");
    auto archive = tmp.write("pax.tar", make_pax_tar(records, "short.xml", "<y/>"));
    auto written = extract_archive(archive, tmp.path() / "out");
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(slurp(tmp.path() / "out" / "long" / "dir" / "renamed.xml"), "<y/>");
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "out" / "short.xml"));
}

TEST(ArchiveTest, CorruptPaxRecordsThrowArchiveError) {
    const std::vector<std::string> corrupt = {
        "abc path=x.xml\n",                        // non-numeric length
        "3 path=x.xml\n",                          // length shorter than its own prefix
        "99 path=x.xml\n",                         // length past the end of the header data
        "99999999999999999999999 path=x.xml\n",    // length overflows
        "9 path=xy",                               // record without its newline
        "13 path=x.xml",                           // no newline, length fits exactly
        "8 nokey\n",                               // record without '='
        pax_record("size", "12abc"),
        pax_record("size", "99999999999999999999999"),
        "no length field at all",
    };
    Fixtures::TempDir tmp;
    int n = 0;
    for (const auto& records : corrupt) {
        auto archive = tmp.write("bad" + std::to_string(n) + ".tar", make_pax_tar(records, "x.xml", "<x/>"));
        EXPECT_THROW(extract_archive(archive, tmp.path() / ("out" + std::to_string(n))), ArchiveError)
            << records;
        ++n;
    }
}

TEST(ArchiveTest, PlainFileIsNotAnArchive) {
    Fixtures::TempDir tmp;
    auto plain = tmp.write("notes.txt", "just text");
    EXPECT_THROW(extract_archive(plain, tmp.path() / "out"), ArchiveError);
}

TEST(ArchiveTest, FindsPayloadsSorted) {
    Fixtures::TempDir tmp;
    tmp.write("root/b/z.xml", "");
    tmp.write("root/a.xml", "");
    tmp.write("root/c/ili.tsv", "");
    tmp.write("root/LICENSE", "");

    auto found = find_payloads(tmp.path() / "root", {".xml", ".tsv"});
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0], tmp.path() / "root" / "a.xml");
    EXPECT_EQ(found[1], tmp.path() / "root" / "b" / "z.xml");
    EXPECT_EQ(found[2], tmp.path() / "root" / "c" / "ili.tsv");
    EXPECT_TRUE(find_payloads(tmp.path() / "missing", {".xml"}).empty());
}

TEST(ArchiveTest, ArchiveStem) {
    EXPECT_EQ(archive_stem("omw-en-1.4.tar.xz"), "omw-en-1.4");
    EXPECT_EQ(archive_stem("english-wordnet-2024.xml.gz"), "english-wordnet-2024.xml");
    EXPECT_EQ(archive_stem("pkg.tgz"), "pkg");
    EXPECT_EQ(archive_stem("/some/dir/pkg.tar"), "pkg");
    EXPECT_EQ(archive_stem("plain.xml"), "plain.xml");
}
