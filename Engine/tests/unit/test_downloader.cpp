/**
 * @file test_downloader.cpp
 * @brief Downloader and Ingestor::download over file:// urls
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <ingestion/downloader.hpp>
#include <ingestion/ingestor.hpp>
#include <session/session.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <string>

using namespace Lexicore;

namespace {

std::string file_url(const std::filesystem::path& path) {
    return "file://" + std::filesystem::absolute(path).string();
}

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::filesystem::path part_of(const std::filesystem::path& dest) {
    auto part = dest;
    part += ".part";
    return part;
}

} // namespace

TEST(DownloaderTest, FetchesFileUrl) {
    Fixtures::TempDir tmp;
    auto source = tmp.write("remote/lexicon.xml", Fixtures::MINI_EN);
    auto dest = tmp.path() / "lexicon.xml";

    std::size_t last_now = 0;
    DownloadOptions options;
    options.on_progress = [&](std::size_t now, std::size_t) { last_now = now; };

    Downloader downloader;
    downloader.fetch(file_url(source), dest, options);
    EXPECT_EQ(slurp(dest), Fixtures::MINI_EN);
    EXPECT_FALSE(std::filesystem::exists(part_of(dest)));
    EXPECT_LE(last_now, Fixtures::MINI_EN.size());
}

TEST(DownloaderTest, MissingSourceLeavesNoPartialFile) {
    Fixtures::TempDir tmp;
    auto dest = tmp.path() / "out.xml";
    Downloader downloader;
    try {
        downloader.fetch(file_url(tmp.path() / "absent.xml"), dest, {});
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_EQ(e.kind(), NetworkError::Kind::Transport);
        EXPECT_TRUE(e.retryable());
    }
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(part_of(dest)));
}

TEST(DownloaderTest, CancelledTransferThrows) {
    Fixtures::TempDir tmp;
    auto source = tmp.write("remote/lexicon.xml", Fixtures::MINI_EN);
    auto dest = tmp.path() / "out.xml";
    std::atomic<bool> cancel{true};
    DownloadOptions options;
    options.cancel = &cancel;

    Downloader downloader;
    try {
        downloader.fetch_any({file_url(source)}, dest, options);
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_TRUE(e.cancelled());
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(part_of(dest)));
}

TEST(DownloaderTest, FallsBackToNextUrl) {
    Fixtures::TempDir tmp;
    auto source = tmp.write("mirror/lexicon.xml", Fixtures::CAT_FELINE);
    auto dest = tmp.path() / "out.xml";
    DownloadOptions options;
    options.retries = 1;

    Downloader downloader;
    std::string used = downloader.fetch_any({file_url(tmp.path() / "gone.xml"), file_url(source)}, dest, options);
    EXPECT_EQ(used, file_url(source));
    EXPECT_EQ(slurp(dest), Fixtures::CAT_FELINE);

    EXPECT_THROW(downloader.fetch_any({}, dest, options), NetworkError);
    EXPECT_THROW(downloader.fetch_any({file_url(tmp.path() / "gone.xml")}, dest, options), NetworkError);
}

TEST(IngestorDownloadTest, CachesAndVerifiesDigest) {
    Fixtures::TempDir tmp;
    auto payload = tmp.write("remote/mini.xml", Fixtures::MINI_EN);
    std::string digest = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(Fixtures::MINI_EN));
    auto index = tmp.write("index.json",
        R"({"mini": {"label": "Mini", "language": "en", "versions": {
              "2.0": {"urls": [")" + file_url(payload) + R"("], "blake3": ")" + digest + R"("}
        }}})");

    Config config = tmp.config();
    config.project_index = index;
    Session session(config);
    Ingestor ingestor(session);

    auto cached = ingestor.download("mini");
    EXPECT_EQ(cached.parent_path(), session.downloads_dir());
    EXPECT_EQ(slurp(cached), Fixtures::MINI_EN);
    EXPECT_EQ(cached, ingestor.cache_path(ingestor.index().resolve("mini:2.0")));

    // Served from the cache even once the source is gone
    std::filesystem::remove(payload);
    EXPECT_EQ(ingestor.download("mini:2.0"), cached);

    DownloadOptions force;
    force.force = true;
    EXPECT_THROW(ingestor.download("mini:2.0", force), NetworkError);
}

TEST(IngestorDownloadTest, DigestMismatchDiscardsFile) {
    Fixtures::TempDir tmp;
    auto payload = tmp.write("remote/mini.xml", Fixtures::MINI_EN);
    auto index = tmp.write("index.json",
        R"({"mini": {"versions": {"1.0": {"urls": [")" + file_url(payload) + R"("], "blake3": ")" +
        std::string(64, '0') + R"("}}}})");

    Config config = tmp.config();
    config.project_index = index;
    Session session(config);
    Ingestor ingestor(session);

    EXPECT_THROW(ingestor.download("mini:1.0"), ArchiveError);
    EXPECT_FALSE(std::filesystem::exists(ingestor.cache_path(ingestor.index().resolve("mini:1.0"))));
    EXPECT_THROW(ingestor.download("unknown"), ProjectError);
}
