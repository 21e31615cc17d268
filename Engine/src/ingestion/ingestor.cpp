/**
 * @file ingestor.cpp
 * @brief Download, extract, add and remove
 */

#include <ingestion/ingestor.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <ingestion/archive.hpp>
#include <lmf/ili_reader.hpp>
#include <storage/lexicon_writer.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_set>

namespace Lexicore {

namespace {

std::string url_filename(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? "download" : name;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_archive(const std::filesystem::path& path) {
    if (detect_compression(path) != Compression::None) return true;
    std::ifstream in(path, std::ios::binary);
    char block[512];
    in.read(block, sizeof(block));
    return in.gcount() == static_cast<std::streamsize>(sizeof(block)) && is_tar_header(block);
}

} // namespace

Ingestor::Ingestor(Session& session)
    : session_(session),
      index_(session.config().project_index.empty()
                 ? ProjectIndex::builtin()
                 : ProjectIndex::load_file(session.config().project_index)) {}

std::filesystem::path Ingestor::cache_path(const ResolvedProject& project) const {
    std::string name = BLAKE3Pipeline::short_key(project.urls.front()) + "-" + project.id + "-" +
                       project.version + "-" + url_filename(project.urls.front());
    return session_.downloads_dir() / name;
}

std::filesystem::path Ingestor::download(std::string_view spec, const DownloadOptions& options) {
    ResolvedProject project = index_.resolve(spec);
    auto dest = cache_path(project);

    if (!options.force && std::filesystem::is_regular_file(dest)) {
        Logger::info("Using cached " + project.id + ":" + project.version + " (" + dest.filename().string() + ")");
        return dest;
    }

    DownloadOptions effective = options;
    if (effective.timeout_ms <= 0) effective.timeout_ms = session_.config().download_timeout_ms;
    if (effective.retries < 0) effective.retries = session_.config().download_retries;

    Timer timer;
    std::string url = downloader_.fetch_any(project.urls, dest, effective);

    if (!project.blake3.empty()) {
        auto actual = BLAKE3Pipeline::hash_file(dest);
        if (actual != BLAKE3Pipeline::from_hex(project.blake3)) {
            std::error_code ec;
            std::filesystem::remove(dest, ec);
            throw ArchiveError("BLAKE3 digest mismatch for " + url + ": expected " + project.blake3 +
                               ", got " + BLAKE3Pipeline::to_hex(actual));
        }
    }

    Logger::success("Downloaded " + project.id + ":" + project.version + " in " + timer.pretty());
    return dest;
}

std::vector<Ingestor::Payload> Ingestor::classify(const std::vector<std::filesystem::path>& files) const {
    std::vector<Payload> payloads;
    for (const auto& file : files) {
        if (is_ili_tsv(file)) {
            payloads.push_back({file, true});
        } else if (is_lmf(file)) {
            payloads.push_back({file, false});
        } else {
            Logger::debug("Skipping non-LMF file " + file.string());
        }
    }
    return payloads;
}

std::vector<std::filesystem::path> Ingestor::extract(const std::filesystem::path& archive) {
    auto dest = session_.extracted_dir() / archive_stem(archive);
    std::error_code ec;
    std::filesystem::remove_all(dest, ec);

    Timer timer;
    extract_archive(archive, dest);

    auto extensions = session_.config().lmf_extensions;
    extensions.push_back(".tsv");
    std::vector<std::filesystem::path> found;
    for (const auto& p : classify(find_payloads(dest, extensions))) {
        found.push_back(p.path);
    }
    if (found.empty()) {
        throw ArchiveError("No LMF payload found in " + archive.string());
    }
    Logger::info("Extracted " + archive.filename().string() + " (" + std::to_string(found.size()) +
                 " payload(s), " + timer.pretty() + ")");
    return found;
}

std::vector<Ingestor::Payload> Ingestor::collect_payloads(const std::filesystem::path& source) {
    if (!std::filesystem::exists(source)) {
        throw NotFoundError("No such source: " + source.string());
    }

    if (std::filesystem::is_directory(source)) {
        auto extensions = session_.config().lmf_extensions;
        extensions.push_back(".tsv");
        auto payloads = classify(find_payloads(source, extensions));
        if (payloads.empty()) {
            throw ArchiveError("No LMF payload found in directory " + source.string());
        }
        return payloads;
    }

    if (is_archive(source)) {
        return classify(extract(source));
    }

    std::string ext = lower(source.extension().string());
    if (ext == ".tsv" || is_ili_tsv(source)) {
        return {{source, true}};
    }
    return {{source, false}};
}

void Ingestor::retain_source(const std::string& lexicon_id, const std::filesystem::path& payload) {
    auto dir = session_.sources_dir() / lexicon_id;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    if (!ec) {
        std::filesystem::copy_file(payload, dir / payload.filename(),
                                   std::filesystem::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        Logger::warn("Could not retain source for " + lexicon_id + ": " + ec.message());
    }
}

IngestionStats Ingestor::add(const std::filesystem::path& source, const AddOptions& options) {
    const Config& config = session_.config();
    IngestionStats stats;
    Timer total;

    Logger::step("Adding " + source.string());
    auto payloads = collect_payloads(source);
    stats.payloads = payloads.size();

    // Parse everything before touching the store
    Timer parse_timer;
    std::vector<std::pair<Document, std::filesystem::path>> documents;
    std::vector<IliEntry> ili_entries;
    std::unordered_set<std::string> ids;

    for (const auto& payload : payloads) {
        if (payload.ili) {
            std::ifstream in(payload.path, std::ios::binary);
            if (!in) {
                throw Error("Cannot open ILI file: " + payload.path.string());
            }
            read_ili_tsv(in, [&](IliEntry&& entry) { ili_entries.push_back(std::move(entry)); });
            continue;
        }

        auto src = ParseSource::from_file(payload.path);
        ParserKind kind = resolve_parser_kind(options.parser.value_or(config.parser),
                                              src.size_hint(), config.stream_threshold_bytes);
        auto parser = make_parser(kind);

        ParseOptions parse_options = session_.parse_options();
        parse_options.on_progress = options.on_progress;

        Logger::info("Parsing " + payload.path.filename().string() + " with the " + parser->name() + " parser");
        Document doc = parser->parse(src, parse_options);

        for (const auto& lex : doc.lexicons) {
            if (!ids.insert(lex.id).second) {
                throw ConflictError("Lexicon " + lex.id + " appears in more than one payload of " +
                                    source.string());
            }
        }
        documents.emplace_back(std::move(doc), payload.path);
    }
    stats.parse_ms = parse_timer.elapsed_ms();

    Timer write_timer;
    session_.store().write([&](SqliteConnection& db) {
        LexiconWriter writer(db);
        for (const auto& [doc, path] : documents) {
            for (const auto& lex : doc.lexicons) {
                if (writer.exists(lex.id)) {
                    if (!options.force) {
                        throw ConflictError("Lexicon already installed: " + lex.id +
                                            " (use force to replace it)");
                    }
                    Logger::info("Replacing installed lexicon " + lex.id);
                    writer.remove(lex.id);
                }
            }
            writer.insert(doc);
        }
        if (!ili_entries.empty()) {
            stats.ilis = writer.upsert_ilis([&](const std::function<void(IliEntry&&)>& emit) {
                for (auto& entry : ili_entries) emit(std::move(entry));
            });
        }
    });
    stats.write_ms = write_timer.elapsed_ms();

    for (const auto& [doc, path] : documents) {
        for (const auto& lex : doc.lexicons) {
            stats.lexicons.push_back(lex.id);
            retain_source(lex.id, path);
        }
        stats.words += doc.words.size();
        stats.senses += doc.senses.size();
        stats.synsets += doc.synsets.size();
    }

    Logger::success("Added " + std::to_string(stats.lexicons.size()) + " lexicon(s), " +
                    std::to_string(stats.words) + " words, " + std::to_string(stats.synsets) +
                    " synsets" + (stats.ilis ? ", " + std::to_string(stats.ilis) + " ILI entries" : "") +
                    " in " + total.pretty());
    return stats;
}

IngestionStats Ingestor::add_project(std::string_view spec, const AddOptions& options,
                                     const DownloadOptions& download_options) {
    auto archive = download(spec, download_options);
    return add(archive, options);
}

void Ingestor::remove(const std::string& lexicon_id) {
    Timer timer;
    session_.store().write([&](SqliteConnection& db) {
        LexiconWriter(db).remove(lexicon_id);
    });

    std::error_code ec;
    std::filesystem::remove_all(session_.sources_dir() / lexicon_id, ec);
    if (ec) {
        Logger::warn("Could not delete retained source for " + lexicon_id + ": " + ec.message());
    }
    Logger::success("Removed " + lexicon_id + " in " + timer.pretty());
}

} // namespace Lexicore
