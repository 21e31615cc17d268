/**
 * @file archive.cpp
 * @brief zlib / liblzma stream decoding and a ustar/GNU/pax tar reader
 */

#include <ingestion/archive.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <charconv>
#include <cstring>
#include <string_view>
#include <lzma.h>
#include <zlib.h>

namespace Lexicore {

namespace {

constexpr std::size_t IO_CHUNK = 64 * 1024;
constexpr std::size_t TAR_BLOCK = 512;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ============================================================================
// Decompression
// ============================================================================

struct DecompressingReader::Codec {
    z_stream zs{};
    lzma_stream xz = LZMA_STREAM_INIT;
    bool z_open = false;
    bool xz_open = false;

    ~Codec() {
        if (z_open) inflateEnd(&zs);
        if (xz_open) lzma_end(&xz);
    }
};

Compression detect_compression(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    unsigned char magic[6] = {0};
    in.read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto got = in.gcount();

    if (got >= 2 && magic[0] == 0x1f && magic[1] == 0x8b) {
        return Compression::Gzip;
    }
    static const unsigned char XZ_MAGIC[6] = {0xFD, '7', 'z', 'X', 'Z', 0x00};
    if (got == 6 && std::memcmp(magic, XZ_MAGIC, 6) == 0) {
        return Compression::Xz;
    }
    return Compression::None;
}

DecompressingReader::DecompressingReader(const std::filesystem::path& path)
    : path_(path), in_(path, std::ios::binary), compression_(detect_compression(path)),
      codec_(std::make_unique<Codec>()), input_(IO_CHUNK) {
    if (!in_) {
        throw ArchiveError("Cannot open archive: " + path.string());
    }

    if (compression_ == Compression::Gzip) {
        // 15 + 32: zlib or gzip header, auto-detected
        if (inflateInit2(&codec_->zs, 15 + 32) != Z_OK) {
            throw ArchiveError("inflateInit2 failed for " + path.string());
        }
        codec_->z_open = true;
    } else if (compression_ == Compression::Xz) {
        if (lzma_stream_decoder(&codec_->xz, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
            throw ArchiveError("lzma_stream_decoder failed for " + path.string());
        }
        codec_->xz_open = true;
    }
}

DecompressingReader::~DecompressingReader() = default;

std::size_t DecompressingReader::fill_input() {
    in_.read(reinterpret_cast<char*>(input_.data()), static_cast<std::streamsize>(input_.size()));
    auto got = static_cast<std::size_t>(in_.gcount());
    if (in_.bad()) {
        throw ArchiveError("Read error in " + path_.string());
    }
    if (got == 0) input_eof_ = true;
    return got;
}

std::size_t DecompressingReader::read(char* data, std::size_t size) {
    if (finished_ || size == 0) return 0;

    if (compression_ == Compression::None) {
        in_.read(data, static_cast<std::streamsize>(size));
        auto got = static_cast<std::size_t>(in_.gcount());
        if (in_.bad()) throw ArchiveError("Read error in " + path_.string());
        if (got == 0) finished_ = true;
        return got;
    }

    if (compression_ == Compression::Gzip) {
        z_stream& zs = codec_->zs;
        zs.next_out = reinterpret_cast<Bytef*>(data);
        zs.avail_out = static_cast<uInt>(size);

        while (zs.avail_out == size) {
            if (zs.avail_in == 0 && !input_eof_) {
                zs.avail_in = static_cast<uInt>(fill_input());
                zs.next_in = input_.data();
            }
            if (zs.avail_in == 0 && input_eof_) {
                finished_ = true;
                break;
            }
            int rc = inflate(&zs, Z_NO_FLUSH);
            if (rc == Z_STREAM_END) {
                // Another gzip member may follow
                if (zs.avail_in == 0 && !input_eof_) {
                    zs.avail_in = static_cast<uInt>(fill_input());
                    zs.next_in = input_.data();
                }
                if (zs.avail_in == 0) {
                    finished_ = true;
                    break;
                }
                inflateReset(&zs);
            } else if (rc == Z_BUF_ERROR && zs.avail_in == 0 && input_eof_) {
                throw ArchiveError("Truncated gzip data in " + path_.string());
            } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
                throw ArchiveError("Corrupt gzip data in " + path_.string() + ": " +
                                   (zs.msg ? zs.msg : "inflate error"));
            }
        }
        return size - zs.avail_out;
    }

    lzma_stream& xz = codec_->xz;
    xz.next_out = reinterpret_cast<uint8_t*>(data);
    xz.avail_out = size;

    while (xz.avail_out == size) {
        if (xz.avail_in == 0 && !input_eof_) {
            xz.avail_in = fill_input();
            xz.next_in = input_.data();
        }
        lzma_ret rc = lzma_code(&xz, input_eof_ ? LZMA_FINISH : LZMA_RUN);
        if (rc == LZMA_STREAM_END) {
            finished_ = true;
            break;
        }
        if (rc != LZMA_OK) {
            throw ArchiveError("Corrupt xz data in " + path_.string() + " (lzma code " +
                               std::to_string(static_cast<int>(rc)) + ")");
        }
        if (input_eof_ && xz.avail_in == 0 && xz.avail_out == size) {
            throw ArchiveError("Truncated xz data in " + path_.string());
        }
    }
    return size - xz.avail_out;
}

std::size_t DecompressingReader::read_full(char* data, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        std::size_t got = read(data + total, size - total);
        if (got == 0) break;
        total += got;
    }
    return total;
}

// ============================================================================
// Tar
// ============================================================================

namespace {

std::string field(const char* block, std::size_t offset, std::size_t len) {
    const char* start = block + offset;
    return std::string(start, strnlen(start, len));
}

std::uint64_t parse_octal(const char* p, std::size_t len) {
    // GNU base-256 for large sizes
    if (static_cast<unsigned char>(p[0]) & 0x80) {
        std::uint64_t v = static_cast<unsigned char>(p[0]) & 0x7f;
        for (std::size_t i = 1; i < len; ++i) {
            v = (v << 8) | static_cast<unsigned char>(p[i]);
        }
        return v;
    }
    std::uint64_t v = 0;
    std::size_t i = 0;
    while (i < len && (p[i] == ' ' || p[i] == '\0')) ++i;
    for (; i < len && p[i] >= '0' && p[i] <= '7'; ++i) {
        v = (v << 3) + static_cast<std::uint64_t>(p[i] - '0');
    }
    return v;
}

bool all_zero(const char* block) {
    return std::all_of(block, block + TAR_BLOCK, [](char c) { return c == 0; });
}

std::filesystem::path safe_entry_path(const std::string& name) {
    std::filesystem::path p(name);
    if (name.empty() || p.is_absolute() || name.front() == '/') {
        throw ArchiveError("Refusing absolute archive entry: " + name);
    }
    std::filesystem::path clean;
    for (const auto& part : p) {
        if (part == "..") {
            throw ArchiveError("Refusing archive entry outside the target directory: " + name);
        }
        if (part == "." || part.empty()) continue;
        clean /= part;
    }
    return clean;
}

/// Parses "LEN key=value\n" records; returns the path and size overrides.
void parse_pax(const std::string& data, std::string& path, std::uint64_t& size, bool& has_size) {
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t space = data.find(' ', pos);
        if (space == std::string::npos) {
            throw ArchiveError("Malformed pax header record: no length field");
        }
        std::size_t len = 0;
        const char* first = data.data() + pos;
        const char* last = data.data() + space;
        auto [ptr, ec] = std::from_chars(first, last, len);
        if (ec != std::errc() || ptr != last || len <= space - pos + 1 || len > data.size() - pos ||
            data[pos + len - 1] != '\n') {
            throw ArchiveError("Malformed pax header record at offset " + std::to_string(pos));
        }

        std::string_view record(data.data() + space + 1, pos + len - space - 2);
        auto eq = record.find('=');
        if (eq == std::string_view::npos) {
            throw ArchiveError("Malformed pax header record: no '=' in record");
        }
        std::string_view key = record.substr(0, eq);
        std::string_view value = record.substr(eq + 1);
        if (key == "path") {
            path = std::string(value);
        } else if (key == "size") {
            auto [vptr, vec] = std::from_chars(value.data(), value.data() + value.size(), size);
            if (value.empty() || vec != std::errc() || vptr != value.data() + value.size()) {
                throw ArchiveError("Malformed pax size: '" + std::string(value) + "'");
            }
            has_size = true;
        }
        pos += len;
    }
}

std::string read_entry_data(DecompressingReader& reader, std::uint64_t size) {
    std::string data(static_cast<std::size_t>(size), '\0');
    if (reader.read_full(data.data(), data.size()) != data.size()) {
        throw ArchiveError("Truncated tar entry");
    }
    std::size_t pad = static_cast<std::size_t>((TAR_BLOCK - size % TAR_BLOCK) % TAR_BLOCK);
    char skip[TAR_BLOCK];
    if (reader.read_full(skip, pad) != pad) {
        throw ArchiveError("Truncated tar padding");
    }
    return data;
}

void copy_entry(DecompressingReader& reader, std::uint64_t size, std::ostream* out) {
    std::vector<char> buffer(IO_CHUNK);
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        std::size_t got = reader.read_full(buffer.data(), want);
        if (got != want) {
            throw ArchiveError("Truncated tar entry");
        }
        if (out) out->write(buffer.data(), static_cast<std::streamsize>(got));
        remaining -= got;
    }
    std::size_t pad = static_cast<std::size_t>((TAR_BLOCK - size % TAR_BLOCK) % TAR_BLOCK);
    if (reader.read_full(buffer.data(), pad) != pad) {
        throw ArchiveError("Truncated tar padding");
    }
}

std::vector<std::filesystem::path> untar(DecompressingReader& reader, const char* first_block,
                                         const std::filesystem::path& dest_dir) {
    std::vector<std::filesystem::path> written;
    char block[TAR_BLOCK];
    std::memcpy(block, first_block, TAR_BLOCK);
    bool have_block = true;

    std::string next_name;
    std::uint64_t next_size = 0;
    bool next_has_size = false;

    while (true) {
        if (!have_block && reader.read_full(block, TAR_BLOCK) != TAR_BLOCK) {
            break;  // tolerate archives missing the end-of-archive blocks
        }
        have_block = false;

        if (all_zero(block)) break;
        if (!is_tar_header(block)) {
            throw ArchiveError("Corrupt tar header");
        }

        char type = block[156];
        std::uint64_t size = parse_octal(block + 124, 12);

        if (type == 'L') {
            next_name = read_entry_data(reader, size);
            next_name.resize(strnlen(next_name.c_str(), next_name.size()));
            continue;
        }
        if (type == 'x') {
            parse_pax(read_entry_data(reader, size), next_name, next_size, next_has_size);
            continue;
        }
        if (type == 'g') {
            read_entry_data(reader, size);
            continue;
        }

        std::string name = next_name;
        if (name.empty()) {
            name = field(block, 0, 100);
            std::string prefix = field(block, 345, 155);
            if (!prefix.empty() && std::memcmp(block + 257, "ustar", 5) == 0) {
                name = prefix + "/" + name;
            }
        }
        if (next_has_size) size = next_size;
        next_name.clear();
        next_has_size = false;

        auto rel = safe_entry_path(name);
        auto target = dest_dir / rel;

        if (type == '5') {
            std::filesystem::create_directories(target);
            copy_entry(reader, size, nullptr);
        } else if (type == '0' || type == '\0' || type == '7') {
            if (rel.empty()) {
                throw ArchiveError("Empty tar entry name");
            }
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw ArchiveError("Cannot write extracted file: " + target.string());
            }
            copy_entry(reader, size, &out);
            out.close();
            if (!out) {
                throw ArchiveError("Write failed for extracted file: " + target.string());
            }
            written.push_back(target);
        } else {
            Logger::debug("Skipping tar entry of type '" + std::string(1, type) + "': " + name);
            copy_entry(reader, size, nullptr);
        }
    }
    return written;
}

} // namespace

bool is_tar_header(const char* block) {
    std::uint64_t stored = parse_octal(block + 148, 8);
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < TAR_BLOCK; ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : static_cast<unsigned char>(block[i]);
    }
    return stored == sum && sum != 8 * ' ';
}

std::string archive_stem(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    for (const char* suffix : {".tgz", ".txz"}) {
        if (ends_with(name, suffix)) return name.substr(0, name.size() - 4);
    }
    if (ends_with(name, ".gz") || ends_with(name, ".xz")) {
        name.resize(name.size() - 3);
    }
    if (ends_with(name, ".tar")) {
        name.resize(name.size() - 4);
    }
    return name;
}

std::vector<std::filesystem::path>
extract_archive(const std::filesystem::path& archive, const std::filesystem::path& dest_dir) {
    DecompressingReader reader(archive);
    std::filesystem::create_directories(dest_dir);

    char first[TAR_BLOCK];
    std::size_t got = reader.read_full(first, TAR_BLOCK);

    if (got == TAR_BLOCK && is_tar_header(first)) {
        Logger::debug("Unpacking tar archive " + archive.string());
        return untar(reader, first, dest_dir);
    }

    if (reader.compression() == Compression::None) {
        throw ArchiveError("Not an archive: " + archive.string());
    }

    // Single compressed file
    std::string name = archive.filename().string();
    if (ends_with(name, ".gz") || ends_with(name, ".xz")) {
        name.resize(name.size() - 3);
    }
    auto target = dest_dir / name;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ArchiveError("Cannot write extracted file: " + target.string());
    }
    out.write(first, static_cast<std::streamsize>(got));
    std::vector<char> buffer(IO_CHUNK);
    while (std::size_t n = reader.read(buffer.data(), buffer.size())) {
        out.write(buffer.data(), static_cast<std::streamsize>(n));
    }
    out.close();
    if (!out) {
        throw ArchiveError("Write failed for extracted file: " + target.string());
    }
    return {target};
}

std::vector<std::filesystem::path>
find_payloads(const std::filesystem::path& dir, const std::vector<std::string>& extensions) {
    std::vector<std::filesystem::path> found;
    if (!std::filesystem::is_directory(dir)) return found;

    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        for (const auto& ext : extensions) {
            if (ends_with(name, ext)) {
                found.push_back(entry.path());
                break;
            }
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace Lexicore
