/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Lexicore {

namespace {

constexpr std::size_t FILE_CHUNK = 64 * 1024;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, std::size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error("Cannot open file for hashing: " + path.string());
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    std::vector<char> buffer(FILE_CHUNK);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            blake3_hasher_update(&hasher, buffer.data(), static_cast<std::size_t>(got));
        }
    }
    if (in.bad()) {
        throw Error("Read error while hashing: " + path.string());
    }

    Hash result;
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);
    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(std::string_view hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw Error("Invalid BLAKE3 digest length: " + std::to_string(hex.size()) +
                    ", expected " + std::to_string(HASH_SIZE * 2));
    }

    Hash result{};
    for (std::size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw Error("Invalid hex character in BLAKE3 digest: " + std::string(hex));
        }
        result[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // namespace Lexicore
