/**
 * fileq - Content digests built on libsodium, used for verify-after-copy.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace fileq::crypto
{

    inline constexpr std::size_t kDefaultDigestChunk = 64 * 1024;

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    // Reads the stream to its end in chunk_size pieces.
    std::string hash_stream(std::istream &input, std::size_t chunk_size = kDefaultDigestChunk);

    std::string hash_file(const std::filesystem::path &path);

} // namespace fileq::crypto
