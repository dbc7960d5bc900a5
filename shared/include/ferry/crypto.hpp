/**
 * Ferry - Content digests and random tokens built on libsodium.
 *
 * Digests are SHA-256 rendered as 64 lowercase hex characters.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace ferry::crypto
{

    void ensure_sodium_init();

    std::string digest(std::span<const std::byte> data);

    // Case-insensitive comparison of digest(data) against expected_hex.
    // Callers decide what an absent digest means; this function always verifies.
    bool verify(std::span<const std::byte> data, std::string_view expected_hex);

    std::string digest_stream(std::istream &input);

    std::string digest_file(const std::filesystem::path &path);

    // Hex rendering of byte_count bytes from the libsodium CSPRNG.
    std::string random_token(std::size_t byte_count);

} // namespace ferry::crypto
