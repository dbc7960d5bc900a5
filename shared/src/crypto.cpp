#include "ferry/crypto.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace ferry::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string digest(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> out{};
        if (crypto_hash_sha256(out.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(out);
    }

    bool verify(std::span<const std::byte> data, std::string_view expected_hex)
    {
        const auto actual = digest(data);
        if (actual.size() != expected_hex.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < actual.size(); ++i)
        {
            const auto expected = static_cast<char>(std::tolower(static_cast<unsigned char>(expected_hex[i])));
            if (actual[i] != expected)
            {
                return false;
            }
        }
        return true;
    }

    std::string digest_stream(std::istream &input)
    {
        ensure_initialized_once();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }

        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                if (crypto_hash_sha256_update(&state, buffer.data(), read_count) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_update failed");
                }
            }
        }

        std::array<unsigned char, crypto_hash_sha256_BYTES> out{};
        if (crypto_hash_sha256_final(&state, out.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(out);
    }

    std::string digest_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return digest_stream(file);
    }

    std::string random_token(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace ferry::crypto
