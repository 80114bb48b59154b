#include "fileq/crypto.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace fileq::crypto
{

    namespace
    {

        using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

        std::string to_hex(const Digest &digest)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result(digest.size() * 2, '0');
            for (std::size_t i = 0; i < digest.size(); ++i)
            {
                result[2 * i] = kHexDigits[(digest[i] >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[digest[i] & 0x0F];
            }
            return result;
        }

        void check(int status, const char *what)
        {
            if (status != 0)
            {
                throw std::runtime_error(std::string(what) + " failed");
            }
        }

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []()
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_sodium_init();
        Digest digest{};
        check(crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char *>(data.data()),
                                 data.size(), nullptr, 0),
              "crypto_generichash");
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input, std::size_t chunk_size)
    {
        ensure_sodium_init();
        crypto_generichash_state state;
        check(crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES), "crypto_generichash_init");

        std::vector<unsigned char> buffer(std::max<std::size_t>(chunk_size, 1));
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                check(crypto_generichash_update(&state, buffer.data(), read_count), "crypto_generichash_update");
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }

        Digest digest{};
        check(crypto_generichash_final(&state, digest.data(), digest.size()), "crypto_generichash_final");
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

} // namespace fileq::crypto
