#include "cpan/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

#include "cpan/encoding/base64.hpp"

namespace cpan::crypto
{

    namespace
    {

        constexpr std::size_t kVerifierEntropyBytes = 32;

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

        std::string hash_stream(std::istream &input)
        {
            ensure_initialized_once();
            crypto_generichash_state state;
            if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
            {
                throw std::runtime_error("crypto_generichash_init failed");
            }

            std::vector<unsigned char> buffer(64 * 1024);
            while (input)
            {
                input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(input.gcount());
                if (read_count > 0)
                {
                    if (crypto_generichash_update(&state, buffer.data(), read_count) != 0)
                    {
                        throw std::runtime_error("crypto_generichash_update failed");
                    }
                }
            }

            std::vector<unsigned char> digest(crypto_generichash_BYTES);
            if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
            {
                throw std::runtime_error("crypto_generichash_final failed");
            }
            return to_hex(digest);
        }

    } // namespace

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_text(std::string_view text)
    {
        return hash_bytes(std::as_bytes(std::span(text.data(), text.size())));
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

    std::string random_token(std::size_t bytes)
    {
        ensure_initialized_once();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

    std::string random_digits(std::size_t count)
    {
        ensure_initialized_once();
        std::string digits;
        digits.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const auto upper = i == 0 ? 9u : 10u;
            const auto offset = i == 0 ? 1u : 0u;
            digits.push_back(static_cast<char>('0' + offset + randombytes_uniform(upper)));
        }
        return digits;
    }

    std::string make_code_verifier()
    {
        ensure_initialized_once();
        std::array<unsigned char, kVerifierEntropyBytes> entropy{};
        randombytes_buf(entropy.data(), entropy.size());
        return encoding::encode_base64url(std::as_bytes(std::span(entropy)));
    }

    std::string code_challenge(std::string_view code_verifier)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(code_verifier.data()),
                               code_verifier.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return encoding::encode_base64url(std::as_bytes(std::span(digest)));
    }

} // namespace cpan::crypto
