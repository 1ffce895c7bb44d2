/**
 * cpan - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace cpan::crypto
{

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

    std::string hash_file(const std::filesystem::path &path);

    // Hex encoding of `bytes` random bytes.
    std::string random_token(std::size_t bytes);

    // Decimal string of `count` digits without a leading zero.
    std::string random_digits(std::size_t count);

    // PKCE (RFC 7636) S256 helpers.
    std::string make_code_verifier();

    std::string code_challenge(std::string_view code_verifier);

} // namespace cpan::crypto
