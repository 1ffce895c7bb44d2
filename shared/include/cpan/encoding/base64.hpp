#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace cpan::encoding
{

    // RFC 4648 section 5 alphabet, no padding (the form PKCE uses).
    std::string encode_base64url(std::span<const std::byte> data);

} // namespace cpan::encoding
