#pragma once

#include <filesystem>
#include <string_view>

namespace cpan
{

    /**
     * Replaces `path` with `content` through a sibling `.tmp` file and a rename.
     * The temporary file is restricted to its owner before anything is written
     * to it. Throws Error(IoError) when the data cannot be written and
     * std::filesystem::filesystem_error when the file cannot be restricted or renamed.
     */
    void write_private_file(const std::filesystem::path &path, std::string_view content);

} // namespace cpan
