#include "cpan/private_file.hpp"

#include <fstream>
#include <system_error>

#include "cpan/error_codes.hpp"

namespace cpan
{

    void write_private_file(const std::filesystem::path &path, std::string_view content)
    {
        auto temp_path = path;
        temp_path += ".tmp";

        // A leftover temporary may carry wider permissions; start from a new file.
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        {
            std::ofstream create(temp_path, std::ios::binary | std::ios::trunc);
            if (!create.is_open())
            {
                throw Error(ErrorCode::IoError, "Cannot create " + temp_path.string());
            }
        }
        std::filesystem::permissions(temp_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out)
            {
                throw Error(ErrorCode::IoError, "Failed to write " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
    }

} // namespace cpan
