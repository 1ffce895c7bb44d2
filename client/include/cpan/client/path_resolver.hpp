#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "cpan/client/logger.hpp"
#include "cpan/client/token_authority.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::client
{

    enum class ReferenceForm : std::uint8_t
    {
        ById,
        ByPath
    };

    struct ResolvedRemote
    {
        RemoteObjectRef object;
        ReferenceForm form{ReferenceForm::ByPath};
    };

    struct LocalEntry
    {
        ObjectKind kind{ObjectKind::File};
        std::filesystem::path path;
    };

    class PathResolver
    {
    public:
        PathResolver(RemoteApi &api, TokenAuthority &tokens, Logger logger);

        // Digit-only input is looked up by id, anything else is walked as an
        // absolute remote path with one listing per segment.
        ResolvedRemote resolve_remote(const std::string &path_or_id) const;

        static LocalEntry resolve_local(const std::filesystem::path &path);

        static bool is_object_id(std::string_view input) noexcept;

        static std::vector<std::string> split_remote_path(std::string_view path);

    private:
        RemoteApi &api_;
        TokenAuthority &tokens_;
        Logger logger_;
    };

} // namespace cpan::client
