#include "cpan/client/path_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "cpan/error_codes.hpp"

namespace cpan::client
{

    PathResolver::PathResolver(RemoteApi &api, TokenAuthority &tokens, Logger logger)
        : api_(api), tokens_(tokens), logger_(std::move(logger)) {}

    bool PathResolver::is_object_id(std::string_view input) noexcept
    {
        return !input.empty() && std::all_of(input.begin(), input.end(), [](char ch)
                                             { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
    }

    std::vector<std::string> PathResolver::split_remote_path(std::string_view path)
    {
        std::vector<std::string> segments;
        std::size_t position = 0;
        while (position <= path.size())
        {
            const auto next = path.find('/', position);
            const auto end = next == std::string_view::npos ? path.size() : next;
            if (end > position)
            {
                segments.emplace_back(path.substr(position, end - position));
            }
            if (next == std::string_view::npos)
            {
                break;
            }
            position = next + 1;
        }
        return segments;
    }

    ResolvedRemote PathResolver::resolve_remote(const std::string &path_or_id) const
    {
        if (path_or_id.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Remote path or id must not be empty");
        }

        if (is_object_id(path_or_id))
        {
            auto object = api_.get_object(tokens_.get_valid_token(), path_or_id);
            logger_.log("resolve", "id ", path_or_id, " -> ", to_string(object.kind), ' ', object.name);
            return ResolvedRemote{.object = std::move(object), .form = ReferenceForm::ById};
        }

        const auto segments = split_remote_path(path_or_id);
        auto current = root_object();
        std::string walked;
        for (const auto &segment : segments)
        {
            if (!current.is_directory())
            {
                throw Error(ErrorCode::NotFound, "Not a directory: " + walked);
            }
            const auto children = api_.list_directory(tokens_.get_valid_token(), current.id);
            const auto match = std::find_if(children.begin(), children.end(), [&](const RemoteObjectRef &child)
                                            { return child.name == segment; });
            walked += '/';
            walked += segment;
            if (match == children.end())
            {
                throw Error(ErrorCode::NotFound, "Remote path does not exist: " + walked);
            }
            current = *match;
            current.path = walked;
        }

        logger_.log("resolve", "path ", path_or_id, " -> ", current.id, " (", to_string(current.kind), ")");
        return ResolvedRemote{.object = std::move(current), .form = ReferenceForm::ByPath};
    }

    LocalEntry PathResolver::resolve_local(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            throw Error(ErrorCode::InvalidArgument, "Invalid local path: " + path.string());
        }
        absolute = absolute.lexically_normal();
        if (!absolute.has_filename() && absolute != absolute.root_path())
        {
            absolute = absolute.parent_path();
        }

        const auto status = std::filesystem::status(absolute, ec);
        if (ec || !std::filesystem::exists(status))
        {
            if (ec == std::errc::permission_denied)
            {
                throw Error(ErrorCode::PermissionDenied, "Permission denied: " + absolute.string());
            }
            throw Error(ErrorCode::NotFound, "Local path does not exist: " + absolute.string());
        }
        if (std::filesystem::is_directory(status))
        {
            return LocalEntry{.kind = ObjectKind::Directory, .path = absolute};
        }
        if (std::filesystem::is_regular_file(status))
        {
            return LocalEntry{.kind = ObjectKind::File, .path = absolute};
        }
        throw Error(ErrorCode::InvalidArgument, "Unsupported local path type: " + absolute.string());
    }

} // namespace cpan::client
