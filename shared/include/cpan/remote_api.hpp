/**
 * cpan - Remote storage service boundary: object references, token grants and
 * the black-box operations every backend exposes.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpan/error_codes.hpp"

namespace cpan
{

    // Identifier of the remote root directory.
    inline constexpr std::string_view kRootObjectId = "0";

    enum class ObjectKind : std::uint8_t
    {
        File,
        Directory
    };

    std::string_view to_string(ObjectKind kind) noexcept;
    std::optional<ObjectKind> object_kind_from_string(std::string_view value) noexcept;

    struct RemoteObjectRef
    {
        std::string id;
        ObjectKind kind{ObjectKind::File};
        std::string name;
        std::optional<std::string> path{};
        std::uint64_t size{};

        bool is_directory() const noexcept { return kind == ObjectKind::Directory; }
    };

    RemoteObjectRef root_object();

    struct OAuthClient
    {
        std::string client_id;
        std::optional<std::string> client_secret{};
        std::string redirect_uri;
    };

    struct TokenGrant
    {
        std::string access_token;
        std::optional<std::string> refresh_token{};
        std::int64_t expires_in{};
    };

    /**
     * Operations offered by a storage backend. Implementations signal failures by
     * throwing cpan::Error with the matching ErrorCode; transport trouble must be
     * reported as ErrorCode::Transient and rejected credentials as
     * ErrorCode::AuthExpired. Data operations may be called from several threads.
     */
    class RemoteApi
    {
    public:
        virtual ~RemoteApi() = default;

        virtual std::string authorize(const OAuthClient &client, const std::string &code_challenge) = 0;

        virtual TokenGrant exchange_token(const OAuthClient &client, const std::string &auth_code,
                                          const std::string &code_verifier) = 0;

        virtual TokenGrant refresh_token(const OAuthClient &client, const std::string &refresh_token) = 0;

        virtual std::vector<RemoteObjectRef> list_directory(const std::string &access_token,
                                                            const std::string &object_id) = 0;

        virtual RemoteObjectRef get_object(const std::string &access_token, const std::string &object_id) = 0;

        virtual RemoteObjectRef upload_primitive(const std::string &access_token,
                                                 const std::filesystem::path &local_path,
                                                 const std::string &target_dir_id) = 0;

        virtual void download_primitive(const std::string &access_token, const std::string &object_id,
                                        const std::filesystem::path &local_path) = 0;

        virtual RemoteObjectRef create_directory(const std::string &access_token, const std::string &parent_id,
                                                 const std::string &name) = 0;

        // Removes a file or a folder with everything below it. The root cannot be deleted.
        virtual void delete_object(const std::string &access_token, const std::string &object_id) = 0;

        // Moves an object into another folder under its current name, keeping its id.
        virtual RemoteObjectRef move_object(const std::string &access_token, const std::string &object_id,
                                            const std::string &target_dir_id) = 0;

        // Renames an object in place, keeping its id.
        virtual RemoteObjectRef rename_object(const std::string &access_token, const std::string &object_id,
                                              const std::string &new_name) = 0;
    };

} // namespace cpan
