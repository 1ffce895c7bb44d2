#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace cpan::client
{

    enum class OAuthMode : std::uint8_t
    {
        Direct,
        ThirdParty
    };

    struct OAuthClientConfig
    {
        std::string client_id;
        std::optional<std::string> client_key;
        std::optional<std::string> client_secret;
        std::string redirect_uri;
        std::optional<std::string> backend_oauth_url;

        OAuthMode mode() const noexcept
        {
            return backend_oauth_url ? OAuthMode::ThirdParty : OAuthMode::Direct;
        }
    };

    enum class CommandKind : std::uint8_t
    {
        None,
        Upload,
        Download,
        Info,
        Delete,
        Move,
        Rename
    };

    struct UploadCommand
    {
        std::filesystem::path local_path;
        std::string target{"0"};
        bool create_folder{true};
    };

    struct DownloadCommand
    {
        std::string target;
        std::filesystem::path save_path{"."};
        std::optional<std::string> filename;
        bool overwrite{false};
        bool create_folder{true};
    };

    // info, delete, move and rename: `target` is an id or path; `argument` is the
    // destination folder for move and the new name for rename.
    struct ManageCommand
    {
        std::string target;
        std::string argument;
    };

    struct ClientConfig
    {
        CommandKind command{CommandKind::None};
        UploadCommand upload;
        DownloadCommand download;
        ManageCommand manage;

        bool show_help{false};
        bool show_version{false};
        bool verbose{false};
        std::optional<std::filesystem::path> env_file;
        std::optional<std::filesystem::path> log_path;
        std::size_t concurrency{4};
        std::uint32_t max_attempts{3};

        // Filled from the environment by load_environment().
        OAuthClientConfig oauth;
        std::filesystem::path drive_root;
        std::filesystem::path credential_path;
    };

    using EnvMap = std::map<std::string, std::string>;

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage_text();

    EnvMap load_env_file(const std::filesystem::path &path);

    // Nearest `.env` in `start` or one of its parents.
    std::optional<std::filesystem::path> find_env_file(const std::filesystem::path &start);

    // Throws std::runtime_error naming the first missing key.
    OAuthClientConfig oauth_from_env(const EnvMap &env);

    // Reads the .env file and process environment into `config`.
    void load_environment(ClientConfig &config);

} // namespace cpan::client
