#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cpan::client
{

    struct Credential
    {
        std::string client_id;
        std::optional<std::string> client_secret;
        std::string redirect_uri;
        std::string access_token;
        std::string refresh_token;
        std::chrono::system_clock::time_point expiry{};
    };

    void to_json(nlohmann::json &json, const Credential &credential);
    void from_json(const nlohmann::json &json, Credential &credential);

    class CredentialStore
    {
    public:
        explicit CredentialStore(std::filesystem::path path);

        static std::filesystem::path default_path();

        const std::filesystem::path &path() const noexcept { return path_; }

        // Nothing persisted, or an unreadable file, yields std::nullopt.
        std::optional<Credential> load() const;

        // Written with owner-only permissions. Throws cpan::Error or std::filesystem::filesystem_error on failure.
        void save(const Credential &credential) const;

    private:
        std::filesystem::path path_;
    };

} // namespace cpan::client
