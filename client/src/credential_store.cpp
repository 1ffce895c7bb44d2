#include "cpan/client/credential_store.hpp"

#include <cstdlib>
#include <fstream>

#include "cpan/private_file.hpp"

namespace cpan::client
{

    void to_json(nlohmann::json &json, const Credential &credential)
    {
        json = {
            {"client_id", credential.client_id},
            {"redirect_uri", credential.redirect_uri},
            {"access_token", credential.access_token},
            {"refresh_token", credential.refresh_token},
            {"expires_at", std::chrono::duration_cast<std::chrono::seconds>(credential.expiry.time_since_epoch()).count()},
        };
        if (credential.client_secret)
        {
            json["client_secret"] = *credential.client_secret;
        }
    }

    void from_json(const nlohmann::json &json, Credential &credential)
    {
        credential.client_id = json.at("client_id").get<std::string>();
        credential.redirect_uri = json.value("redirect_uri", std::string{});
        credential.access_token = json.at("access_token").get<std::string>();
        credential.refresh_token = json.value("refresh_token", std::string{});
        if (json.contains("client_secret"))
        {
            credential.client_secret = json.at("client_secret").get<std::string>();
        }
        else
        {
            credential.client_secret.reset();
        }
        const auto seconds = json.value("expires_at", 0LL);
        credential.expiry = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
    }

    CredentialStore::CredentialStore(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path CredentialStore::default_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "cpan" / "credential.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".cpan" / "credential.json";
        }
        return std::filesystem::path(".cpan") / "credential.json";
    }

    std::optional<Credential> CredentialStore::load() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            return std::nullopt;
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        try
        {
            return json.get<Credential>();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
    }

    void CredentialStore::save(const Credential &credential) const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }

        write_private_file(path_, nlohmann::json(credential).dump(2));
    }

} // namespace cpan::client
