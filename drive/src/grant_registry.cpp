#include "cpan/drive/grant_registry.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cpan/crypto.hpp"
#include "cpan/error_codes.hpp"
#include "cpan/private_file.hpp"

namespace cpan::drive
{

    namespace
    {
        constexpr auto kGrantsFile = "grants.json";
        constexpr std::size_t kTokenBytes = 32;
        constexpr std::size_t kCodeBytes = 16;

        std::int64_t to_unix(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_unix(std::int64_t seconds)
        {
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
        }

    } // namespace

    GrantRegistry::GrantRegistry(std::filesystem::path metadata_dir, GrantPolicy policy, Clock clock)
        : grants_path_(metadata_dir / kGrantsFile),
          policy_(policy),
          clock_(clock ? std::move(clock) : Clock([]
                                                  { return std::chrono::system_clock::now(); }))
    {
        std::filesystem::create_directories(metadata_dir);
    }

    std::string GrantRegistry::issue_code(const OAuthClient &client, const std::string &code_challenge)
    {
        if (client.client_id.empty() || client.redirect_uri.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Client id and redirect URI are required");
        }
        if (code_challenge.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "A PKCE code challenge is required");
        }

        std::lock_guard lock(mutex_);
        load_locked();
        const auto now = clock_();
        prune_locked(now);

        auto code = crypto::random_token(kCodeBytes);
        codes_[crypto::hash_text(code)] = PendingCode{
            .client_id = client.client_id,
            .redirect_uri = client.redirect_uri,
            .challenge = code_challenge,
            .expires_at = now + policy_.code_ttl,
        };
        persist_locked();
        spdlog::info("Issued authorization code for client {}", client.client_id);
        return code;
    }

    TokenGrant GrantRegistry::redeem_code(const OAuthClient &client, const std::string &code,
                                          const std::string &code_verifier)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        prune_locked(clock_());

        const auto it = codes_.find(crypto::hash_text(code));
        if (it == codes_.end())
        {
            throw Error(ErrorCode::AuthExpired, "Authorization code is invalid or expired");
        }
        // Codes are single use, even when the exchange is rejected.
        const auto pending = it->second;
        codes_.erase(it);
        if (pending.client_id != client.client_id || pending.redirect_uri != client.redirect_uri)
        {
            persist_locked();
            throw Error(ErrorCode::AuthExpired, "Authorization code was issued to another client");
        }
        if (crypto::code_challenge(code_verifier) != pending.challenge)
        {
            persist_locked();
            throw Error(ErrorCode::AuthExpired, "Code verifier does not match the challenge");
        }

        auto grant = issue_locked(client.client_id);
        persist_locked();
        spdlog::info("Issued tokens for client {}", client.client_id);
        return grant;
    }

    TokenGrant GrantRegistry::rotate(const OAuthClient &client, const std::string &refresh_token)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        prune_locked(clock_());

        const auto it = refresh_tokens_.find(crypto::hash_text(refresh_token));
        if (it == refresh_tokens_.end() || it->second.client_id != client.client_id)
        {
            throw Error(ErrorCode::AuthExpired, "Refresh token is invalid or expired");
        }
        // The superseded access token stays valid until it expires.
        refresh_tokens_.erase(it);

        auto grant = issue_locked(client.client_id);
        persist_locked();
        spdlog::info("Rotated tokens for client {}", client.client_id);
        return grant;
    }

    void GrantRegistry::validate_access(const std::string &access_token) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = access_tokens_.find(crypto::hash_text(access_token));
        if (it == access_tokens_.end() || it->second.expires_at <= clock_())
        {
            throw Error(ErrorCode::AuthExpired, "Access token is invalid or expired");
        }
    }

    TokenGrant GrantRegistry::issue_locked(const std::string &client_id)
    {
        const auto now = clock_();
        TokenGrant grant{
            .access_token = crypto::random_token(kTokenBytes),
            .refresh_token = crypto::random_token(kTokenBytes),
            .expires_in = policy_.access_ttl.count(),
        };
        access_tokens_[crypto::hash_text(grant.access_token)] = TokenRecord{
            .client_id = client_id,
            .expires_at = now + policy_.access_ttl,
        };
        refresh_tokens_[crypto::hash_text(*grant.refresh_token)] = TokenRecord{
            .client_id = client_id,
            .expires_at = now + policy_.refresh_ttl,
        };
        return grant;
    }

    void GrantRegistry::prune_locked(std::chrono::system_clock::time_point now) const
    {
        std::erase_if(codes_, [now](const auto &item)
                      { return item.second.expires_at <= now; });
        std::erase_if(access_tokens_, [now](const auto &item)
                      { return item.second.expires_at <= now; });
        std::erase_if(refresh_tokens_, [now](const auto &item)
                      { return item.second.expires_at <= now; });
    }

    void GrantRegistry::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        codes_.clear();
        access_tokens_.clear();
        refresh_tokens_.clear();
        if (std::filesystem::exists(grants_path_))
        {
            std::ifstream in(grants_path_);
            const auto json = nlohmann::json::parse(in, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                spdlog::warn("Ignoring unreadable grants file {}", grants_path_.string());
            }
            else
            {
                const auto codes = json.value("codes", nlohmann::json::object());
                for (const auto &[digest, value] : codes.items())
                {
                    codes_[digest] = PendingCode{
                        .client_id = value.value("client_id", std::string{}),
                        .redirect_uri = value.value("redirect_uri", std::string{}),
                        .challenge = value.value("challenge", std::string{}),
                        .expires_at = from_unix(value.value("expires_at", std::int64_t{0})),
                    };
                }
                const auto load_tokens = [&json](const char *key, auto &target)
                {
                    const auto tokens = json.value(key, nlohmann::json::object());
                    for (const auto &[digest, value] : tokens.items())
                    {
                        target[digest] = TokenRecord{
                            .client_id = value.value("client_id", std::string{}),
                            .expires_at = from_unix(value.value("expires_at", std::int64_t{0})),
                        };
                    }
                };
                load_tokens("access_tokens", access_tokens_);
                load_tokens("refresh_tokens", refresh_tokens_);
            }
        }
        loaded_ = true;
    }

    void GrantRegistry::persist_locked() const
    {
        nlohmann::json codes = nlohmann::json::object();
        for (const auto &[digest, pending] : codes_)
        {
            codes[digest] = {
                {"client_id", pending.client_id},
                {"redirect_uri", pending.redirect_uri},
                {"challenge", pending.challenge},
                {"expires_at", to_unix(pending.expires_at)},
            };
        }
        const auto dump_tokens = [](const std::unordered_map<std::string, TokenRecord> &tokens)
        {
            nlohmann::json json = nlohmann::json::object();
            for (const auto &[digest, record] : tokens)
            {
                json[digest] = {
                    {"client_id", record.client_id},
                    {"expires_at", to_unix(record.expires_at)},
                };
            }
            return json;
        };
        const nlohmann::json json = {
            {"codes", codes},
            {"access_tokens", dump_tokens(access_tokens_)},
            {"refresh_tokens", dump_tokens(refresh_tokens_)},
        };

        write_private_file(grants_path_, json.dump(2));
    }

} // namespace cpan::drive
