#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "cpan/remote_api.hpp"

namespace cpan::drive
{

    struct GrantPolicy
    {
        std::chrono::seconds code_ttl{600};
        std::chrono::seconds access_ttl{7200};
        std::chrono::seconds refresh_ttl{std::chrono::hours(24 * 30)};
    };

    /**
     * Authorization codes and issued tokens of the drive. Only BLAKE2b digests
     * of codes and tokens are kept, in `grants.json` under the metadata dir.
     */
    class GrantRegistry
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        GrantRegistry(std::filesystem::path metadata_dir, GrantPolicy policy = {}, Clock clock = {});

        // One-time code bound to the client, its redirect URI and a PKCE S256 challenge.
        std::string issue_code(const OAuthClient &client, const std::string &code_challenge);

        // Throws Error(AuthExpired) for an unknown, used or expired code or a wrong verifier.
        TokenGrant redeem_code(const OAuthClient &client, const std::string &code, const std::string &code_verifier);

        // Issues a new token pair and retires the refresh token. The previous access token lives until it expires.
        // Throws Error(AuthExpired) when the refresh token is not valid.
        TokenGrant rotate(const OAuthClient &client, const std::string &refresh_token);

        // Throws Error(AuthExpired) unless the access token is known and unexpired.
        void validate_access(const std::string &access_token) const;

    private:
        struct PendingCode
        {
            std::string client_id;
            std::string redirect_uri;
            std::string challenge;
            std::chrono::system_clock::time_point expires_at{};
        };

        struct TokenRecord
        {
            std::string client_id;
            std::chrono::system_clock::time_point expires_at{};
        };

        TokenGrant issue_locked(const std::string &client_id);
        void prune_locked(std::chrono::system_clock::time_point now) const;
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path grants_path_;
        GrantPolicy policy_;
        Clock clock_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, PendingCode> codes_;
        mutable std::unordered_map<std::string, TokenRecord> access_tokens_;
        mutable std::unordered_map<std::string, TokenRecord> refresh_tokens_;
    };

} // namespace cpan::drive
