#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "cpan/client/config.hpp"
#include "cpan/client/credential_store.hpp"
#include "cpan/client/logger.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::client
{

    /**
     * Owns the OAuth credential and hands out access tokens. Refreshes are
     * serialized: callers arriving while a refresh is in flight wait for it and
     * reuse its token instead of issuing another refresh.
     */
    class TokenAuthority
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        static constexpr std::chrono::seconds kDefaultSafetyMargin{60};

        TokenAuthority(RemoteApi &api, CredentialStore &store, Logger logger,
                       std::chrono::seconds safety_margin = kDefaultSafetyMargin, Clock clock = {});

        // Adopts the persisted credential for this client or runs the authorization flow.
        Credential bootstrap(const OAuthClientConfig &config);

        // Throws Error(AuthExpired) when the refresh token is rejected and
        // Error(Transient) when the refresh could not reach the service.
        std::string get_valid_token();

        bool authorized() const;

        std::optional<Credential> credential() const;

    private:
        bool fresh_locked() const;
        void refresh_locked();
        void persist_locked();
        static OAuthClient client_of(const Credential &credential);

        RemoteApi &api_;
        CredentialStore &store_;
        Logger logger_;
        std::chrono::seconds safety_margin_;
        // Margin applied to the current token; shrinks when the service grants tokens shorter than safety_margin_.
        std::chrono::seconds margin_;
        Clock clock_;

        mutable std::mutex mutex_;
        std::optional<Credential> credential_;
    };

} // namespace cpan::client
