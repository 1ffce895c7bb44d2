#include "cpan/client/token_authority.hpp"

#include <utility>

#include "cpan/crypto.hpp"
#include "cpan/error_codes.hpp"

namespace cpan::client
{

    TokenAuthority::TokenAuthority(RemoteApi &api, CredentialStore &store, Logger logger,
                                   std::chrono::seconds safety_margin, Clock clock)
        : api_(api),
          store_(store),
          logger_(std::move(logger)),
          safety_margin_(safety_margin),
          margin_(safety_margin),
          clock_(clock ? std::move(clock) : Clock([]
                                                  { return std::chrono::system_clock::now(); })) {}

    Credential TokenAuthority::bootstrap(const OAuthClientConfig &config)
    {
        std::lock_guard lock(mutex_);

        if (auto stored = store_.load(); stored && stored->client_id == config.client_id)
        {
            credential_ = std::move(*stored);
            margin_ = safety_margin_;
            logger_.log("auth", "loaded credential for client ", config.client_id, " from ", store_.path().string());
            return *credential_;
        }

        OAuthClient client{
            .client_id = config.client_id,
            .client_secret = config.mode() == OAuthMode::Direct ? config.client_secret : std::optional<std::string>{},
            .redirect_uri = config.redirect_uri,
        };
        if (config.backend_oauth_url)
        {
            logger_.log("auth", "authorizing through backend ", *config.backend_oauth_url);
        }

        const auto verifier = crypto::make_code_verifier();
        const auto auth_code = api_.authorize(client, crypto::code_challenge(verifier));
        const auto grant = api_.exchange_token(client, auth_code, verifier);
        if (grant.access_token.empty())
        {
            throw Error(ErrorCode::AuthExpired, "Authorization did not return an access token");
        }

        credential_ = Credential{
            .client_id = client.client_id,
            .client_secret = client.client_secret,
            .redirect_uri = client.redirect_uri,
            .access_token = grant.access_token,
            .refresh_token = grant.refresh_token.value_or(""),
            .expiry = clock_() + std::chrono::seconds(grant.expires_in),
        };
        margin_ = safety_margin_;
        persist_locked();
        logger_.log("auth", "authorized client ", client.client_id);
        return *credential_;
    }

    std::string TokenAuthority::get_valid_token()
    {
        std::lock_guard lock(mutex_);
        if (!credential_)
        {
            throw Error(ErrorCode::AuthExpired, "Not authorized, reauthorization required");
        }
        if (!fresh_locked())
        {
            refresh_locked();
        }
        return credential_->access_token;
    }

    bool TokenAuthority::authorized() const
    {
        std::lock_guard lock(mutex_);
        return credential_.has_value();
    }

    std::optional<Credential> TokenAuthority::credential() const
    {
        std::lock_guard lock(mutex_);
        return credential_;
    }

    bool TokenAuthority::fresh_locked() const
    {
        return clock_() + margin_ < credential_->expiry;
    }

    void TokenAuthority::refresh_locked()
    {
        if (credential_->refresh_token.empty())
        {
            throw Error(ErrorCode::AuthExpired, "No refresh token stored, reauthorization required");
        }

        logger_.log("auth", "access token expires soon, refreshing");
        TokenGrant grant;
        try
        {
            grant = api_.refresh_token(client_of(*credential_), credential_->refresh_token);
        }
        catch (const Error &error)
        {
            if (error.code() == ErrorCode::Transient)
            {
                logger_.log("warn", "token refresh unavailable: ", error.what());
                throw;
            }
            logger_.log("error", "token refresh rejected: ", error.what());
            throw Error(ErrorCode::AuthExpired, std::string("Reauthorization required: ") + error.what());
        }

        if (grant.access_token.empty())
        {
            throw Error(ErrorCode::AuthExpired, "Refresh did not return an access token");
        }
        credential_->access_token = grant.access_token;
        if (grant.refresh_token && !grant.refresh_token->empty())
        {
            credential_->refresh_token = *grant.refresh_token;
        }
        const auto lifetime = std::chrono::seconds(grant.expires_in);
        credential_->expiry = clock_() + lifetime;
        margin_ = safety_margin_;
        if (lifetime <= safety_margin_)
        {
            // Keep the refreshed token usable for half its lifetime instead of refreshing on every call.
            margin_ = lifetime / 2;
            logger_.log("warn", "refreshed token lives ", grant.expires_in, "s, shorter than the ",
                        safety_margin_.count(), "s safety margin");
        }
        persist_locked();
        logger_.log("auth", "access token refreshed, valid for ", grant.expires_in, "s");
    }

    void TokenAuthority::persist_locked()
    {
        try
        {
            store_.save(*credential_);
        }
        catch (const std::exception &ex)
        {
            logger_.log("error", "failed to persist credential: ", ex.what());
        }
    }

    OAuthClient TokenAuthority::client_of(const Credential &credential)
    {
        return OAuthClient{
            .client_id = credential.client_id,
            .client_secret = credential.client_secret,
            .redirect_uri = credential.redirect_uri,
        };
    }

} // namespace cpan::client
