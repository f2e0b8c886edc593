#include "ksau/client/token_provider.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ksau/error_codes.hpp"
#include "ksau/remote_path.hpp"

namespace ksau::client
{

    namespace
    {

        std::string trim_trailing_slashes(std::string value)
        {
            while (!value.empty() && value.back() == '/')
            {
                value.pop_back();
            }
            return value;
        }

    } // namespace

    HttpTokenProvider::HttpTokenProvider(http::Transport &transport, std::string endpoint)
        : transport_(transport),
          endpoint_(trim_trailing_slashes(std::move(endpoint))) {}

    Credentials HttpTokenProvider::fetch(const std::string &remote, const CancellationToken &cancel)
    {
        http::Request request{
            .method = http::Method::Get,
            .url = endpoint_ + "/token?remote=" + url_encode(remote),
            .headers = {{"Accept", "application/json"}},
            .cancel = &cancel,
        };

        http::Response response;
        try
        {
            response = transport_.perform(request);
        }
        catch (const Error &ex)
        {
            if (ex.code() == ErrorCode::Aborted)
            {
                throw;
            }
            throw Error(ErrorCode::AuthError, "token request for remote '" + remote + "' failed: " + ex.what());
        }

        if (!response.ok())
        {
            throw Error(ErrorCode::AuthError, "token service returned HTTP " + std::to_string(response.status) +
                                                  " for remote '" + remote + "': " +
                                                  protocol::describe_error_body(response.body));
        }

        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw Error(ErrorCode::AuthError, "token service returned a malformed response for remote '" + remote + "'");
        }

        Credentials credentials;
        try
        {
            credentials.remote = json.get<protocol::RemoteCredentials>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::AuthError, "token response for remote '" + remote + "' is incomplete: " + ex.what());
        }
        if (credentials.remote.access_token.empty())
        {
            throw Error(ErrorCode::AuthError, "token service returned an empty access token for remote '" + remote + "'");
        }
        if (credentials.remote.expires_in > 0)
        {
            credentials.expires_at = std::chrono::system_clock::now() + std::chrono::seconds{credentials.remote.expires_in};
        }

        spdlog::debug("obtained credentials for remote '{}' (drive type '{}', expires in {}s)", remote,
                      credentials.remote.drive_type, credentials.remote.expires_in);
        return credentials;
    }

    CachingTokenProvider::CachingTokenProvider(TokenProvider &inner, std::chrono::seconds refresh_margin)
        : inner_(inner),
          refresh_margin_(refresh_margin) {}

    CachingTokenProvider::~CachingTokenProvider()
    {
        for (auto &[remote, entry] : cache_)
        {
            if (entry.credentials)
            {
                protocol::scrub(entry.credentials->remote);
            }
        }
    }

    CachingTokenProvider::Entry &CachingTokenProvider::entry_for(const std::string &remote)
    {
        std::lock_guard lock(mutex_);
        return cache_.try_emplace(remote).first->second;
    }

    Credentials CachingTokenProvider::fetch(const std::string &remote, const CancellationToken &cancel)
    {
        auto &entry = entry_for(remote);
        std::lock_guard lock(entry.mutex);
        const auto deadline = std::chrono::system_clock::now() + refresh_margin_;
        if (entry.credentials)
        {
            if (!entry.credentials->expires_before(deadline))
            {
                return *entry.credentials;
            }
            spdlog::debug("cached credentials for remote '{}' expired, refreshing", remote);
            protocol::scrub(entry.credentials->remote);
            entry.credentials.reset();
        }

        entry.credentials = inner_.fetch(remote, cancel);
        return *entry.credentials;
    }

} // namespace ksau::client
