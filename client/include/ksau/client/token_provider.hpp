#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "ksau/cancellation.hpp"
#include "ksau/http.hpp"
#include "ksau/protocol.hpp"

namespace ksau::client
{

    inline constexpr const char *kDefaultTokenEndpoint = "https://project.ksauraj.eu.org";

    struct Credentials
    {
        protocol::RemoteCredentials remote;
        std::chrono::system_clock::time_point expires_at{std::chrono::system_clock::time_point::max()};

        bool expires_before(std::chrono::system_clock::time_point when) const noexcept
        {
            return expires_at <= when;
        }
    };

    class TokenProvider
    {
    public:
        virtual ~TokenProvider() = default;

        // Throws Error(ErrorCode::AuthError) when no credentials can be obtained
        // and Error(ErrorCode::Aborted) on cancellation.
        virtual Credentials fetch(const std::string &remote, const CancellationToken &cancel) = 0;
    };

    // GET {endpoint}/token?remote={name}
    class HttpTokenProvider : public TokenProvider
    {
    public:
        HttpTokenProvider(http::Transport &transport, std::string endpoint);

        Credentials fetch(const std::string &remote, const CancellationToken &cancel) override;

    private:
        http::Transport &transport_;
        std::string endpoint_;
    };

    // Shares one credential set per remote until it is about to expire.
    // Concurrent callers for one remote wait for a single fetch; other remotes
    // are not blocked by it.
    class CachingTokenProvider : public TokenProvider
    {
    public:
        explicit CachingTokenProvider(TokenProvider &inner,
                                      std::chrono::seconds refresh_margin = std::chrono::seconds{60});
        ~CachingTokenProvider() override;

        CachingTokenProvider(const CachingTokenProvider &) = delete;
        CachingTokenProvider &operator=(const CachingTokenProvider &) = delete;

        Credentials fetch(const std::string &remote, const CancellationToken &cancel) override;

    private:
        struct Entry
        {
            std::mutex mutex;
            std::optional<Credentials> credentials;
        };

        Entry &entry_for(const std::string &remote);

        TokenProvider &inner_;
        std::chrono::seconds refresh_margin_;
        std::mutex mutex_;
        // Node-based, so entries stay put while other remotes are added.
        std::map<std::string, Entry> cache_;
    };

} // namespace ksau::client
