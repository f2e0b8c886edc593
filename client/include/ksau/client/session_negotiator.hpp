#pragma once

#include <optional>
#include <string>

#include "ksau/cancellation.hpp"
#include "ksau/client/token_provider.hpp"
#include "ksau/http.hpp"
#include "ksau/protocol.hpp"

namespace ksau::client
{

    inline constexpr const char *kDefaultGraphUrl = "https://graph.microsoft.com/v1.0";

    // One session per destination file; never shared between uploads.
    struct UploadSession
    {
        std::string upload_url;
        std::string remote_path;
        std::optional<std::string> expiration;
    };

    class SessionNegotiator
    {
    public:
        virtual ~SessionNegotiator() = default;

        // remote_path is the fully qualified drive path, upload root included.
        // Throws Error(ErrorCode::SessionError), or Error(ErrorCode::Aborted).
        virtual UploadSession create(const Credentials &credentials, const std::string &remote_path,
                                     const CancellationToken &cancel) = 0;
    };

    // POST {graph}/me/drive/root:/{path}:/createUploadSession
    class GraphSessionNegotiator : public SessionNegotiator
    {
    public:
        GraphSessionNegotiator(http::Transport &transport, std::string graph_url,
                               protocol::ConflictBehavior conflict_behavior = protocol::ConflictBehavior::Replace);

        UploadSession create(const Credentials &credentials, const std::string &remote_path,
                             const CancellationToken &cancel) override;

        std::string session_endpoint(const std::string &remote_path) const;

    private:
        http::Transport &transport_;
        std::string graph_url_;
        protocol::ConflictBehavior conflict_behavior_;
    };

} // namespace ksau::client
