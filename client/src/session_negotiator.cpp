#include "ksau/client/session_negotiator.hpp"

#include <span>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ksau/error_codes.hpp"
#include "ksau/remote_path.hpp"

namespace ksau::client
{

    GraphSessionNegotiator::GraphSessionNegotiator(http::Transport &transport, std::string graph_url,
                                                   protocol::ConflictBehavior conflict_behavior)
        : transport_(transport),
          graph_url_(std::move(graph_url)),
          conflict_behavior_(conflict_behavior)
    {
        while (!graph_url_.empty() && graph_url_.back() == '/')
        {
            graph_url_.pop_back();
        }
    }

    std::string GraphSessionNegotiator::session_endpoint(const std::string &remote_path) const
    {
        return graph_url_ + "/me/drive/root:/" + url_encode_path(normalize_remote(remote_path)) +
               ":/createUploadSession";
    }

    UploadSession GraphSessionNegotiator::create(const Credentials &credentials, const std::string &remote_path,
                                                 const CancellationToken &cancel)
    {
        const auto normalized = normalize_remote(remote_path);
        if (normalized.empty())
        {
            throw Error(ErrorCode::SessionError, "remote path is empty");
        }

        const nlohmann::json body_json = protocol::CreateUploadSessionRequest{.conflict_behavior = conflict_behavior_};
        const auto body = body_json.dump();

        http::Request request{
            .method = http::Method::Post,
            .url = session_endpoint(normalized),
            .headers = {
                {"Authorization", "Bearer " + credentials.remote.access_token},
                {"Content-Type", "application/json"},
                {"Accept", "application/json"},
            },
            .body = std::as_bytes(std::span(body.data(), body.size())),
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
            throw Error(ErrorCode::SessionError, "createUploadSession for '" + normalized + "' failed: " + ex.what());
        }

        if (!response.ok())
        {
            throw Error(ErrorCode::SessionError, "createUploadSession returned HTTP " + std::to_string(response.status) +
                                                     " for '" + normalized + "': " +
                                                     protocol::describe_error_body(response.body));
        }

        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("uploadUrl"))
        {
            throw Error(ErrorCode::SessionError, "createUploadSession response for '" + normalized + "' has no uploadUrl");
        }

        protocol::UploadSessionResponse parsed;
        try
        {
            parsed = json.get<protocol::UploadSessionResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::SessionError, "malformed createUploadSession response: " + std::string(ex.what()));
        }

        spdlog::debug("upload session for '{}' expires {}", normalized, parsed.expiration.value_or("(unknown)"));
        return UploadSession{
            .upload_url = std::move(parsed.upload_url),
            .remote_path = normalized,
            .expiration = std::move(parsed.expiration),
        };
    }

} // namespace ksau::client
