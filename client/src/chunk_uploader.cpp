#include "ksau/client/chunk_uploader.hpp"

#include <spdlog/spdlog.h>

#include "ksau/error_codes.hpp"
#include "ksau/protocol.hpp"

namespace ksau::client
{

    ChunkUploader::ChunkUploader(http::Transport &transport)
        : transport_(transport) {}

    ChunkSendResult ChunkUploader::send(const std::string &session_url, const ChunkDescriptor &descriptor,
                                        std::span<const std::byte> buffer, const CancellationToken &cancel)
    {
        if (buffer.size() != descriptor.length)
        {
            throw Error(ErrorCode::InternalError, "buffer of " + std::to_string(buffer.size()) +
                                                      " bytes does not match range " + descriptor.content_range);
        }

        http::Request request{
            .method = http::Method::Put,
            .url = session_url,
            .headers = {
                {"Content-Range", descriptor.content_range},
                {"Content-Length", std::to_string(buffer.size())},
            },
            .body = buffer,
            .cancel = &cancel,
        };

        ChunkSendResult result;
        try
        {
            auto response = transport_.perform(request);
            result.status = response.status;
            result.success = response.ok();
            result.body = std::move(response.body);
        }
        catch (const Error &ex)
        {
            if (ex.code() == ErrorCode::Aborted)
            {
                throw;
            }
            result.success = false;
            result.status = 0;
            result.error = ex.what();
        }

        if (!result.success)
        {
            if (result.error.empty())
            {
                result.error = "HTTP " + std::to_string(result.status) + ": " +
                               protocol::describe_error_body(result.body);
            }
            spdlog::warn("range {} rejected: {}", descriptor.content_range, result.error);
        }
        return result;
    }

} // namespace ksau::client
