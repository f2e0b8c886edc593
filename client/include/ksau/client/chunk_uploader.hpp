#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "ksau/cancellation.hpp"
#include "ksau/chunking.hpp"
#include "ksau/http.hpp"

namespace ksau::client
{

    struct ChunkSendResult
    {
        bool success{};
        // Zero when the request never produced an HTTP response.
        long status{};
        std::string body;
        std::string error;
    };

    // Sends single byte ranges to an upload session. Stateless; never retries.
    class ChunkUploader
    {
    public:
        explicit ChunkUploader(http::Transport &transport);

        // Throws Error(ErrorCode::Aborted) on cancellation; every other failure
        // is returned in the result.
        ChunkSendResult send(const std::string &session_url, const ChunkDescriptor &descriptor,
                             std::span<const std::byte> buffer, const CancellationToken &cancel);

    private:
        http::Transport &transport_;
    };

} // namespace ksau::client
