#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ksau/client/batch_dispatcher.hpp"
#include "ksau/client/session_negotiator.hpp"
#include "ksau/client/token_provider.hpp"
#include "ksau/client/upload_coordinator.hpp"
#include "ksau/protocol.hpp"

namespace ksau::client
{

    inline constexpr std::uint64_t kDefaultChunkSizeMb = 5;
    inline constexpr std::uint64_t kMinChunkSizeMb = 1;
    inline constexpr std::uint64_t kMaxChunkSizeMb = 60;

    enum class CommandMode : std::uint8_t
    {
        Upload,
        Batch,
        Help,
        Version
    };

    struct ClientConfig
    {
        CommandMode mode{CommandMode::Help};
        std::vector<std::filesystem::path> local_files;
        std::string remote_path;
        std::string remote;
        std::uint64_t chunk_size_mb{kDefaultChunkSizeMb};
        std::size_t jobs{kDefaultConcurrentFiles};
        bool share_token{false};
        HashMode hash_mode{HashMode::SinglePass};
        protocol::ConflictBehavior conflict{protocol::ConflictBehavior::Replace};
        std::optional<std::filesystem::path> remotes_file;
        std::string token_endpoint{kDefaultTokenEndpoint};
        std::string graph_url{kDefaultGraphUrl};
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};

        std::uint64_t chunk_size_bytes() const noexcept { return chunk_size_mb * kBytesPerMegabyte; }
    };

    // Throws Error(ErrorCode::InvalidArgument) describing the first problem found.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace ksau::client
