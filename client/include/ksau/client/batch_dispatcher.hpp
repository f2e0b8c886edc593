#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "ksau/cancellation.hpp"
#include "ksau/client/upload_coordinator.hpp"

namespace ksau::client
{

    inline constexpr std::size_t kDefaultConcurrentFiles = 4;
    inline constexpr std::size_t kMaxConcurrentFiles = 16;

    // Process exit statuses of the ksau executable.
    inline constexpr int kExitSuccess = 0;
    inline constexpr int kExitFailure = 1;
    inline constexpr int kExitUsage = 2;
    inline constexpr int kExitAborted = 130;

    struct BatchRequest
    {
        std::string remote;
        std::string remote_directory;
        std::vector<std::filesystem::path> files;
        std::uint64_t chunk_size{};
    };

    struct BatchReport
    {
        // Same order as BatchRequest::files.
        std::vector<UploadOutcome> outcomes;

        std::size_t count(OutcomeKind kind) const noexcept;
        bool all_completed() const noexcept { return count(OutcomeKind::Completed) == outcomes.size(); }
    };

    // kExitAborted if any file was aborted, else kExitFailure if any failed.
    int exit_code_for(const BatchReport &report) noexcept;

    // Uploads several files in parallel, each through its own coordinator and
    // session. A failed or aborted file never stops its siblings.
    class BatchDispatcher
    {
    public:
        // Called once per file as soon as it finishes; calls are serialized.
        using OutcomeCallback = std::function<void(const UploadOutcome &)>;

        BatchDispatcher(UploaderServices services, UploadOptions options, std::size_t max_concurrent_files,
                        CancellationToken cancel);

        BatchReport run(const BatchRequest &request, const OutcomeCallback &on_outcome = {});

        std::size_t max_concurrent_files() const noexcept { return max_concurrent_files_; }

    private:
        UploadOutcome upload_one(const BatchRequest &request, const std::filesystem::path &file);

        UploaderServices services_;
        UploadOptions options_;
        std::size_t max_concurrent_files_;
        CancellationToken cancel_;
    };

} // namespace ksau::client
