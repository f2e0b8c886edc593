#include "ksau/client/batch_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace ksau::client
{

    std::size_t BatchReport::count(OutcomeKind kind) const noexcept
    {
        return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [kind](const UploadOutcome &outcome)
                                                      { return outcome.kind == kind; }));
    }

    int exit_code_for(const BatchReport &report) noexcept
    {
        if (report.count(OutcomeKind::Aborted) > 0)
        {
            return kExitAborted;
        }
        if (report.count(OutcomeKind::Failed) > 0)
        {
            return kExitFailure;
        }
        return kExitSuccess;
    }

    BatchDispatcher::BatchDispatcher(UploaderServices services, UploadOptions options, std::size_t max_concurrent_files,
                                     CancellationToken cancel)
        : services_(services),
          options_(options),
          max_concurrent_files_(std::clamp<std::size_t>(max_concurrent_files, 1, kMaxConcurrentFiles)),
          cancel_(std::move(cancel)) {}

    BatchReport BatchDispatcher::run(const BatchRequest &request, const OutcomeCallback &on_outcome)
    {
        BatchReport report;
        report.outcomes.resize(request.files.size());
        if (request.files.empty())
        {
            return report;
        }

        const auto workers = std::min(max_concurrent_files_, request.files.size());
        spdlog::info("uploading {} file(s) to remote '{}' with {} worker(s)", request.files.size(), request.remote,
                     workers);

        std::mutex callback_mutex;
        asio::thread_pool pool(workers);
        for (std::size_t index = 0; index < request.files.size(); ++index)
        {
            asio::post(pool, [this, &request, &report, &on_outcome, &callback_mutex, index]
                       {
                auto &slot = report.outcomes[index];
                slot = upload_one(request, request.files[index]);
                if (!on_outcome)
                {
                    return;
                }
                std::lock_guard lock(callback_mutex);
                try
                {
                    on_outcome(slot);
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("outcome callback for '{}' failed: {}", slot.local_path.string(), ex.what());
                } });
        }
        pool.join();

        spdlog::info("batch finished: {} completed, {} failed, {} aborted", report.count(OutcomeKind::Completed),
                     report.count(OutcomeKind::Failed), report.count(OutcomeKind::Aborted));
        return report;
    }

    UploadOutcome BatchDispatcher::upload_one(const BatchRequest &request, const std::filesystem::path &file)
    {
        UploadTarget target{
            .remote = request.remote,
            .remote_directory = request.remote_directory,
            .local_path = file,
            .chunk_size = request.chunk_size,
        };
        try
        {
            UploadCoordinator coordinator(std::move(target), services_, options_, cancel_);
            return coordinator.run();
        }
        catch (const std::exception &ex)
        {
            UploadOutcome outcome;
            outcome.kind = OutcomeKind::Failed;
            outcome.local_path = file;
            outcome.error = ErrorCode::InternalError;
            outcome.message = ex.what();
            spdlog::error("[{}] upload failed: {}", file.filename().string(), ex.what());
            return outcome;
        }
    }

} // namespace ksau::client
