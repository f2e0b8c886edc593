/**
 * ksau - Shared cancellation flag observed by long-running uploads.
 */
#pragma once

#include <atomic>
#include <memory>

namespace ksau
{

    // Copies share one flag; cancelling any copy is visible to all of them.
    class CancellationToken
    {
    public:
        CancellationToken()
            : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() noexcept
        {
            flag_->store(true, std::memory_order_release);
        }

        bool cancelled() const noexcept
        {
            return flag_->load(std::memory_order_acquire);
        }

        // Throws Error(ErrorCode::Aborted) when cancelled.
        void throw_if_cancelled() const;

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace ksau
