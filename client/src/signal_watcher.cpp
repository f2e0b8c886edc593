#include "ksau/client/signal_watcher.hpp"

#include <csignal>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace ksau::client
{

    SignalWatcher::SignalWatcher(CancellationToken cancel)
        : cancel_(std::move(cancel)),
          signals_(io_context_, SIGINT, SIGTERM)
    {
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
            if (ec)
            {
                return;
            }
            spdlog::warn("signal {} received, aborting uploads (repeat to force quit)", signal_number);
            cancel_.cancel();
            std::error_code clear_ec;
            signals_.clear(clear_ec);
            if (clear_ec)
            {
                spdlog::warn("could not restore default signal handling: {}", clear_ec.message());
            } });
        thread_ = std::thread([this]
                              { io_context_.run(); });
    }

    SignalWatcher::~SignalWatcher()
    {
        std::error_code ec;
        signals_.cancel(ec);
        io_context_.stop();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

} // namespace ksau::client
