#pragma once

#include <thread>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "ksau/cancellation.hpp"

namespace ksau::client
{

    // Turns the first SIGINT/SIGTERM into cancellation for as long as it is
    // alive. The default disposition is restored after that signal, so a second
    // one terminates the process.
    class SignalWatcher
    {
    public:
        explicit SignalWatcher(CancellationToken cancel);
        ~SignalWatcher();

        SignalWatcher(const SignalWatcher &) = delete;
        SignalWatcher &operator=(const SignalWatcher &) = delete;

    private:
        CancellationToken cancel_;
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
    };

} // namespace ksau::client
