/**
 * ksau - Minimal HTTP client seam with a libcurl implementation.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ksau/cancellation.hpp"

namespace ksau::http
{

    enum class Method : std::uint8_t
    {
        Get,
        Post,
        Put
    };

    std::string_view to_string(Method method) noexcept;

    struct Header
    {
        std::string name;
        std::string value;
    };

    struct Request
    {
        Method method{Method::Get};
        std::string url;
        std::vector<Header> headers;
        // Not owned; must outlive perform().
        std::span<const std::byte> body{};
        const CancellationToken *cancel{nullptr};
    };

    struct Response
    {
        long status{};
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    // Implementations throw ksau::Error with ErrorCode::Aborted when the request's
    // cancellation token fires, and ErrorCode::NetworkError when no HTTP response
    // was obtained. Non-2xx statuses are returned, not thrown.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual Response perform(const Request &request) = 0;
    };

    struct CurlOptions
    {
        std::chrono::seconds connect_timeout{std::chrono::seconds{30}};
        // Abort a transfer slower than low_speed_limit bytes/s for low_speed_time.
        long low_speed_limit{1};
        std::chrono::seconds low_speed_time{std::chrono::seconds{120}};
        std::string user_agent;
    };

    // One easy handle per request; safe to share across worker threads.
    class CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(CurlOptions options = {});

        Response perform(const Request &request) override;

    private:
        CurlOptions options_;
    };

} // namespace ksau::http
