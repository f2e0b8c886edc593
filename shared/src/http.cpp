#include "ksau/http.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "ksau/error_codes.hpp"
#include "ksau/remote_path.hpp"
#include "ksau/version.hpp"

namespace ksau::http
{

    namespace
    {

        struct UploadCursor
        {
            std::span<const std::byte> data;
            std::size_t position{0};
        };

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw Error(ErrorCode::InternalError, "libcurl initialization failed");
                } });
        }

        using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        std::size_t write_body(char *contents, std::size_t size, std::size_t nmemb, void *userp)
        {
            static_cast<std::string *>(userp)->append(contents, size * nmemb);
            return size * nmemb;
        }

        std::size_t read_body(char *buffer, std::size_t size, std::size_t nitems, void *userp)
        {
            auto *cursor = static_cast<UploadCursor *>(userp);
            const auto remaining = cursor->data.size() - cursor->position;
            const auto count = std::min(remaining, size * nitems);
            if (count > 0)
            {
                std::memcpy(buffer, cursor->data.data() + cursor->position, count);
                cursor->position += count;
            }
            return count;
        }

        int check_cancel(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            const auto *token = static_cast<const CancellationToken *>(clientp);
            return token != nullptr && token->cancelled() ? 1 : 0;
        }

    } // namespace

    std::string_view to_string(Method method) noexcept
    {
        switch (method)
        {
        case Method::Get:
            return "GET";
        case Method::Post:
            return "POST";
        case Method::Put:
            return "PUT";
        }
        return "GET";
    }

    CurlTransport::CurlTransport(CurlOptions options)
        : options_(std::move(options))
    {
        if (options_.user_agent.empty())
        {
            options_.user_agent = "ksau/" + std::string(ksau::version());
        }
        ensure_curl_global_init();
    }

    Response CurlTransport::perform(const Request &request)
    {
        if (request.cancel != nullptr)
        {
            request.cancel->throw_if_cancelled();
        }

        EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
        {
            throw Error(ErrorCode::NetworkError, "Cannot initialize curl");
        }

        Response response;
        UploadCursor cursor{request.body, 0};
        char error_buffer[CURL_ERROR_SIZE] = {};

        HeaderList headers(nullptr, &curl_slist_free_all);
        auto append_header = [&headers](const std::string &line)
        {
            auto *appended = curl_slist_append(headers.get(), line.c_str());
            if (appended == nullptr)
            {
                throw Error(ErrorCode::NetworkError, "Cannot allocate request headers");
            }
            headers.release();
            headers.reset(appended);
        };
        for (const auto &header : request.headers)
        {
            append_header(header.name + ": " + header.value);
        }

        CURL *handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_time.count()));
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &write_body);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &check_cancel);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, request.cancel);

        switch (request.method)
        {
        case Method::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
            break;
        case Method::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, reinterpret_cast<const char *>(request.body.data()));
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::Put:
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_READFUNCTION, &read_body);
            curl_easy_setopt(handle, CURLOPT_READDATA, &cursor);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            // The session endpoint answers each range directly; skip the 100-continue round trip.
            append_header("Expect:");
            break;
        }
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

        spdlog::debug("{} {}", to_string(request.method), strip_query(request.url));
        const auto res = curl_easy_perform(handle);
        if (res == CURLE_ABORTED_BY_CALLBACK)
        {
            throw Error(ErrorCode::Aborted, "aborted by user");
        }
        if (res != CURLE_OK)
        {
            std::string message = curl_easy_strerror(res);
            if (error_buffer[0] != '\0')
            {
                message += ": ";
                message += error_buffer;
            }
            throw Error(ErrorCode::NetworkError, message);
        }

        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("{} {} -> {}", to_string(request.method), strip_query(request.url), response.status);
        return response;
    }

} // namespace ksau::http
