#include "ksau/client/upload_coordinator.hpp"

#include <array>
#include <exception>
#include <memory>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "ksau/crypto.hpp"
#include "ksau/encoding/base64.hpp"
#include "ksau/protocol.hpp"
#include "ksau/remote_path.hpp"

namespace ksau::client
{

    namespace
    {

        struct StateMapping
        {
            UploadState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 7> kStateMappings{{
            {UploadState::Idle, "idle"},
            {UploadState::TokenAcquired, "token_acquired"},
            {UploadState::SessionCreated, "session_created"},
            {UploadState::Uploading, "uploading"},
            {UploadState::Completed, "completed"},
            {UploadState::Failed, "failed"},
            {UploadState::Aborted, "aborted"},
        }};

        // Errors raised inside a stage carry that stage's kind; cancellation passes through.
        template <typename Fn>
        auto within_stage(ErrorCode stage_error, Fn &&fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const Error &ex)
            {
                if (ex.code() == ErrorCode::Aborted || ex.code() == stage_error)
                {
                    throw;
                }
                throw Error(stage_error, ex.what());
            }
        }

        std::string download_url(std::string base_url, const std::string &remote_path)
        {
            while (!base_url.empty() && base_url.back() == '/')
            {
                base_url.pop_back();
            }
            return base_url + "/" + remote_path;
        }

    } // namespace

    std::string_view to_string(UploadState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(OutcomeKind kind) noexcept
    {
        switch (kind)
        {
        case OutcomeKind::Completed:
            return "completed";
        case OutcomeKind::Failed:
            return "failed";
        case OutcomeKind::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    UploadCoordinator::UploadCoordinator(UploadTarget target, UploaderServices services, UploadOptions options,
                                         CancellationToken cancel)
        : target_(std::move(target)),
          services_(services),
          options_(options),
          cancel_(std::move(cancel)),
          file_name_(target_.local_path.filename().string()) {}

    std::string UploadCoordinator::qualified_remote_path(const std::string &upload_root, const UploadTarget &target)
    {
        return join_remote_path({upload_root, target.remote_directory, target.local_path.filename().string()});
    }

    UploadOutcome UploadCoordinator::run()
    {
        if (state_ != UploadState::Idle)
        {
            return UploadOutcome{
                .kind = OutcomeKind::Failed,
                .local_path = target_.local_path,
                .error = ErrorCode::InternalError,
                .message = "upload coordinator already ran",
            };
        }

        Credentials credentials;
        try
        {
            cancel_.throw_if_cancelled();
            if (target_.chunk_size == 0)
            {
                throw Error(ErrorCode::InvalidArgument, "chunk size must be positive");
            }
            std::error_code ec;
            if (!std::filesystem::is_regular_file(target_.local_path, ec))
            {
                const bool exists = std::filesystem::exists(target_.local_path, ec);
                throw Error(ErrorCode::IoError, exists ? "'" + target_.local_path.string() + "' is not a file"
                                                       : "file '" + target_.local_path.string() + "' does not exist");
            }
            if (target_.chunk_size % kRangeAlignment != 0)
            {
                spdlog::warn("[{}] chunk size {} is not a multiple of 320 KiB; the service may reject ranges",
                             file_name_, target_.chunk_size);
            }

            credentials = acquire_credentials();
            transition(UploadState::TokenAcquired);

            cancel_.throw_if_cancelled();
            const auto session = create_session(credentials);
            transition(UploadState::SessionCreated);

            auto result = transfer(credentials, session);
            protocol::scrub(credentials.remote);
            transition(UploadState::Completed);
            spdlog::info("[{}] upload completed: {}", file_name_, result.download_url);

            UploadOutcome outcome;
            outcome.kind = OutcomeKind::Completed;
            outcome.local_path = target_.local_path;
            outcome.result = std::move(result);
            return outcome;
        }
        catch (const Error &ex)
        {
            protocol::scrub(credentials.remote);
            if (ex.code() == ErrorCode::Aborted)
            {
                return finish(OutcomeKind::Aborted, ErrorCode::Aborted, ex.what());
            }
            return finish(OutcomeKind::Failed, ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            protocol::scrub(credentials.remote);
            return finish(OutcomeKind::Failed, ErrorCode::InternalError, ex.what());
        }
    }

    Credentials UploadCoordinator::acquire_credentials()
    {
        spdlog::debug("[{}] requesting credentials for remote '{}'", file_name_, target_.remote);
        return within_stage(ErrorCode::AuthError, [&]
                            { return services_.tokens.fetch(target_.remote, cancel_); });
    }

    UploadSession UploadCoordinator::create_session(const Credentials &credentials)
    {
        const auto remote_path = qualified_remote_path(credentials.remote.upload_root_path, target_);
        auto session = within_stage(ErrorCode::SessionError, [&]
                                    { return services_.sessions.create(credentials, remote_path, cancel_); });
        if (session.upload_url.empty())
        {
            throw Error(ErrorCode::SessionError, "upload session for '" + remote_path + "' has no URL");
        }
        spdlog::info("[{}] upload session created for '{}'", file_name_, remote_path);
        return session;
    }

    UploadResult UploadCoordinator::transfer(const Credentials &credentials, const UploadSession &session)
    {
        auto reader = within_stage(ErrorCode::IoError, [&]
                                   { return std::make_unique<ChunkReader>(target_.local_path, target_.chunk_size); });
        progress_ = ProgressState{.total_bytes = reader->file_size()};

        QuickXorHash hash;
        if (options_.hash_mode == HashMode::SeparatePass)
        {
            hash_ahead(*reader, hash);
        }

        transition(UploadState::Uploading);
        spdlog::debug("[{}] sending {} bytes in {} range(s)", file_name_, reader->file_size(), reader->chunk_count());

        std::string last_response;
        if (reader->file_size() == 0)
        {
            report_progress();
        }
        while (true)
        {
            cancel_.throw_if_cancelled();
            auto chunk = within_stage(ErrorCode::IoError, [&]
                                      { return reader->next(); });
            if (!chunk)
            {
                break;
            }

            if (options_.hash_mode == HashMode::SinglePass)
            {
                hash.update(chunk->data);
                progress_.bytes_hashed += chunk->data.size();
            }

            auto sent = services_.uploader.send(session.upload_url, chunk->descriptor, chunk->data, cancel_);
            if (!sent.success)
            {
                throw Error(ErrorCode::ChunkUploadError,
                            "Failed to upload chunk " + chunk->descriptor.content_range + ", status: " +
                                std::to_string(sent.status) + ", error: " + sent.error);
            }

            progress_.bytes_uploaded = chunk->descriptor.end();
            report_progress();
            last_response = std::move(sent.body);
        }

        std::optional<std::string> digest;
        if (options_.hash_mode != HashMode::Disabled)
        {
            digest = hash.digest_base64();
            if (options_.verify_remote_hash)
            {
                verify_remote_digest(last_response, *digest);
            }
        }

        const auto remote_path = join_remote_path({target_.remote_directory, target_.local_path.filename().string()});
        return UploadResult{
            .download_url = download_url(credentials.remote.base_url, remote_path),
            .digest = std::move(digest),
            .success = true,
            .remote_path = remote_path,
            .bytes_uploaded = progress_.bytes_uploaded,
        };
    }

    void UploadCoordinator::hash_ahead(ChunkReader &reader, QuickXorHash &hash)
    {
        within_stage(ErrorCode::IoError, [&]
                     {
            while (auto chunk = reader.next())
            {
                cancel_.throw_if_cancelled();
                hash.update(chunk->data);
                progress_.bytes_hashed += chunk->data.size();
            }
            reader.rewind(); });
        spdlog::debug("[{}] hashed {} bytes ahead of upload", file_name_, progress_.bytes_hashed);
    }

    void UploadCoordinator::verify_remote_digest(const std::string &last_response, const std::string &digest) const
    {
        if (last_response.empty())
        {
            return;
        }
        const auto item = protocol::parse_uploaded_item(last_response);
        if (!item || !item->quick_xor_hash)
        {
            spdlog::debug("[{}] service reported no quickXorHash; skipping verification", file_name_);
            return;
        }

        const auto remote_bytes = encoding::decode_base64(*item->quick_xor_hash);
        const auto local_bytes = encoding::decode_base64(digest);
        if (!remote_bytes || !local_bytes)
        {
            spdlog::warn("[{}] unreadable quickXorHash '{}' from service", file_name_, *item->quick_xor_hash);
            return;
        }
        if (!crypto::equal_digests(*remote_bytes, *local_bytes))
        {
            throw Error(ErrorCode::HashMismatch, "service reports quickXorHash " + *item->quick_xor_hash +
                                                     " but the local file hashes to " + digest);
        }
        spdlog::debug("[{}] remote quickXorHash matches", file_name_);
    }

    void UploadCoordinator::report_progress()
    {
        services_.progress.on_progress(target_.local_path,
                                       percent_complete(progress_.bytes_uploaded, progress_.total_bytes), progress_);
    }

    void UploadCoordinator::transition(UploadState next)
    {
        spdlog::debug("[{}] {} -> {}", file_name_, to_string(state_), to_string(next));
        state_ = next;
    }

    UploadOutcome UploadCoordinator::finish(OutcomeKind kind, ErrorCode error, std::string message)
    {
        transition(kind == OutcomeKind::Aborted ? UploadState::Aborted : UploadState::Failed);
        if (kind == OutcomeKind::Aborted)
        {
            spdlog::warn("[{}] upload aborted after {} of {} bytes", file_name_, progress_.bytes_uploaded,
                         progress_.total_bytes);
        }
        else
        {
            spdlog::error("[{}] upload failed ({}): {}", file_name_, ksau::to_string(error), message);
        }

        UploadOutcome outcome;
        outcome.kind = kind;
        outcome.local_path = target_.local_path;
        outcome.error = error;
        outcome.message = std::move(message);
        return outcome;
    }

} // namespace ksau::client
