#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ksau/cancellation.hpp"
#include "ksau/client/chunk_reader.hpp"
#include "ksau/client/chunk_uploader.hpp"
#include "ksau/client/progress.hpp"
#include "ksau/client/session_negotiator.hpp"
#include "ksau/client/token_provider.hpp"
#include "ksau/error_codes.hpp"
#include "ksau/quickxor.hpp"

namespace ksau::client
{

    enum class UploadState : std::uint8_t
    {
        Idle,
        TokenAcquired,
        SessionCreated,
        Uploading,
        Completed,
        Failed,
        Aborted
    };

    std::string_view to_string(UploadState state) noexcept;

    enum class HashMode : std::uint8_t
    {
        // Hash each chunk as it is read for upload.
        SinglePass,
        // Hash the whole file first, then reread it for upload.
        SeparatePass,
        Disabled
    };

    struct UploadTarget
    {
        std::string remote;
        // Destination directory below the remote's upload root; may be empty.
        std::string remote_directory;
        std::filesystem::path local_path;
        std::uint64_t chunk_size{};
    };

    struct UploadResult
    {
        std::string download_url;
        // Base64 QuickXorHash; absent when hashing is disabled.
        std::optional<std::string> digest;
        bool success{};
        // Path below the upload root, as used in the download URL.
        std::string remote_path;
        std::uint64_t bytes_uploaded{};
    };

    enum class OutcomeKind : std::uint8_t
    {
        Completed,
        Failed,
        Aborted
    };

    std::string_view to_string(OutcomeKind kind) noexcept;

    struct UploadOutcome
    {
        OutcomeKind kind{OutcomeKind::Failed};
        std::filesystem::path local_path;
        std::optional<UploadResult> result;
        ErrorCode error{ErrorCode::Ok};
        std::string message;

        bool completed() const noexcept { return kind == OutcomeKind::Completed; }
    };

    struct UploadOptions
    {
        HashMode hash_mode{HashMode::SinglePass};
        // Compare against the quickXorHash the service reports for the finished item.
        bool verify_remote_hash{true};
    };

    // Collaborators shared by every coordinator of a batch.
    struct UploaderServices
    {
        TokenProvider &tokens;
        SessionNegotiator &sessions;
        ChunkUploader &uploader;
        ProgressSink &progress;
    };

    // Drives one file through token -> session -> ordered range uploads.
    // Every failure, including cancellation, comes back as an UploadOutcome.
    class UploadCoordinator
    {
    public:
        UploadCoordinator(UploadTarget target, UploaderServices services, UploadOptions options,
                          CancellationToken cancel);

        // Runs the upload once; later calls return an InternalError outcome.
        UploadOutcome run();

        UploadState state() const noexcept { return state_; }
        const ProgressState &progress() const noexcept { return progress_; }

        // upload root + directory + file name, normalized.
        static std::string qualified_remote_path(const std::string &upload_root, const UploadTarget &target);

    private:
        Credentials acquire_credentials();
        UploadSession create_session(const Credentials &credentials);
        UploadResult transfer(const Credentials &credentials, const UploadSession &session);
        void hash_ahead(ChunkReader &reader, QuickXorHash &hash);
        void verify_remote_digest(const std::string &last_response, const std::string &digest) const;
        void report_progress();
        void transition(UploadState next);
        UploadOutcome finish(OutcomeKind kind, ErrorCode error, std::string message);

        UploadTarget target_;
        UploaderServices services_;
        UploadOptions options_;
        CancellationToken cancel_;
        UploadState state_{UploadState::Idle};
        ProgressState progress_{};
        std::string file_name_;
    };

} // namespace ksau::client
