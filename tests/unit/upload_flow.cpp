#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ksau/cancellation.hpp"
#include "ksau/client/batch_dispatcher.hpp"
#include "ksau/client/chunk_uploader.hpp"
#include "ksau/client/session_negotiator.hpp"
#include "ksau/client/token_provider.hpp"
#include "ksau/client/upload_coordinator.hpp"
#include "ksau/error_codes.hpp"
#include "ksau/quickxor.hpp"

#include "test_support.hpp"

using namespace ksau;
using namespace ksau::client;

namespace
{

    constexpr std::uint64_t kFiveMegabytes = 5 * kBytesPerMegabyte;
    constexpr const char *kEmptyDigest = "AAAAAAAAAAAAAAAAAAAAAAAAAAA=";

    // Real token/session/chunk clients wired to an in-memory drive.
    struct Harness
    {
        explicit Harness(test::FakeDrive::Options options = {})
            : drive(std::move(options)),
              tokens(drive, test::kTokenEndpoint),
              sessions(drive, test::kGraphUrl),
              uploader(drive) {}

        UploaderServices services() { return UploaderServices{tokens, sessions, uploader, progress}; }

        UploadOutcome upload(const std::filesystem::path &file, std::uint64_t chunk_size,
                             UploadOptions options = {}, CancellationToken cancel = {})
        {
            UploadCoordinator coordinator(UploadTarget{
                                              .remote = "oned",
                                              .remote_directory = "Movies",
                                              .local_path = file,
                                              .chunk_size = chunk_size,
                                          },
                                          services(), options, std::move(cancel));
            return coordinator.run();
        }

        std::vector<std::string> ranges() const
        {
            std::vector<std::string> out;
            for (const auto &request : drive.requests(http::Method::Put))
            {
                out.push_back(request.header("Content-Range").value_or(""));
            }
            return out;
        }

        test::FakeDrive drive;
        HttpTokenProvider tokens;
        GraphSessionNegotiator sessions;
        ChunkUploader uploader;
        test::RecordingProgressSink progress;
    };

    void test_single_chunk_upload()
    {
        const auto dir = test::make_temp_dir("flow_single");
        const auto file = test::write_file(dir, "single.bin", 1000000);
        Harness harness;

        const auto outcome = harness.upload(file, kFiveMegabytes);
        assert(outcome.completed());
        assert(outcome.error == ErrorCode::Ok);
        assert(outcome.result && outcome.result->success);
        assert(outcome.result->download_url == "https://files.example.net/Movies/single.bin");
        assert(outcome.result->remote_path == "Movies/single.bin");
        assert(outcome.result->bytes_uploaded == 1000000);
        assert(outcome.result->digest == quickxor_file(file));

        assert((harness.ranges() == std::vector<std::string>{"bytes 0-999999/1000000"}));
        assert((harness.drive.session_paths() == std::vector<std::string>{"ksau/uploads/Movies/single.bin"}));
        assert(harness.drive.stored("ksau/uploads/Movies/single.bin") == test::read_all(file));
        assert((harness.progress.values(file) == std::vector<int>{100}));
        test::cleanup_path(dir);
    }

    void test_multi_chunk_upload()
    {
        const auto dir = test::make_temp_dir("flow_multi");
        const auto file = test::write_file(dir, "large.bin", 12000000);
        Harness harness;

        const auto outcome = harness.upload(file, kFiveMegabytes);
        assert(outcome.completed());
        assert((harness.ranges() == std::vector<std::string>{"bytes 0-5242879/12000000",
                                                            "bytes 5242880-10485759/12000000",
                                                            "bytes 10485760-11999999/12000000"}));
        assert((harness.progress.values(file) == std::vector<int>{44, 87, 100}));
        assert(harness.progress.last_state(file).bytes_uploaded == 12000000);
        assert(harness.progress.last_state(file).bytes_hashed == 12000000);
        assert(harness.drive.stored("ksau/uploads/Movies/large.bin") == test::read_all(file));
        assert(outcome.result->digest == quickxor_file(file));

        // Only the session URL carries the session; the token goes to Graph alone.
        for (const auto &request : harness.drive.requests(http::Method::Put))
        {
            assert(!request.header("Authorization").has_value());
        }
        test::cleanup_path(dir);
    }

    void test_zero_byte_upload()
    {
        const auto dir = test::make_temp_dir("flow_empty");
        const auto file = test::write_file(dir, "empty.bin", 0);
        Harness harness;

        const auto outcome = harness.upload(file, kFiveMegabytes);
        assert(outcome.completed());
        assert(outcome.result->digest == kEmptyDigest);
        assert(outcome.result->bytes_uploaded == 0);
        assert(harness.drive.requests(http::Method::Post).size() == 1);
        assert(harness.drive.requests(http::Method::Put).empty());
        assert((harness.progress.values(file) == std::vector<int>{100}));
        test::cleanup_path(dir);
    }

    void test_token_failure_stops_before_session()
    {
        const auto dir = test::make_temp_dir("flow_token");
        const auto file = test::write_file(dir, "a.bin", 1000);
        Harness harness({.token_status = 403});

        const auto outcome = harness.upload(file, kFiveMegabytes);
        assert(outcome.kind == OutcomeKind::Failed);
        assert(outcome.error == ErrorCode::AuthError);
        assert(!outcome.result.has_value());
        assert(harness.drive.requests(http::Method::Get).size() == 1);
        assert(harness.drive.requests(http::Method::Post).empty());
        assert(harness.drive.requests(http::Method::Put).empty());
        assert(harness.progress.values(file).empty());
        test::cleanup_path(dir);
    }

    void test_session_failure_stops_before_upload()
    {
        const auto dir = test::make_temp_dir("flow_session");
        const auto file = test::write_file(dir, "a.bin", 1000);
        Harness harness({.session_status = 500});

        const auto outcome = harness.upload(file, kFiveMegabytes);
        assert(outcome.kind == OutcomeKind::Failed);
        assert(outcome.error == ErrorCode::SessionError);
        assert(harness.drive.requests(http::Method::Put).empty());
        test::cleanup_path(dir);
    }

    void test_chunk_failure_stops_upload()
    {
        const auto dir = test::make_temp_dir("flow_chunk");
        const auto file = test::write_file(dir, "broken.bin", 1000000);
        Harness harness({.failing_file = "broken"});

        const auto outcome = harness.upload(file, kRangeAlignment);
        assert(outcome.kind == OutcomeKind::Failed);
        assert(outcome.error == ErrorCode::ChunkUploadError);
        assert(outcome.message ==
               "Failed to upload chunk bytes 0-327679/1000000, status: 500, error: HTTP 500: generalException: disk on fire");
        assert(harness.drive.requests(http::Method::Put).size() == 1);
        assert(harness.progress.values(file).empty());
        assert(!harness.drive.stored("ksau/uploads/Movies/broken.bin").has_value());
        test::cleanup_path(dir);
    }

    void test_local_problems_fail_without_network()
    {
        const auto dir = test::make_temp_dir("flow_local");
        Harness harness;

        const auto missing = harness.upload(dir / "missing.bin", kFiveMegabytes);
        assert(missing.kind == OutcomeKind::Failed);
        assert(missing.error == ErrorCode::IoError);

        const auto directory = harness.upload(dir, kFiveMegabytes);
        assert(directory.error == ErrorCode::IoError);

        const auto file = test::write_file(dir, "a.bin", 10);
        const auto no_chunk = harness.upload(file, 0);
        assert(no_chunk.error == ErrorCode::InvalidArgument);

        assert(harness.drive.requests().empty());
        test::cleanup_path(dir);
    }

    void test_rerun_is_deterministic()
    {
        const auto dir = test::make_temp_dir("flow_rerun");
        const auto file = test::write_file(dir, "again.bin", 700000, 3);

        Harness first;
        Harness second;
        const auto a = first.upload(file, kRangeAlignment);
        const auto b = second.upload(file, kRangeAlignment);
        assert(a.completed() && b.completed());
        assert(a.result->digest == b.result->digest);
        assert(first.ranges() == second.ranges());
        assert(first.ranges().size() == 3);
        test::cleanup_path(dir);
    }

    void test_coordinator_runs_once()
    {
        const auto dir = test::make_temp_dir("flow_once");
        const auto file = test::write_file(dir, "once.bin", 100);
        Harness harness;

        UploadCoordinator coordinator(UploadTarget{.remote = "oned", .local_path = file, .chunk_size = kRangeAlignment},
                                      harness.services(), UploadOptions{}, CancellationToken{});
        assert(coordinator.state() == UploadState::Idle);
        assert(coordinator.run().completed());
        assert(coordinator.state() == UploadState::Completed);
        assert(coordinator.progress().bytes_uploaded == 100);

        const auto again = coordinator.run();
        assert(again.kind == OutcomeKind::Failed);
        assert(again.error == ErrorCode::InternalError);
        assert(harness.drive.requests(http::Method::Put).size() == 1);
        test::cleanup_path(dir);
    }

    void test_hash_modes_agree()
    {
        const auto dir = test::make_temp_dir("flow_hash");
        const auto file = test::write_file(dir, "hash.bin", 1000000, 11);
        const auto expected = quickxor_file(file);

        Harness single;
        const auto a = single.upload(file, kRangeAlignment, UploadOptions{.hash_mode = HashMode::SinglePass});
        assert(a.result->digest == expected);

        Harness separate;
        const auto b = separate.upload(file, kRangeAlignment, UploadOptions{.hash_mode = HashMode::SeparatePass});
        assert(b.result->digest == expected);
        assert(separate.progress.last_state(file).bytes_hashed == 1000000);
        assert(separate.ranges() == single.ranges());

        Harness disabled;
        const auto c = disabled.upload(file, kRangeAlignment, UploadOptions{.hash_mode = HashMode::Disabled});
        assert(c.completed());
        assert(!c.result->digest.has_value());
        assert(disabled.progress.last_state(file).bytes_hashed == 0);
        test::cleanup_path(dir);
    }

    void test_remote_hash_verification()
    {
        const auto dir = test::make_temp_dir("flow_verify");
        const auto file = test::write_file(dir, "verify.bin", 5000);

        Harness corrupt({.corrupt_hash = true});
        const auto mismatch = corrupt.upload(file, kRangeAlignment);
        assert(mismatch.kind == OutcomeKind::Failed);
        assert(mismatch.error == ErrorCode::HashMismatch);

        Harness unverified({.corrupt_hash = true});
        const auto skipped = unverified.upload(file, kRangeAlignment, UploadOptions{.verify_remote_hash = false});
        assert(skipped.completed());

        Harness silent({.report_hash = false});
        assert(silent.upload(file, kRangeAlignment).completed());
        test::cleanup_path(dir);
    }

    void test_cancel_before_start()
    {
        const auto dir = test::make_temp_dir("flow_cancel_early");
        const auto file = test::write_file(dir, "a.bin", 1000);
        Harness harness;

        CancellationToken cancel;
        cancel.cancel();
        const auto outcome = harness.upload(file, kFiveMegabytes, UploadOptions{}, cancel);
        assert(outcome.kind == OutcomeKind::Aborted);
        assert(outcome.error == ErrorCode::Aborted);
        assert(harness.drive.requests().empty());

        const auto missing = harness.upload(dir / "missing.bin", kFiveMegabytes, UploadOptions{}, cancel);
        assert(missing.kind == OutcomeKind::Aborted);
        assert(missing.error == ErrorCode::Aborted);
        assert(harness.drive.requests().empty());
        test::cleanup_path(dir);
    }

    void test_cancel_mid_upload()
    {
        const auto dir = test::make_temp_dir("flow_cancel_mid");
        const auto file = test::write_file(dir, "a.bin", 1000000);

        CancellationToken cancel;
        int puts_seen = 0;
        Harness harness({.on_request = [cancel, puts_seen](const test::RecordedRequest &request) mutable
                         {
                             if (request.method == http::Method::Put && ++puts_seen == 2)
                             {
                                 cancel.cancel();
                             }
                         }});

        UploadCoordinator coordinator(UploadTarget{.remote = "oned", .local_path = file, .chunk_size = kRangeAlignment},
                                      harness.services(), UploadOptions{}, cancel);
        const auto outcome = coordinator.run();
        assert(outcome.kind == OutcomeKind::Aborted);
        assert(outcome.error == ErrorCode::Aborted);
        assert(coordinator.state() == UploadState::Aborted);
        assert(harness.drive.requests(http::Method::Put).size() == 2);
        assert((harness.progress.values(file) == std::vector<int>{33}));
        assert(!harness.drive.stored("ksau/uploads/a.bin").has_value());
        test::cleanup_path(dir);
    }

    void test_qualified_remote_path()
    {
        const UploadTarget target{.remote = "oned", .remote_directory = "/a/b/", .local_path = "x/y/file.txt"};
        assert(UploadCoordinator::qualified_remote_path("/ksau/uploads/", target) == "ksau/uploads/a/b/file.txt");
        assert(UploadCoordinator::qualified_remote_path("", target) == "a/b/file.txt");

        const UploadTarget flat{.remote = "oned", .local_path = "file.txt"};
        assert(UploadCoordinator::qualified_remote_path("/", flat) == "file.txt");
    }

    void test_batch_isolates_failures()
    {
        const auto dir = test::make_temp_dir("batch_isolation");
        const std::vector<std::filesystem::path> files{
            test::write_file(dir, "one.bin", 400000, 1),
            test::write_file(dir, "broken.bin", 400000, 2),
            test::write_file(dir, "three.bin", 0, 3),
            test::write_file(dir, "four.bin", 900000, 4),
        };
        Harness harness({.failing_file = "broken"});

        std::mutex seen_mutex;
        std::vector<std::filesystem::path> seen;
        BatchDispatcher dispatcher(harness.services(), UploadOptions{}, 3, CancellationToken{});
        const auto report = dispatcher.run(
            BatchRequest{.remote = "oned", .remote_directory = "Backups", .files = files, .chunk_size = kRangeAlignment},
            [&](const UploadOutcome &outcome)
            {
                std::lock_guard lock(seen_mutex);
                seen.push_back(outcome.local_path);
            });

        assert(report.outcomes.size() == 4);
        assert(report.count(OutcomeKind::Completed) == 3);
        assert(report.count(OutcomeKind::Failed) == 1);
        assert(!report.all_completed());
        assert(seen.size() == 4);
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            assert(report.outcomes[i].local_path == files[i]);
        }
        assert(report.outcomes[1].error == ErrorCode::ChunkUploadError);
        assert(report.outcomes[0].result->download_url == "https://files.example.net/Backups/one.bin");
        assert(harness.drive.stored("ksau/uploads/Backups/four.bin") == test::read_all(files[3]));
        assert(harness.drive.session_paths().size() == 4);
        test::cleanup_path(dir);
    }

    void test_batch_shares_token_when_cached()
    {
        const auto dir = test::make_temp_dir("batch_tokens");
        const std::vector<std::filesystem::path> files{
            test::write_file(dir, "a.bin", 1000, 1),
            test::write_file(dir, "b.bin", 2000, 2),
            test::write_file(dir, "c.bin", 3000, 3),
        };
        const BatchRequest request{.remote = "oned", .files = files, .chunk_size = kRangeAlignment};

        Harness separate;
        BatchDispatcher per_file(separate.services(), UploadOptions{}, 2, CancellationToken{});
        assert(per_file.run(request).all_completed());
        assert(separate.drive.requests(http::Method::Get).size() == 3);

        Harness shared;
        CachingTokenProvider cache(shared.tokens);
        UploaderServices services{cache, shared.sessions, shared.uploader, shared.progress};
        BatchDispatcher dispatcher(services, UploadOptions{}, 2, CancellationToken{});
        assert(dispatcher.run(request).all_completed());
        assert(shared.drive.requests(http::Method::Get).size() == 1);
        assert(shared.drive.requests(http::Method::Post).size() == 3);
        test::cleanup_path(dir);
    }

    void test_batch_cancelled()
    {
        const auto dir = test::make_temp_dir("batch_cancel");
        const std::vector<std::filesystem::path> files{
            test::write_file(dir, "a.bin", 1000, 1),
            test::write_file(dir, "b.bin", 1000, 2),
            dir / "gone.bin",
        };
        Harness harness;
        CancellationToken cancel;
        cancel.cancel();

        BatchDispatcher dispatcher(harness.services(), UploadOptions{}, 4, cancel);
        const auto report = dispatcher.run(BatchRequest{.remote = "oned", .files = files, .chunk_size = kRangeAlignment});
        assert(report.count(OutcomeKind::Aborted) == 3);
        assert(exit_code_for(report) == kExitAborted);
        assert(harness.drive.requests().empty());
        test::cleanup_path(dir);
    }

    void test_batch_respects_concurrency_limit()
    {
        const auto dir = test::make_temp_dir("batch_limit");
        std::vector<std::filesystem::path> files;
        for (int i = 0; i < 6; ++i)
        {
            files.push_back(test::write_file(dir, "f" + std::to_string(i) + ".bin", 1000, static_cast<unsigned>(i)));
        }

        // A file is in flight from its session request until its PUT; each
        // file fits in one range, so that PUT is also its last.
        std::mutex mutex;
        int in_flight = 0;
        int peak = 0;
        Harness harness({.on_request = [&](const test::RecordedRequest &request)
                         {
                             if (request.method == http::Method::Post)
                             {
                                 {
                                     std::lock_guard lock(mutex);
                                     peak = std::max(peak, ++in_flight);
                                 }
                                 std::this_thread::sleep_for(std::chrono::milliseconds(50));
                             }
                             else if (request.method == http::Method::Put)
                             {
                                 std::lock_guard lock(mutex);
                                 --in_flight;
                             }
                         }});

        BatchDispatcher dispatcher(harness.services(), UploadOptions{}, 2, CancellationToken{});
        const auto report = dispatcher.run(BatchRequest{.remote = "oned", .files = files, .chunk_size = kRangeAlignment});
        assert(report.all_completed());
        assert(peak == 2);
        assert(in_flight == 0);
        assert(harness.drive.requests(http::Method::Put).size() == 6);
        test::cleanup_path(dir);
    }

    void test_exit_codes()
    {
        BatchReport report;
        assert(exit_code_for(report) == kExitSuccess);

        report.outcomes.push_back(UploadOutcome{.kind = OutcomeKind::Completed});
        assert(exit_code_for(report) == kExitSuccess);

        report.outcomes.push_back(UploadOutcome{.kind = OutcomeKind::Failed, .error = ErrorCode::ChunkUploadError});
        assert(exit_code_for(report) == kExitFailure);

        report.outcomes.push_back(UploadOutcome{.kind = OutcomeKind::Aborted, .error = ErrorCode::Aborted});
        assert(exit_code_for(report) == kExitAborted);

        assert(kExitSuccess == 0 && kExitFailure == 1 && kExitUsage == 2 && kExitAborted == 130);
    }

    void test_batch_limits_and_callbacks()
    {
        Harness harness;
        assert(BatchDispatcher(harness.services(), UploadOptions{}, 0, CancellationToken{}).max_concurrent_files() == 1);
        assert(BatchDispatcher(harness.services(), UploadOptions{}, 100, CancellationToken{}).max_concurrent_files() ==
               kMaxConcurrentFiles);

        BatchDispatcher dispatcher(harness.services(), UploadOptions{}, kDefaultConcurrentFiles, CancellationToken{});
        assert(dispatcher.run(BatchRequest{.remote = "oned", .chunk_size = kRangeAlignment}).outcomes.empty());

        const auto dir = test::make_temp_dir("batch_callback");
        const std::vector<std::filesystem::path> files{
            test::write_file(dir, "a.bin", 10, 1),
            test::write_file(dir, "b.bin", 10, 2),
        };
        std::atomic<int> calls{0};
        const auto report = dispatcher.run(
            BatchRequest{.remote = "oned", .files = files, .chunk_size = kRangeAlignment},
            [&](const UploadOutcome &)
            {
                ++calls;
                throw std::runtime_error("display failed");
            });
        assert(calls == 2);
        assert(report.all_completed());
        test::cleanup_path(dir);
    }

} // namespace

void run_upload_flow_tests()
{
    test_single_chunk_upload();
    test_multi_chunk_upload();
    test_zero_byte_upload();
    test_token_failure_stops_before_session();
    test_session_failure_stops_before_upload();
    test_chunk_failure_stops_upload();
    test_local_problems_fail_without_network();
    test_rerun_is_deterministic();
    test_coordinator_runs_once();
    test_hash_modes_agree();
    test_remote_hash_verification();
    test_cancel_before_start();
    test_cancel_mid_upload();
    test_qualified_remote_path();
    test_batch_isolates_failures();
    test_batch_shares_token_when_cached();
    test_batch_cancelled();
    test_batch_respects_concurrency_limit();
    test_exit_codes();
    test_batch_limits_and_callbacks();
}
