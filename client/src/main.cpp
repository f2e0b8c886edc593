#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "ksau/cancellation.hpp"
#include "ksau/client/batch_dispatcher.hpp"
#include "ksau/client/chunk_uploader.hpp"
#include "ksau/client/config.hpp"
#include "ksau/client/logger.hpp"
#include "ksau/client/progress.hpp"
#include "ksau/client/remote_registry.hpp"
#include "ksau/client/session_negotiator.hpp"
#include "ksau/client/signal_watcher.hpp"
#include "ksau/client/token_provider.hpp"
#include "ksau/crypto.hpp"
#include "ksau/error_codes.hpp"
#include "ksau/http.hpp"
#include "ksau/version.hpp"

namespace
{

    std::string format_outcome(const ksau::client::UploadOutcome &outcome)
    {
        using ksau::client::OutcomeKind;
        const auto name = outcome.local_path.filename().string();
        std::ostringstream out;
        if (outcome.kind == OutcomeKind::Completed && outcome.result)
        {
            out << "OK " << name << '\n';
            out << "URL: " << outcome.result->download_url << '\n';
            if (outcome.result->digest)
            {
                out << "QuickXorHash: " << *outcome.result->digest << '\n';
            }
            return out.str();
        }
        out << "ERROR: " << ksau::to_string(outcome.error) << " (" << name << ")\n";
        out << outcome.message << '\n';
        return out.str();
    }

    int run_uploads(const ksau::client::ClientConfig &config)
    {
        using namespace ksau::client;

        const auto registry = config.remotes_file ? RemoteRegistry::load(*config.remotes_file) : RemoteRegistry{};
        registry.require(config.remote);
        ksau::crypto::ensure_sodium_init();

        ksau::CancellationToken cancel;
        SignalWatcher signal_watcher(cancel);

        ksau::http::CurlTransport transport;
        HttpTokenProvider http_tokens(transport, config.token_endpoint);
        std::unique_ptr<CachingTokenProvider> shared_tokens;
        TokenProvider *tokens = &http_tokens;
        if (config.share_token)
        {
            shared_tokens = std::make_unique<CachingTokenProvider>(http_tokens);
            tokens = shared_tokens.get();
        }
        GraphSessionNegotiator sessions(transport, config.graph_url, config.conflict);
        ChunkUploader uploader(transport);
        ConsoleProgressSink progress(std::cout, config.local_files.size() == 1);

        UploaderServices services{*tokens, sessions, uploader, progress};
        UploadOptions options{.hash_mode = config.hash_mode};
        BatchDispatcher dispatcher(services, options, config.jobs, cancel);

        progress.print("Uploading to remote '" + config.remote + "'...\n");
        const BatchRequest request{
            .remote = config.remote,
            .remote_directory = config.remote_path,
            .files = config.local_files,
            .chunk_size = config.chunk_size_bytes(),
        };
        const auto report = dispatcher.run(request, [&progress](const UploadOutcome &outcome)
                                           { progress.print(format_outcome(outcome)); });

        if (report.outcomes.size() > 1)
        {
            progress.print(std::to_string(report.count(OutcomeKind::Completed)) + " completed, " +
                           std::to_string(report.count(OutcomeKind::Failed)) + " failed, " +
                           std::to_string(report.count(OutcomeKind::Aborted)) + " aborted\n");
        }
        return exit_code_for(report);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace ksau::client;

    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "ksau";

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << usage(program);
        return kExitUsage;
    }

    if (config.mode == CommandMode::Help)
    {
        std::cout << "ksau " << ksau::version() << " - upload files to OneDrive remotes\n"
                  << usage(program);
        return kExitSuccess;
    }
    if (config.mode == CommandMode::Version)
    {
        std::cout << "ksau " << ksau::version() << std::endl;
        return kExitSuccess;
    }

    try
    {
        init_logging(LoggingOptions{.log_file = config.log_path, .verbose = config.verbose});
        spdlog::info("ksau {} starting", ksau::version());
        return run_uploads(config);
    }
    catch (const ksau::Error &ex)
    {
        std::cerr << "ERROR: " << ksau::to_string(ex.code()) << std::endl;
        std::cerr << ex.what() << std::endl;
        spdlog::error("fatal: {}", ex.what());
        return ex.code() == ksau::ErrorCode::InvalidArgument ? kExitUsage : kExitFailure;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("fatal: {}", ex.what());
        return kExitFailure;
    }
}
