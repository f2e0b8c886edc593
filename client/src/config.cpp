#include "ksau/client/config.hpp"

#include <charconv>
#include <string_view>

#include "ksau/error_codes.hpp"

namespace ksau::client
{

    namespace
    {

        [[noreturn]] void usage_error(const std::string &message)
        {
            throw Error(ErrorCode::InvalidArgument, message);
        }

        std::uint64_t parse_number(std::string_view option, std::string_view text, std::uint64_t min,
                                   std::uint64_t max)
        {
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                usage_error(std::string(option) + " expects a number, got '" + std::string(text) + "'");
            }
            if (value < min || value > max)
            {
                usage_error(std::string(option) + " must be between " + std::to_string(min) + " and " +
                            std::to_string(max) + " inclusive");
            }
            return value;
        }

        std::string next_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                usage_error(option + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        if (argc < 2)
        {
            usage_error("missing command");
        }

        int index = 1;
        const std::string command = argv[index++];
        if (command == "--help" || command == "-h" || command == "help")
        {
            config.mode = CommandMode::Help;
            return config;
        }
        if (command == "--version")
        {
            config.mode = CommandMode::Version;
            return config;
        }
        if (command == "upload")
        {
            config.mode = CommandMode::Upload;
        }
        else if (command == "batch")
        {
            config.mode = CommandMode::Batch;
        }
        else
        {
            usage_error("Unknown command: " + command);
        }

        bool no_hash = false;
        bool hash_first = false;
        std::optional<std::string> chunk_option;
        std::vector<std::string> positionals;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.mode = CommandMode::Help;
                return config;
            }
            if (arg == "--chunk-size")
            {
                chunk_option = next_value(index, argc, argv, arg);
            }
            else if (arg == "--jobs" || arg == "-j")
            {
                config.jobs = static_cast<std::size_t>(
                    parse_number(arg, next_value(index, argc, argv, arg), 1, kMaxConcurrentFiles));
            }
            else if (arg == "--share-token")
            {
                config.share_token = true;
            }
            else if (arg == "--no-hash")
            {
                no_hash = true;
            }
            else if (arg == "--hash-first")
            {
                hash_first = true;
            }
            else if (arg == "--conflict")
            {
                const auto value = next_value(index, argc, argv, arg);
                const auto behavior = protocol::conflict_behavior_from_string(value);
                if (!behavior)
                {
                    usage_error("--conflict must be one of replace, rename, fail");
                }
                config.conflict = *behavior;
            }
            else if (arg == "--remotes")
            {
                config.remotes_file = std::filesystem::path(next_value(index, argc, argv, arg));
            }
            else if (arg == "--token-endpoint")
            {
                config.token_endpoint = next_value(index, argc, argv, arg);
            }
            else if (arg == "--graph-url")
            {
                config.graph_url = next_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                usage_error("Unknown argument: " + arg);
            }
            else
            {
                positionals.push_back(arg);
            }
        }

        if (no_hash && hash_first)
        {
            usage_error("--no-hash and --hash-first cannot be combined");
        }
        config.hash_mode = no_hash ? HashMode::Disabled : (hash_first ? HashMode::SeparatePass : HashMode::SinglePass);

        if (config.mode == CommandMode::Upload)
        {
            // upload <local_file> <remote_path> <remote> [chunk_size_mb]
            if (positionals.size() < 3 || positionals.size() > 4)
            {
                usage_error("upload expects <local_file> <remote_path> <remote> [chunk_size_mb]");
            }
            config.local_files.emplace_back(positionals[0]);
            config.remote_path = positionals[1];
            config.remote = positionals[2];
            if (positionals.size() == 4)
            {
                if (chunk_option)
                {
                    usage_error("chunk size given twice");
                }
                chunk_option = positionals[3];
            }
        }
        else
        {
            // batch <remote_path> <remote> <local_file>...
            if (positionals.size() < 3)
            {
                usage_error("batch expects <remote_path> <remote> <local_file>...");
            }
            config.remote_path = positionals[0];
            config.remote = positionals[1];
            config.local_files.assign(positionals.begin() + 2, positionals.end());
        }

        if (chunk_option)
        {
            config.chunk_size_mb = parse_number("chunk size", *chunk_option, kMinChunkSizeMb, kMaxChunkSizeMb);
        }
        if (config.remote.empty())
        {
            usage_error("remote must not be empty");
        }

        return config;
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage:\n"
               "  " + program_name + " upload <local_file> <remote_path> <remote> [chunk_size_mb] [options]\n"
               "  " + program_name + " batch <remote_path> <remote> <local_file>... [options]\n"
               "\n"
               "Options:\n"
               "  --chunk-size <MB>        upload chunk size, 1-60 (default 5)\n"
               "  -j, --jobs <N>           files uploaded in parallel, 1-16 (default 4)\n"
               "  --share-token            fetch credentials once per remote for the whole batch\n"
               "  --no-hash                skip QuickXorHash computation\n"
               "  --hash-first             hash each file in a separate pass before uploading\n"
               "  --conflict <policy>      replace, rename or fail (default replace)\n"
               "  --remotes <file>         JSON list of recognized remotes\n"
               "  --token-endpoint <url>   token service base URL\n"
               "  --graph-url <url>        Microsoft Graph base URL\n"
               "  --log <file>             append a log to <file>\n"
               "  -v, --verbose            debug logging\n"
               "  -h, --help               show this help\n"
               "  --version                show version\n";
    }

} // namespace ksau::client
