#include "ksau/client/logger.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ksau::client
{

    std::shared_ptr<spdlog::logger> init_logging(const LoggingOptions &options)
    {
        const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;

        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console);
        if (options.log_file)
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string(), false);
            file->set_level(level);
            sinks.push_back(file);
        }

        auto logger = std::make_shared<spdlog::logger>("ksau", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace ksau::client
