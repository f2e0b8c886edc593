#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace ksau::client
{

    struct LoggingOptions
    {
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

    // Builds the "ksau" logger (stderr for warnings and up, plus an optional
    // file sink) and installs it as the spdlog default.
    std::shared_ptr<spdlog::logger> init_logging(const LoggingOptions &options);

} // namespace ksau::client
