#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>
#include <string_view>

namespace ksau::client
{

    struct ProgressState
    {
        std::uint64_t total_bytes{};
        std::uint64_t bytes_uploaded{};
        std::uint64_t bytes_hashed{};
    };

    // round(done / total * 100) clamped to [0, 100]; an empty file counts as done.
    int percent_complete(std::uint64_t done, std::uint64_t total) noexcept;

    // Receives progress from concurrently running uploads; implementations must
    // be thread-safe.
    class ProgressSink
    {
    public:
        virtual ~ProgressSink() = default;

        virtual void on_progress(const std::filesystem::path &file, int percent, const ProgressState &state) = 0;
    };

    class NullProgressSink : public ProgressSink
    {
    public:
        void on_progress(const std::filesystem::path &, int, const ProgressState &) override {}
    };

    class ConsoleProgressSink : public ProgressSink
    {
    public:
        // single_line redraws one status line in place; otherwise every
        // step_percent of progress per file is printed on its own line.
        ConsoleProgressSink(std::ostream &out, bool single_line, int step_percent = 10);

        void on_progress(const std::filesystem::path &file, int percent, const ProgressState &state) override;

        // Writes a block of text without splitting it against progress lines
        // from other uploads. An unfinished status line is ended first.
        void print(std::string_view text);

    private:
        std::ostream &out_;
        bool single_line_;
        int step_percent_;
        bool line_open_{false};
        std::mutex mutex_;
        std::map<std::filesystem::path, int> last_reported_;
    };

} // namespace ksau::client
