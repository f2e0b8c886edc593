#include "ksau/client/progress.hpp"

#include <algorithm>
#include <cmath>

namespace ksau::client
{

    int percent_complete(std::uint64_t done, std::uint64_t total) noexcept
    {
        if (total == 0)
        {
            return 100;
        }
        const auto ratio = static_cast<double>(done) / static_cast<double>(total);
        const auto rounded = static_cast<int>(std::lround(ratio * 100.0));
        return std::clamp(rounded, 0, 100);
    }

    ConsoleProgressSink::ConsoleProgressSink(std::ostream &out, bool single_line, int step_percent)
        : out_(out),
          single_line_(single_line),
          step_percent_(std::max(step_percent, 1)) {}

    void ConsoleProgressSink::on_progress(const std::filesystem::path &file, int percent, const ProgressState &state)
    {
        std::lock_guard lock(mutex_);
        const auto name = file.filename().string();
        if (single_line_)
        {
            out_ << "\rUploading " << name << ": " << percent << "% (" << state.bytes_uploaded << " / "
                 << state.total_bytes << " bytes)" << std::flush;
            line_open_ = percent < 100;
            if (!line_open_)
            {
                out_ << std::endl;
            }
            return;
        }

        auto it = last_reported_.try_emplace(file, -step_percent_).first;
        if (percent < 100 && percent - it->second < step_percent_)
        {
            return;
        }
        it->second = percent;
        out_ << name << ": " << percent << "% (" << state.bytes_uploaded << " / " << state.total_bytes << " bytes)"
             << std::endl;
    }

    void ConsoleProgressSink::print(std::string_view text)
    {
        std::lock_guard lock(mutex_);
        if (line_open_)
        {
            out_ << '\n';
            line_open_ = false;
        }
        out_ << text << std::flush;
    }

} // namespace ksau::client
