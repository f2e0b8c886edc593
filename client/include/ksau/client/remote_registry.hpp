#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ksau::client
{

    // Remote identifiers the token service knows about.
    class RemoteRegistry
    {
    public:
        RemoteRegistry();
        explicit RemoteRegistry(std::vector<std::string> names);

        // Reads a JSON array of names, or an object with a "remotes" array.
        static RemoteRegistry load(const std::filesystem::path &path);

        bool contains(std::string_view name) const;

        // Throws Error(ErrorCode::InvalidArgument) for unknown names.
        void require(std::string_view name) const;

        const std::vector<std::string> &names() const noexcept { return names_; }

    private:
        std::vector<std::string> names_;
    };

} // namespace ksau::client
