#include "ksau/client/remote_registry.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "ksau/error_codes.hpp"

namespace ksau::client
{

    namespace
    {

        std::vector<std::string> default_remotes()
        {
            return {"oned", "hakimionedrive", "saurajcf"};
        }

        std::string join_names(const std::vector<std::string> &names)
        {
            std::string out;
            for (const auto &name : names)
            {
                if (!out.empty())
                {
                    out += ", ";
                }
                out += name;
            }
            return out;
        }

    } // namespace

    RemoteRegistry::RemoteRegistry()
        : names_(default_remotes()) {}

    RemoteRegistry::RemoteRegistry(std::vector<std::string> names)
        : names_(std::move(names))
    {
        names_.erase(std::remove_if(names_.begin(), names_.end(), [](const std::string &name)
                                    { return name.empty(); }),
                     names_.end());
    }

    RemoteRegistry RemoteRegistry::load(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot open remotes file: " + path.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded())
        {
            throw Error(ErrorCode::InvalidArgument, "Remotes file is not valid JSON: " + path.string());
        }

        const nlohmann::json *list = &json;
        if (json.is_object())
        {
            auto it = json.find("remotes");
            if (it == json.end())
            {
                throw Error(ErrorCode::InvalidArgument, "Remotes file has no \"remotes\" array: " + path.string());
            }
            list = &*it;
        }
        if (!list->is_array())
        {
            throw Error(ErrorCode::InvalidArgument, "Remotes must be a JSON array of names: " + path.string());
        }

        std::vector<std::string> names;
        for (const auto &item : *list)
        {
            if (!item.is_string())
            {
                throw Error(ErrorCode::InvalidArgument, "Remote names must be strings: " + path.string());
            }
            names.push_back(item.get<std::string>());
        }
        if (names.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Remotes file lists no remotes: " + path.string());
        }
        return RemoteRegistry(std::move(names));
    }

    bool RemoteRegistry::contains(std::string_view name) const
    {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

    void RemoteRegistry::require(std::string_view name) const
    {
        if (!contains(name))
        {
            throw Error(ErrorCode::InvalidArgument,
                        "Remote '" + std::string(name) + "' does not exist (known: " + join_names(names_) + ")");
        }
    }

} // namespace ksau::client
