#include "ksau/protocol.hpp"

#include <array>

#include "ksau/crypto.hpp"

namespace ksau::protocol
{

    namespace
    {

        struct ConflictMapping
        {
            ConflictBehavior behavior;
            std::string_view label;
        };

        constexpr std::array<ConflictMapping, 3> kConflictMappings{{
            {ConflictBehavior::Replace, "replace"},
            {ConflictBehavior::Rename, "rename"},
            {ConflictBehavior::Fail, "fail"},
        }};

        constexpr std::size_t kMaxErrorBody = 512;

    } // namespace

    void to_json(nlohmann::json &json, const RemoteCredentials &credentials)
    {
        json = {
            {"access_token", credentials.access_token},
            {"refresh_token", credentials.refresh_token},
            {"expires_in", credentials.expires_in},
            {"client_id", credentials.client_id},
            {"client_secret", credentials.client_secret},
            {"drive_id", credentials.drive_id},
            {"drive_type", credentials.drive_type},
            {"base_url", credentials.base_url},
            {"upload_root_path", credentials.upload_root_path},
        };
    }

    void from_json(const nlohmann::json &json, RemoteCredentials &credentials)
    {
        credentials.access_token = json.at("access_token").get<std::string>();
        credentials.refresh_token = json.value("refresh_token", std::string{});
        credentials.expires_in = json.value("expires_in", std::int64_t{0});
        credentials.client_id = json.value("client_id", std::string{});
        credentials.client_secret = json.value("client_secret", std::string{});
        credentials.drive_id = json.value("drive_id", std::string{});
        credentials.drive_type = json.value("drive_type", std::string{});
        credentials.base_url = json.at("base_url").get<std::string>();
        credentials.upload_root_path = json.value("upload_root_path", std::string{});
    }

    void scrub(RemoteCredentials &credentials) noexcept
    {
        crypto::secure_wipe(credentials.access_token);
        crypto::secure_wipe(credentials.refresh_token);
        crypto::secure_wipe(credentials.client_secret);
    }

    std::string_view to_string(ConflictBehavior behavior) noexcept
    {
        for (const auto &mapping : kConflictMappings)
        {
            if (mapping.behavior == behavior)
            {
                return mapping.label;
            }
        }
        return "replace";
    }

    std::optional<ConflictBehavior> conflict_behavior_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kConflictMappings)
        {
            if (mapping.label == value)
            {
                return mapping.behavior;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const CreateUploadSessionRequest &request)
    {
        json = {
            {"item", {{"@microsoft.graph.conflictBehavior", to_string(request.conflict_behavior)}}},
        };
    }

    void from_json(const nlohmann::json &json, UploadSessionResponse &response)
    {
        response.upload_url = json.at("uploadUrl").get<std::string>();
        if (auto it = json.find("expirationDateTime"); it != json.end() && it->is_string())
        {
            response.expiration = it->get<std::string>();
        }
        else
        {
            response.expiration.reset();
        }
    }

    void from_json(const nlohmann::json &json, UploadedItem &item)
    {
        item.id = json.at("id").get<std::string>();
        item.name = json.value("name", std::string{});
        item.size = json.value("size", 0ULL);
        item.quick_xor_hash.reset();
        if (auto file = json.find("file"); file != json.end() && file->is_object())
        {
            if (auto hashes = file->find("hashes"); hashes != file->end() && hashes->is_object())
            {
                if (auto hash = hashes->find("quickXorHash"); hash != hashes->end() && hash->is_string())
                {
                    item.quick_xor_hash = hash->get<std::string>();
                }
            }
        }
    }

    std::optional<UploadedItem> parse_uploaded_item(std::string_view body) noexcept
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("id"))
        {
            return std::nullopt;
        }
        try
        {
            return json.get<UploadedItem>();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
    }

    std::string describe_error_body(std::string_view body)
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (!json.is_discarded() && json.is_object())
        {
            if (auto error = json.find("error"); error != json.end() && error->is_object())
            {
                const auto code = error->value("code", std::string{});
                const auto message = error->value("message", std::string{});
                if (!code.empty() || !message.empty())
                {
                    return code.empty() ? message : code + ": " + message;
                }
            }
        }
        if (body.size() > kMaxErrorBody)
        {
            return std::string(body.substr(0, kMaxErrorBody)) + "...";
        }
        return std::string(body);
    }

} // namespace ksau::protocol
