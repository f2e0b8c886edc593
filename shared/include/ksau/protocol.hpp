/**
 * ksau - Token service and Microsoft Graph payloads with JSON serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ksau::protocol
{

    // Answer of GET {token_endpoint}/token?remote={name}.
    struct RemoteCredentials
    {
        std::string access_token;
        std::string refresh_token;
        std::int64_t expires_in{};
        std::string client_id;
        std::string client_secret;
        std::string drive_id;
        std::string drive_type;
        std::string base_url;
        std::string upload_root_path;
    };

    void to_json(nlohmann::json &json, const RemoteCredentials &credentials);
    void from_json(const nlohmann::json &json, RemoteCredentials &credentials);

    // Overwrites the secret fields in place before they are released.
    void scrub(RemoteCredentials &credentials) noexcept;

    enum class ConflictBehavior : std::uint8_t
    {
        Replace,
        Rename,
        Fail
    };

    std::string_view to_string(ConflictBehavior behavior) noexcept;
    std::optional<ConflictBehavior> conflict_behavior_from_string(std::string_view value) noexcept;

    struct CreateUploadSessionRequest
    {
        ConflictBehavior conflict_behavior{ConflictBehavior::Replace};
    };

    void to_json(nlohmann::json &json, const CreateUploadSessionRequest &request);

    struct UploadSessionResponse
    {
        std::string upload_url;
        std::optional<std::string> expiration;
    };

    void from_json(const nlohmann::json &json, UploadSessionResponse &response);

    // Subset of the driveItem returned once the last range is accepted.
    struct UploadedItem
    {
        std::string id;
        std::string name;
        std::uint64_t size{};
        std::optional<std::string> quick_xor_hash;
    };

    void from_json(const nlohmann::json &json, UploadedItem &item);

    // Parses a final-chunk response body; nullopt when it is not a driveItem.
    std::optional<UploadedItem> parse_uploaded_item(std::string_view body) noexcept;

    // Graph error bodies look like {"error":{"code":"...","message":"..."}}.
    std::string describe_error_body(std::string_view body);

} // namespace ksau::protocol
