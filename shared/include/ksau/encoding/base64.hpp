#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ksau::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns nullopt on characters outside the standard alphabet.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace ksau::encoding
