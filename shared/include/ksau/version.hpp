#pragma once

#include <string_view>

namespace ksau
{

    constexpr std::string_view version() noexcept
    {
        return "0.3.0";
    }

} // namespace ksau
