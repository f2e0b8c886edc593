/**
 * ksau - Secret-handling helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace ksau::crypto
{

    void ensure_sodium_init();

    // Zeroes the string's storage and leaves it empty.
    void secure_wipe(std::string &secret) noexcept;

    // Constant-time comparison; false when the sizes differ.
    bool equal_digests(std::span<const std::byte> lhs, std::span<const std::byte> rhs);

} // namespace ksau::crypto
