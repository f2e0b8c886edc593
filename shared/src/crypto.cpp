#include "ksau/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace ksau::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    void secure_wipe(std::string &secret) noexcept
    {
        if (!secret.empty())
        {
            sodium_memzero(secret.data(), secret.size());
        }
        secret.clear();
    }

    bool equal_digests(std::span<const std::byte> lhs, std::span<const std::byte> rhs)
    {
        ensure_sodium_init();
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

} // namespace ksau::crypto
