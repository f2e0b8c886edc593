/**
 * ksau - QuickXorHash, the content checksum OneDrive reports for uploaded files.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace ksau
{

    // Streaming 160-bit QuickXorHash. The result does not depend on how the
    // input is split across update() calls. Not thread-safe.
    class QuickXorHash
    {
    public:
        static constexpr std::size_t kDigestSize = 20;
        using Digest = std::array<std::byte, kDigestSize>;

        void update(std::span<const std::byte> data);

        Digest digest() const;

        std::string digest_base64() const;

        std::uint64_t bytes_consumed() const noexcept { return length_; }

        void reset() noexcept;

    private:
        std::array<std::uint64_t, 3> cells_{};
        std::uint64_t length_{0};
        std::size_t shift_{0};
    };

    // Base64 QuickXorHash of a whole file, read in one pass.
    std::string quickxor_file(const std::filesystem::path &path);

} // namespace ksau
