/**
 * ksau - Byte-range planning for upload sessions.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ksau
{

    constexpr std::uint64_t kBytesPerMegabyte = 1024ULL * 1024ULL;

    // Graph expects every range except the last to be a multiple of 320 KiB.
    constexpr std::uint64_t kRangeAlignment = 320ULL * 1024ULL;

    struct ChunkDescriptor
    {
        std::uint64_t offset{};
        std::uint64_t length{};
        std::string content_range;

        std::uint64_t end() const noexcept { return offset + length; }

        bool operator==(const ChunkDescriptor &) const = default;
    };

    // "bytes {first}-{last}/{total}" with an inclusive last byte.
    std::string content_range(std::uint64_t offset, std::uint64_t length, std::uint64_t total);

    // ceil(total / chunk_size); zero for an empty file.
    std::uint64_t chunk_count(std::uint64_t total, std::uint64_t chunk_size);

    // Descriptor for the chunk starting at cursor. Throws std::invalid_argument
    // when chunk_size is zero or cursor is not below total.
    ChunkDescriptor describe_chunk(std::uint64_t total, std::uint64_t chunk_size, std::uint64_t cursor);

    std::vector<ChunkDescriptor> plan_chunks(std::uint64_t total, std::uint64_t chunk_size);

} // namespace ksau
