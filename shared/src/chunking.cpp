#include "ksau/chunking.hpp"

#include <algorithm>
#include <stdexcept>

namespace ksau
{

    std::string content_range(std::uint64_t offset, std::uint64_t length, std::uint64_t total)
    {
        return "bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) + "/" +
               std::to_string(total);
    }

    std::uint64_t chunk_count(std::uint64_t total, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        return total / chunk_size + (total % chunk_size != 0 ? 1 : 0);
    }

    ChunkDescriptor describe_chunk(std::uint64_t total, std::uint64_t chunk_size, std::uint64_t cursor)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (cursor >= total)
        {
            throw std::invalid_argument("chunk cursor past end of file");
        }
        const auto length = std::min(chunk_size, total - cursor);
        return ChunkDescriptor{
            .offset = cursor,
            .length = length,
            .content_range = content_range(cursor, length, total),
        };
    }

    std::vector<ChunkDescriptor> plan_chunks(std::uint64_t total, std::uint64_t chunk_size)
    {
        std::vector<ChunkDescriptor> chunks;
        chunks.reserve(static_cast<std::size_t>(chunk_count(total, chunk_size)));
        for (std::uint64_t cursor = 0; cursor < total;)
        {
            auto descriptor = describe_chunk(total, chunk_size, cursor);
            cursor = descriptor.end();
            chunks.push_back(std::move(descriptor));
        }
        return chunks;
    }

} // namespace ksau
