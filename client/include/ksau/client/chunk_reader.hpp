#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

#include "ksau/chunking.hpp"

namespace ksau::client
{

    struct Chunk
    {
        ChunkDescriptor descriptor;
        // Points into the reader's buffer; valid until the next call to next() or rewind().
        std::span<const std::byte> data;
    };

    // Forward-only reader yielding chunk_size blocks and a shorter final block.
    // The file size is fixed when the reader is opened; a file that shrinks
    // afterwards is reported as an IO error.
    class ChunkReader
    {
    public:
        // Throws Error(ErrorCode::IoError) for missing or non-regular files,
        // Error(ErrorCode::InvalidArgument) for a zero chunk size.
        ChunkReader(const std::filesystem::path &path, std::uint64_t chunk_size);

        std::uint64_t file_size() const noexcept { return file_size_; }
        std::uint64_t chunk_size() const noexcept { return chunk_size_; }
        std::uint64_t position() const noexcept { return cursor_; }
        std::uint64_t chunk_count() const;
        bool done() const noexcept { return cursor_ >= file_size_; }

        std::optional<Chunk> next();

        // Restarts the sequence at offset 0.
        void rewind();

    private:
        std::filesystem::path path_;
        std::ifstream in_;
        std::uint64_t file_size_{};
        std::uint64_t chunk_size_{};
        std::uint64_t cursor_{0};
        std::vector<char> buffer_;
    };

} // namespace ksau::client
