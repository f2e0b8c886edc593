#include "ksau/client/chunk_reader.hpp"

#include <algorithm>
#include <system_error>

#include "ksau/error_codes.hpp"

namespace ksau::client
{

    ChunkReader::ChunkReader(const std::filesystem::path &path, std::uint64_t chunk_size)
        : path_(path),
          chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0)
        {
            throw Error(ErrorCode::InvalidArgument, "chunk size must be positive");
        }

        std::error_code ec;
        const auto status = std::filesystem::status(path_, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw Error(ErrorCode::IoError, "file '" + path_.string() + "' does not exist");
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw Error(ErrorCode::IoError, "'" + path_.string() + "' is not a file");
        }

        file_size_ = std::filesystem::file_size(path_, ec);
        if (ec)
        {
            throw Error(ErrorCode::IoError, "cannot stat '" + path_.string() + "': " + ec.message());
        }

        in_.open(path_, std::ios::binary);
        if (!in_.is_open())
        {
            throw Error(ErrorCode::IoError, "could not open '" + path_.string() + "' for reading");
        }

        buffer_.resize(static_cast<std::size_t>(std::min(chunk_size_, file_size_)));
    }

    std::uint64_t ChunkReader::chunk_count() const
    {
        return ksau::chunk_count(file_size_, chunk_size_);
    }

    std::optional<Chunk> ChunkReader::next()
    {
        if (done())
        {
            return std::nullopt;
        }

        auto descriptor = describe_chunk(file_size_, chunk_size_, cursor_);
        const auto length = static_cast<std::size_t>(descriptor.length);
        in_.read(buffer_.data(), static_cast<std::streamsize>(length));
        const auto read_count = static_cast<std::size_t>(in_.gcount());
        if (read_count != length)
        {
            throw Error(ErrorCode::IoError, "read of '" + path_.string() + "' stopped at byte " +
                                                std::to_string(cursor_ + read_count) + " of " +
                                                std::to_string(file_size_) + "; file changed or became unreadable");
        }

        cursor_ = descriptor.end();
        return Chunk{
            .descriptor = std::move(descriptor),
            .data = std::as_bytes(std::span(buffer_.data(), length)),
        };
    }

    void ChunkReader::rewind()
    {
        in_.clear();
        in_.seekg(0, std::ios::beg);
        if (!in_)
        {
            throw Error(ErrorCode::IoError, "cannot rewind '" + path_.string() + "'");
        }
        cursor_ = 0;
    }

} // namespace ksau::client
