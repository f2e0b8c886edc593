#include "ksau/quickxor.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "ksau/encoding/base64.hpp"
#include "ksau/error_codes.hpp"

namespace ksau
{

    namespace
    {
        constexpr std::size_t kWidthInBits = 160;
        constexpr std::size_t kShift = 11;
        constexpr std::size_t kBitsInLastCell = 32;

        void store_le(std::uint64_t value, std::byte *out, std::size_t count)
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                out[i] = static_cast<std::byte>((value >> (8 * i)) & 0xFFu);
            }
        }
    } // namespace

    void QuickXorHash::update(std::span<const std::byte> data)
    {
        std::size_t cell = shift_ / 64;
        std::size_t offset = shift_ % 64;

        // Bytes 160 apart land on the same bit position, so each of the first
        // 160 positions folds its whole column in one go.
        const auto columns = std::min(data.size(), kWidthInBits);
        for (std::size_t i = 0; i < columns; ++i)
        {
            const bool last_cell = cell == cells_.size() - 1;
            const std::size_t cell_bits = last_cell ? kBitsInLastCell : 64;

            if (offset <= cell_bits - 8)
            {
                for (std::size_t j = i; j < data.size(); j += kWidthInBits)
                {
                    cells_[cell] ^= static_cast<std::uint64_t>(data[j]) << offset;
                }
            }
            else
            {
                const std::size_t next = last_cell ? 0 : cell + 1;
                const std::size_t low = cell_bits - offset;
                std::uint8_t folded = 0;
                for (std::size_t j = i; j < data.size(); j += kWidthInBits)
                {
                    folded ^= static_cast<std::uint8_t>(data[j]);
                }
                cells_[cell] ^= static_cast<std::uint64_t>(folded) << offset;
                cells_[next] ^= static_cast<std::uint64_t>(folded) >> low;
            }

            offset += kShift;
            while (offset >= cell_bits)
            {
                cell = last_cell ? 0 : cell + 1;
                offset -= cell_bits;
            }
        }

        shift_ = (shift_ + kShift * (data.size() % kWidthInBits)) % kWidthInBits;
        length_ += data.size();
    }

    QuickXorHash::Digest QuickXorHash::digest() const
    {
        Digest out{};
        store_le(cells_[0], out.data(), 8);
        store_le(cells_[1], out.data() + 8, 8);
        store_le(cells_[2], out.data() + 16, kDigestSize - 16);

        std::array<std::byte, 8> length_bytes{};
        store_le(length_, length_bytes.data(), length_bytes.size());
        for (std::size_t i = 0; i < length_bytes.size(); ++i)
        {
            out[kDigestSize - length_bytes.size() + i] ^= length_bytes[i];
        }
        return out;
    }

    std::string QuickXorHash::digest_base64() const
    {
        const auto bytes = digest();
        return encoding::encode_base64(bytes);
    }

    void QuickXorHash::reset() noexcept
    {
        cells_.fill(0);
        length_ = 0;
        shift_ = 0;
    }

    std::string quickxor_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw Error(ErrorCode::IoError, "Failed to open file for hashing: " + path.string());
        }

        QuickXorHash hash;
        std::vector<char> buffer(64 * 1024);
        while (file)
        {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(file.gcount());
            if (read_count > 0)
            {
                hash.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        if (file.bad())
        {
            throw Error(ErrorCode::IoError, "Read failed while hashing: " + path.string());
        }
        return hash.digest_base64();
    }

} // namespace ksau
