#pragma once

#include <dimensions/protocol/Endian.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace dimensions::protocol
{

/// Terraria 페이로드를 앞에서부터 읽는 커서입니다.
/// - 모든 read 는 남은 바이트가 부족하면 false 를 반환하고 위치를 옮기지 않습니다.
/// - readString 이 돌려주는 string_view 는 원본 버퍼가 살아 있는 동안만 유효합니다.
class PacketReader
{
  public:
    PacketReader() noexcept = default;
    explicit PacketReader(std::span<const std::uint8_t> bytes) noexcept : data_(bytes) {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool eof() const noexcept { return pos_ == data_.size(); }

    bool skip(std::size_t n) noexcept
    {
        if (remaining() < n)
            return false;
        pos_ += n;
        return true;
    }

    bool readU8(std::uint8_t &out) noexcept
    {
        if (remaining() < 1)
            return false;
        out = data_[pos_];
        pos_ += 1;
        return true;
    }

    bool readU16Le(std::uint16_t &out) noexcept
    {
        if (remaining() < 2)
            return false;
        out = loadU16Le(data_.data() + pos_);
        pos_ += 2;
        return true;
    }

    bool readU32Le(std::uint32_t &out) noexcept
    {
        if (remaining() < 4)
            return false;
        out = loadU32Le(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    /// .NET BinaryWriter 형식: 7-bit 가변 길이 + UTF-8 바이트
    bool readString(std::string_view &out) noexcept
    {
        const std::size_t start = pos_;
        std::uint32_t len = 0;
        int shift = 0;
        for (;;)
        {
            std::uint8_t b = 0;
            if (!readU8(b) || shift > 28)
            {
                pos_ = start;
                return false;
            }
            len |= static_cast<std::uint32_t>(b & 0x7F) << shift;
            if ((b & 0x80) == 0)
                break;
            shift += 7;
        }

        if (remaining() < len)
        {
            pos_ = start;
            return false;
        }
        out = std::string_view(reinterpret_cast<const char *>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

  private:
    std::span<const std::uint8_t> data_{};
    std::size_t pos_{0};
};

} // namespace dimensions::protocol
