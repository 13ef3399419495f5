#pragma once

#include <dimensions/protocol/Endian.hpp>
#include <dimensions/protocol/PacketTypes.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace dimensions::protocol
{

/// 프레임 하나를 조립합니다. 생성 시 헤더 자리를 잡고 finish() 에서 길이를 채웁니다.
class PacketWriter
{
  public:
    explicit PacketWriter(std::uint8_t type)
    {
        buf_.reserve(64);
        buf_.push_back(0);
        buf_.push_back(0);
        buf_.push_back(type);
    }

    explicit PacketWriter(PacketType type) : PacketWriter(static_cast<std::uint8_t>(type)) {}

    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }

    void writeU8(std::uint8_t v) { buf_.push_back(v); }

    void writeU16Le(std::uint16_t v)
    {
        std::uint8_t tmp[2];
        storeU16Le(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 2);
    }

    void writeU32Le(std::uint32_t v)
    {
        std::uint8_t tmp[4];
        storeU32Le(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 4);
    }

    void writeBytes(const void *p, std::size_t n)
    {
        if (n == 0)
            return;
        const auto *b = static_cast<const std::uint8_t *>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    void writeString(std::string_view s)
    {
        auto len = static_cast<std::uint32_t>(s.size());
        while (len >= 0x80)
        {
            buf_.push_back(static_cast<std::uint8_t>((len & 0x7F) | 0x80));
            len >>= 7;
        }
        buf_.push_back(static_cast<std::uint8_t>(len));
        writeBytes(s.data(), s.size());
    }

    /// 길이 헤더를 채우고 버퍼를 넘깁니다.
    /// @throws std::length_error 프레임이 u16 범위를 넘을 때
    [[nodiscard]] std::vector<std::uint8_t> finish()
    {
        if (buf_.size() > kMaxFrameBytes)
        {
            throw std::length_error("PacketWriter: frame exceeds 65535 bytes");
        }
        storeU16Le(static_cast<std::uint16_t>(buf_.size()), buf_.data());
        return std::move(buf_);
    }

  private:
    std::vector<std::uint8_t> buf_;
};

} // namespace dimensions::protocol
