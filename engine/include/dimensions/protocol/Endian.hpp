#pragma once

#include <cstdint>

namespace dimensions::protocol
{
// Terraria 와이어 포맷은 전부 little-endian 입니다.

inline void storeU16Le(std::uint16_t v, std::uint8_t out[2]) noexcept
{
    out[0] = static_cast<std::uint8_t>(v & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
}

inline void storeU32Le(std::uint32_t v, std::uint8_t out[4]) noexcept
{
    out[0] = static_cast<std::uint8_t>(v & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    out[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

inline std::uint16_t loadU16Le(const std::uint8_t *p) noexcept
{
    return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) |
                                      (static_cast<std::uint16_t>(p[1]) << 8));
}

inline std::uint32_t loadU32Le(const std::uint8_t *p) noexcept
{
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

} // namespace dimensions::protocol
