#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dimensions::protocol
{

/// 프록시가 들여다보는 패킷 타입만 정의합니다. 나머지는 type 바이트 그대로 통과.
enum class PacketType : std::uint8_t
{
    ConnectRequest = 1,
    Disconnect = 2,
    PlayerInfo = 4,
    NetModules = 82,
};

inline constexpr std::size_t kFrameHeaderBytes = 3; // u16 length + u8 type
inline constexpr std::size_t kMaxFrameBytes = 0xFFFF;

inline constexpr std::uint16_t kNetModuleText = 1;
inline constexpr std::uint8_t kServerAuthorId = 255;

/// 프레임 하나. data 는 헤더를 포함한 전체 바이트입니다.
/// 핸들러가 data 를 고쳐 쓰면 (길이 헤더 포함) 고친 그대로 전달됩니다.
struct Packet
{
    std::uint8_t type{0};
    std::vector<std::uint8_t> data;

    [[nodiscard]] bool is(PacketType t) const noexcept
    {
        return type == static_cast<std::uint8_t>(t);
    }
};

/// 핸들러 판정: 그대로 전달하거나, 여기서 삼키거나
enum class PacketVerdict : std::uint8_t
{
    Forward = 0,
    Drop,
};

} // namespace dimensions::protocol
