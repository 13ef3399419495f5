#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace dimensions::protocol
{

/// - NeedMore: 프레임이 아직 덜 왔음 (입력 소비 없음)
/// - Framed:   outFrameLen 바이트가 프레임 하나 (헤더 포함)
/// - Invalid:  길이 필드가 3 미만. 호출자가 연결을 닫습니다.
enum class FrameResult : std::uint8_t
{
    NeedMore = 0,
    Framed = 1,
    Invalid = 2,
};

/// [u16 LE total length][u8 type][payload...] 스트림에서 프레임 경계를 잡습니다.
/// 상태가 없으므로 커넥션마다 따로 둘 필요는 없습니다.
class TerrariaFramer
{
  public:
    [[nodiscard]] static FrameResult tryFrame(std::span<const std::uint8_t> in,
                                              std::size_t &outFrameLen) noexcept;

    /// Invalid 의 사유 (고정 문자열)
    [[nodiscard]] static const char *lastErrorReason() noexcept;
};

} // namespace dimensions::protocol
