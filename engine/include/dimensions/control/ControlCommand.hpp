#pragma once

#include <cstdint>
#include <string_view>

namespace dimensions::control
{

enum class ControlCommand : std::uint8_t
{
    Players,
    Reload,
    ReloadHandlers,
    ReloadCommands,
    ReloadExtensions,
    PassThrough, ///< 모르는 명령: extension 들에게 넘김
};

/// 정확히 일치(대소문자 구분)할 때만 인식합니다. 인자는 받지 않습니다.
[[nodiscard]] ControlCommand parseControlCommand(std::string_view text) noexcept;

[[nodiscard]] std::string_view controlCommandName(ControlCommand cmd) noexcept;

} // namespace dimensions::control
