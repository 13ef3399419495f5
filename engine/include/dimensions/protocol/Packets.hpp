#pragma once

#include <dimensions/protocol/PacketTypes.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::protocol
{

struct Rgb
{
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};
};

/// NetModules(82) 텍스트 모듈, 클라이언트 → 서버 방향
struct ChatCommand
{
    std::string command; ///< 보통 "Say"
    std::string text;
};

/// 완성된 프레임 바이트로 Packet 을 만듭니다. (3 바이트 미만이면 type 0)
[[nodiscard]] Packet makePacket(std::vector<std::uint8_t> frame);

// ===== parsers: 형식이 맞지 않으면 nullopt =====
[[nodiscard]] std::optional<std::string> parseConnectRequestVersion(const Packet &p);
[[nodiscard]] std::optional<std::string> parsePlayerName(const Packet &p);
[[nodiscard]] std::optional<ChatCommand> parseClientChat(const Packet &p);
[[nodiscard]] std::optional<std::string> parseDisconnectReason(const Packet &p);

// ===== builders =====
[[nodiscard]] std::vector<std::uint8_t> buildConnectRequest(std::string_view version);
[[nodiscard]] std::vector<std::uint8_t> buildDisconnect(std::string_view reason);
[[nodiscard]] std::vector<std::uint8_t> buildChatMessage(std::string_view text, Rgb color = {});
[[nodiscard]] std::vector<std::uint8_t> buildClientChat(std::string_view command,
                                                        std::string_view text);
[[nodiscard]] std::vector<std::uint8_t> buildPlayerInfo(std::uint8_t playerId,
                                                        std::string_view name);

} // namespace dimensions::protocol
