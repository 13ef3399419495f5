#include <dimensions/protocol/Packets.hpp>

#include <dimensions/protocol/PacketReader.hpp>
#include <dimensions/protocol/PacketWriter.hpp>

#include <span>
#include <utility>

namespace dimensions::protocol
{

namespace
{

constexpr std::uint8_t kNetworkTextLiteral = 0;
constexpr int kMaxNetworkTextDepth = 4;

PacketReader payloadReader(const Packet &p) noexcept
{
    if (p.data.size() < kFrameHeaderBytes)
    {
        return PacketReader{};
    }
    return PacketReader{std::span<const std::uint8_t>(p.data).subspan(kFrameHeaderBytes)};
}

// NetworkText: u8 mode + string, literal 이 아니면 u8 count + 하위 NetworkText 들
bool readNetworkText(PacketReader &r, std::string &out, int depth)
{
    std::uint8_t mode = 0;
    std::string_view text;
    if (!r.readU8(mode) || !r.readString(text))
    {
        return false;
    }
    out.assign(text);

    if (mode == kNetworkTextLiteral)
    {
        return true;
    }
    if (depth >= kMaxNetworkTextDepth)
    {
        return false;
    }

    std::uint8_t count = 0;
    if (!r.readU8(count))
    {
        return false;
    }
    for (std::uint8_t i = 0; i < count; ++i)
    {
        std::string ignored;
        if (!readNetworkText(r, ignored, depth + 1))
        {
            return false;
        }
    }
    return true;
}

void writeLiteralText(PacketWriter &w, std::string_view text)
{
    w.writeU8(kNetworkTextLiteral);
    w.writeString(text);
}

} // namespace

Packet makePacket(std::vector<std::uint8_t> frame)
{
    Packet p{};
    p.type = frame.size() >= kFrameHeaderBytes ? frame[2] : 0;
    p.data = std::move(frame);
    return p;
}

std::optional<std::string> parseConnectRequestVersion(const Packet &p)
{
    if (!p.is(PacketType::ConnectRequest))
    {
        return std::nullopt;
    }
    auto r = payloadReader(p);
    std::string_view version;
    if (!r.readString(version))
    {
        return std::nullopt;
    }
    return std::string(version);
}

std::optional<std::string> parsePlayerName(const Packet &p)
{
    if (!p.is(PacketType::PlayerInfo))
    {
        return std::nullopt;
    }
    auto r = payloadReader(p);
    std::string_view name;
    // playerId, skinVariant, hair 다음이 이름
    if (!r.skip(3) || !r.readString(name))
    {
        return std::nullopt;
    }
    return std::string(name);
}

std::optional<ChatCommand> parseClientChat(const Packet &p)
{
    if (!p.is(PacketType::NetModules))
    {
        return std::nullopt;
    }
    auto r = payloadReader(p);
    std::uint16_t module = 0;
    std::string_view command;
    std::string_view text;
    if (!r.readU16Le(module) || module != kNetModuleText)
    {
        return std::nullopt;
    }
    if (!r.readString(command) || !r.readString(text))
    {
        return std::nullopt;
    }
    return ChatCommand{std::string(command), std::string(text)};
}

std::optional<std::string> parseDisconnectReason(const Packet &p)
{
    if (!p.is(PacketType::Disconnect))
    {
        return std::nullopt;
    }
    auto r = payloadReader(p);
    std::string reason;
    if (!readNetworkText(r, reason, 0))
    {
        return std::nullopt;
    }
    return reason;
}

std::vector<std::uint8_t> buildConnectRequest(std::string_view version)
{
    PacketWriter w(PacketType::ConnectRequest);
    w.writeString(version);
    return w.finish();
}

std::vector<std::uint8_t> buildDisconnect(std::string_view reason)
{
    PacketWriter w(PacketType::Disconnect);
    writeLiteralText(w, reason);
    return w.finish();
}

std::vector<std::uint8_t> buildChatMessage(std::string_view text, Rgb color)
{
    PacketWriter w(PacketType::NetModules);
    w.writeU16Le(kNetModuleText);
    w.writeU8(kServerAuthorId);
    writeLiteralText(w, text);
    w.writeU8(color.r);
    w.writeU8(color.g);
    w.writeU8(color.b);
    return w.finish();
}

std::vector<std::uint8_t> buildClientChat(std::string_view command, std::string_view text)
{
    PacketWriter w(PacketType::NetModules);
    w.writeU16Le(kNetModuleText);
    w.writeString(command);
    w.writeString(text);
    return w.finish();
}

std::vector<std::uint8_t> buildPlayerInfo(std::uint8_t playerId, std::string_view name)
{
    PacketWriter w(PacketType::PlayerInfo);
    w.writeU8(playerId);
    w.writeU8(0); // skin variant
    w.writeU8(0); // hair
    w.writeString(name);
    // hair dye, hide visuals(2), hide misc, 색상 7개(rgb), difficulty, torch flags
    for (int i = 0; i < 4 + 21 + 3; ++i)
    {
        w.writeU8(0);
    }
    return w.finish();
}

} // namespace dimensions::protocol
