#pragma once

#include <dimensions/handlers/ClientContext.hpp>
#include <dimensions/protocol/PacketTypes.hpp>

#include <string_view>

namespace dimensions
{
struct SharedState;
}

namespace dimensions::handlers
{

/// 채팅의 "/..." 명령을 처리합니다. true 를 돌려주면 백엔드로 전달하지 않습니다.
class ICommandHandler
{
  public:
    virtual ~ICommandHandler() = default;
    virtual bool handle(IClientContext &ctx, std::string_view text, const SharedState &shared) = 0;
};

/// 클라이언트 → 백엔드 방향 패킷
class IClientPacketHandler
{
  public:
    virtual ~IClientPacketHandler() = default;
    virtual protocol::PacketVerdict handlePacket(IClientContext &ctx, protocol::Packet &packet,
                                                 const SharedState &shared) = 0;
};

/// 백엔드 → 클라이언트 방향 패킷
class IBackendPacketHandler
{
  public:
    virtual ~IBackendPacketHandler() = default;
    virtual protocol::PacketVerdict handlePacket(IClientContext &ctx, protocol::Packet &packet,
                                                 const SharedState &shared) = 0;
};

} // namespace dimensions::handlers
