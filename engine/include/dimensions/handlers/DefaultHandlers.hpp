#pragma once

#include <dimensions/handlers/PacketHandlers.hpp>

namespace dimensions::handlers
{

/// "/dimensions" 목록과 "/<name>" 전송
class ClientCommandHandler final : public ICommandHandler
{
  public:
    bool handle(IClientContext &ctx, std::string_view text, const SharedState &shared) override;
};

/// extension 훅 → ConnectRequest 버전 치환 → PlayerInfo 이름 추적 → "/" 채팅 명령
class ClientPacketHandler final : public IClientPacketHandler
{
  public:
    protocol::PacketVerdict handlePacket(IClientContext &ctx, protocol::Packet &packet,
                                         const SharedState &shared) override;
};

/// extension 훅 → 백엔드 Disconnect 사유 로깅
class BackendPacketHandler final : public IBackendPacketHandler
{
  public:
    protocol::PacketVerdict handlePacket(IClientContext &ctx, protocol::Packet &packet,
                                         const SharedState &shared) override;
};

} // namespace dimensions::handlers
