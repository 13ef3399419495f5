#include <dimensions/handlers/DefaultHandlers.hpp>

#include <dimensions/SharedState.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/protocol/Packets.hpp>

#include <string>

namespace dimensions::handlers
{

namespace
{

protocol::PacketVerdict runClientHooks(IClientContext &ctx, protocol::Packet &packet,
                                       const HandlerRegistry &registry)
{
    // 훅이 reloadextensions 를 유발해도 현재 extension 은 끝까지 살아 있게 로컬로 잡는다.
    for (std::size_t i = 0; i < registry.extensions.size(); ++i)
    {
        const auto &ext = registry.extensions[i];
        if (!ext.clientHook)
        {
            continue;
        }
        auto keepAlive = ext.instance;
        if (ext.clientHook->onPacket(ctx, packet) == protocol::PacketVerdict::Drop)
        {
            return protocol::PacketVerdict::Drop;
        }
    }
    return protocol::PacketVerdict::Forward;
}

protocol::PacketVerdict onPlayerInfo(IClientContext &ctx, const protocol::Packet &packet,
                                     const SharedState &shared)
{
    const auto name = protocol::parsePlayerName(packet);
    if (!name || name->empty())
    {
        return protocol::PacketVerdict::Forward;
    }

    const routing::TrackedPlayer who{ctx.clientId(), ctx.listenPort(), ctx.currentDestination()};
    const auto result = shared.tracking->claimName(*name, who);

    if (result == routing::GlobalTracking::ClaimResult::Taken)
    {
        SLOG_INFO("ClientPacketHandler", "NameInUse", "cid={} name='{}'", ctx.clientId(), *name);
        ctx.disconnect("Name is already in use");
        return protocol::PacketVerdict::Drop;
    }

    const std::string previous = ctx.playerName();
    if (!previous.empty() && previous != *name)
    {
        (void)shared.tracking->releaseName(previous, ctx.clientId());
    }
    ctx.setPlayerName(*name);
    return protocol::PacketVerdict::Forward;
}

} // namespace

protocol::PacketVerdict ClientPacketHandler::handlePacket(IClientContext &ctx,
                                                          protocol::Packet &packet,
                                                          const SharedState &shared)
{
    const auto &registry = *shared.handlers;

    if (runClientHooks(ctx, packet, registry) == protocol::PacketVerdict::Drop)
    {
        return protocol::PacketVerdict::Drop;
    }

    if (packet.is(protocol::PacketType::ConnectRequest))
    {
        if (shared.options->fakeVersion.enabled)
        {
            const auto version = "Terraria" + std::to_string(shared.options->fakeVersion.version);
            packet.data = protocol::buildConnectRequest(version);
        }
        return protocol::PacketVerdict::Forward;
    }

    if (packet.is(protocol::PacketType::PlayerInfo))
    {
        return onPlayerInfo(ctx, packet, shared);
    }

    if (packet.is(protocol::PacketType::NetModules))
    {
        const auto chat = protocol::parseClientChat(packet);
        if (chat && chat->command == "Say" && !chat->text.empty() && chat->text.front() == '/')
        {
            // 패킷 도중 reloadcmds 가 와도 이 명령은 지금 잡은 핸들러로 끝낸다
            auto command = registry.command;
            if (command && command->handle(ctx, chat->text, shared))
            {
                return protocol::PacketVerdict::Drop;
            }
        }
    }

    return protocol::PacketVerdict::Forward;
}

} // namespace dimensions::handlers
