#include <dimensions/handlers/DefaultHandlers.hpp>

#include <dimensions/SharedState.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/protocol/Packets.hpp>

namespace dimensions::handlers
{

protocol::PacketVerdict BackendPacketHandler::handlePacket(IClientContext &ctx,
                                                           protocol::Packet &packet,
                                                           const SharedState &shared)
{
    const auto &registry = *shared.handlers;
    for (std::size_t i = 0; i < registry.extensions.size(); ++i)
    {
        const auto &ext = registry.extensions[i];
        if (!ext.backendHook)
        {
            continue;
        }
        auto keepAlive = ext.instance;
        if (ext.backendHook->onPacket(ctx, packet) == protocol::PacketVerdict::Drop)
        {
            return protocol::PacketVerdict::Drop;
        }
    }

    if (packet.is(protocol::PacketType::Disconnect) &&
        core::channelEnabled(core::LogChannel::BackendError))
    {
        const auto reason = protocol::parseDisconnectReason(packet);
        SLOG_CH_WARN(core::LogChannel::BackendError, "BackendPacketHandler", "BackendKick",
                     "cid={} name='{}' dimension={} reason='{}'", ctx.clientId(),
                     ctx.playerName(), ctx.currentDestination(), reason ? *reason : "(unparsed)");
    }

    return protocol::PacketVerdict::Forward;
}

} // namespace dimensions::handlers
