#include <dimensions/handlers/DefaultHandlers.hpp>

#include <dimensions/SharedState.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/protocol/Packets.hpp>

#include <format>
#include <string>

namespace dimensions::handlers
{

namespace
{

constexpr protocol::Rgb kInfoColor{255, 240, 20};
constexpr protocol::Rgb kErrorColor{255, 60, 60};

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

std::string listDimensions(const SharedState &shared)
{
    std::string out = "Available dimensions:";
    bool any = false;
    for (const auto &[name, server] : *shared.destinations)
    {
        if (!server || server->hidden)
        {
            continue;
        }
        std::uint32_t clients = 0;
        if (auto it = shared.serverDetails->find(name); it != shared.serverDetails->end())
        {
            clients = it->second.clientCount;
        }
        out += std::format(" {} ({})", name, clients);
        any = true;
    }
    if (!any)
    {
        out += " (none)";
    }
    return out;
}

} // namespace

bool ClientCommandHandler::handle(IClientContext &ctx, std::string_view text,
                                  const SharedState &shared)
{
    if (text.empty() || text.front() != '/')
    {
        return false;
    }

    const auto name = trim(text.substr(1));
    if (name.empty())
    {
        return false;
    }

    if (name == "dimensions")
    {
        (void)ctx.sendToClient(protocol::buildChatMessage(listDimensions(shared), kInfoColor));
        return true;
    }

    const std::string target(name);
    if (shared.destinations->find(target) == shared.destinations->end())
    {
        // 모르는 명령은 백엔드 서버 명령일 수 있으니 넘긴다
        return false;
    }

    if (ctx.currentDestination() == target)
    {
        (void)ctx.sendToClient(
            protocol::buildChatMessage(std::format("You are already in {}", target), kInfoColor));
        return true;
    }

    if (auto it = shared.serverDetails->find(target);
        it != shared.serverDetails->end() && it->second.disabled)
    {
        (void)ctx.sendToClient(protocol::buildChatMessage(
            std::format("{} is unavailable right now", target), kErrorColor));
        return true;
    }

    SLOG_INFO("ClientCommandHandler", "Transfer", "cid={} name='{}' from={} to={}",
              ctx.clientId(), ctx.playerName(), ctx.currentDestination(), target);

    if (!ctx.requestTransfer(target))
    {
        (void)ctx.sendToClient(protocol::buildChatMessage(
            std::format("Could not move you to {}", target), kErrorColor));
    }
    return true;
}

HandlerFactories defaultHandlerFactories()
{
    HandlerFactories f;
    f.command = []() -> std::shared_ptr<ICommandHandler> {
        return std::make_shared<ClientCommandHandler>();
    };
    f.clientPacketHandler = []() -> std::shared_ptr<IClientPacketHandler> {
        return std::make_shared<ClientPacketHandler>();
    };
    f.backendPacketHandler = []() -> std::shared_ptr<IBackendPacketHandler> {
        return std::make_shared<BackendPacketHandler>();
    };
    return f;
}

} // namespace dimensions::handlers
