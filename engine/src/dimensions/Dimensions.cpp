#include <dimensions/Dimensions.hpp>

#include <dimensions/control/ControlCommand.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/core/LoggingConfig.hpp>

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dimensions
{

namespace
{

DimensionsDeps withDefaults(DimensionsDeps deps)
{
    if (!deps.moduleLoader)
    {
        deps.moduleLoader = std::make_shared<extensions::DlModuleLoader>();
    }
    if (!deps.extensionSource)
    {
        deps.extensionSource = std::make_shared<extensions::StaticExtensionSource>(nullptr);
    }
    if (!deps.listenServerFactory)
    {
        throw std::invalid_argument("[Dimensions] listenServerFactory is required");
    }
    return deps;
}

template <typename T>
std::shared_ptr<T> makeInitialHandler(const std::function<std::shared_ptr<T>()> &factory,
                                      std::string_view kind)
{
    // 슬롯은 처음부터 null 이면 안 되므로 여기 실패는 기동 실패다
    if (!factory)
    {
        throw std::runtime_error("[Dimensions] missing handler factory: " + std::string(kind));
    }
    auto handler = factory();
    if (!handler)
    {
        throw std::runtime_error("[Dimensions] handler factory returned null: " +
                                 std::string(kind));
    }
    return handler;
}

// 문서에 rest_api.port 가 없어도 live 포트가 리스너와 겹칠 수 있으니 병합 결과로 본다
void ensureRestApiPortFree(const core::Options &options,
                           const std::vector<routing::TopologyEntry> &servers)
{
    if (!options.restApi.enabled)
    {
        return;
    }
    for (const auto &entry : servers)
    {
        if (entry.listenPort == options.restApi.port)
        {
            throw std::invalid_argument("[Dimensions] rest_api.port " +
                                        std::to_string(options.restApi.port) +
                                        " collides with a listen_port");
        }
    }
}

SharedState makeSharedState(const core::ProxyConfig &initial,
                            const handlers::HandlerFactories &factories)
{
    SharedState shared{};
    shared.destinations = std::make_shared<routing::DestinationRegistry>();
    shared.serverDetails = std::make_shared<routing::ServerDetailsRegistry>();
    shared.tracking = std::make_shared<routing::GlobalTracking>();
    shared.options = std::make_shared<core::Options>(core::makeOptions(initial.options));

    shared.handlers = std::make_shared<handlers::HandlerRegistry>();
    shared.handlers->command = makeInitialHandler(factories.command, "command");
    shared.handlers->clientPacketHandler =
        makeInitialHandler(factories.clientPacketHandler, "clientPacketHandler");
    shared.handlers->backendPacketHandler =
        makeInitialHandler(factories.backendPacketHandler, "backendPacketHandler");
    return shared;
}

} // namespace

Dimensions::Dimensions(const core::ProxyConfig &initial, DimensionsDeps deps)
    : deps_(withDefaults(std::move(deps))),
      shared_(makeSharedState(initial, deps_.handlerFactories)),
      extensionManager_(deps_.extensionSource, deps_.moduleLoader)
{
    ensureRestApiPortFree(*shared_.options, initial.servers);
    core::applyLogOptions(shared_.options->log);

    for (const auto &entry : initial.servers)
    {
        createListenServer_(entry);
    }

    syncReportingSurface_(*shared_.options);

    shared_.handlers->extensions = extensionManager_.loadAll();

    SLOG_INFO("Dimensions", "Started", "listeners={} destinations={} extensions={}",
              servers_.size(), shared_.destinations->size(), shared_.handlers->extensions.size());
}

Dimensions::~Dimensions()
{
    shutdown();
}

void Dimensions::handleCommand(std::string_view command)
{
    const auto parsed = control::parseControlCommand(command);
    SLOG_INFO("Dimensions", "Command", "cmd='{}' kind={}", command,
              control::controlCommandName(parsed));

    switch (parsed)
    {
    case control::ControlCommand::Players:
        printServerCounts();
        break;

    case control::ControlCommand::Reload:
        (void)reloadServers();
        break;

    case control::ControlCommand::ReloadHandlers:
        (void)reloadClientHandlers();
        (void)reloadBackendHandlers();
        SLOG_INFO("Dimensions", "HandlersReloaded", "Reloaded Packet Handlers.");
        break;

    case control::ControlCommand::ReloadCommands:
        (void)reloadCommandHandler();
        SLOG_INFO("Dimensions", "CommandsReloaded", "Reloaded Command Handler.");
        break;

    case control::ControlCommand::ReloadExtensions:
        reloadExtensions();
        break;

    case control::ControlCommand::PassThrough:
        (void)passOnReloadToExtensions(command);
        break;
    }
}

bool Dimensions::reloadServers()
{
    bool ok = true;

    try
    {
        if (!deps_.configSource)
        {
            throw std::runtime_error("[Dimensions] no config source");
        }

        // 0. 문서 전체가 검증된 뒤에만 live 상태를 건드린다
        const core::ProxyConfig next = deps_.configSource->load();

        core::Options desired = *shared_.options;
        (void)core::applyOptionsPatch(desired, next.options);
        ensureRestApiPortFree(desired, next.servers);
        syncReportingSurface_(desired);

        // 1. 기존 포트는 같은 인스턴스를 갱신, 새 포트는 ticket
        std::vector<ReloadTicket> tickets;
        std::set<std::uint16_t> desiredPorts;
        for (std::size_t i = 0; i < next.servers.size(); ++i)
        {
            const auto &entry = next.servers[i];
            desiredPorts.insert(entry.listenPort);

            const auto it = servers_.find(entry.listenPort);
            if (it != servers_.end())
            {
                it->second->updateInfo(entry);
                registerDestinations_(entry);
            }
            else
            {
                tickets.push_back(ReloadTicket{entry.listenPort, i});
            }
        }

        // 2. 빠진 포트 정리
        for (auto it = servers_.begin(); it != servers_.end();)
        {
            if (desiredPorts.count(it->first) == 0)
            {
                SLOG_INFO("Dimensions", "ListenerRemoved", "port={}", it->first);
                it->second->shutdown();
                it = servers_.erase(it);
            }
            else
            {
                ++it;
            }
        }

        // 3. 새 포트
        for (const auto &ticket : tickets)
        {
            createListenServer_(next.servers[ticket.topologyIndex]);
        }

        // 4. 옵션
        const auto changed = core::applyOptionsPatch(*shared_.options, next.options);
        core::applyLogOptions(shared_.options->log);
        SLOG_DEBUG("Dimensions", "OptionsMerged", "fields={}", changed);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Dimensions", "ReloadFailed", "what='{}'", e.what());
        ok = false;
    }

    SLOG_INFO("Dimensions", "Reloaded", "Reloaded Config.");
    return ok;
}

bool Dimensions::reloadClientHandlers()
{
    return handlers::swapHandler(shared_.handlers->clientPacketHandler,
                                 deps_.handlerFactories.clientPacketHandler,
                                 "clientPacketHandler");
}

bool Dimensions::reloadBackendHandlers()
{
    return handlers::swapHandler(shared_.handlers->backendPacketHandler,
                                 deps_.handlerFactories.backendPacketHandler,
                                 "backendPacketHandler");
}

bool Dimensions::reloadCommandHandler()
{
    return handlers::swapHandler(shared_.handlers->command, deps_.handlerFactories.command,
                                 "command");
}

void Dimensions::reloadExtensions()
{
    try
    {
        extensionManager_.reloadAll(shared_.handlers->extensions);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Dimensions", "ExtensionReloadFailed", "what='{}' loaded={}", e.what(),
                   shared_.handlers->extensions.size());
        return;
    }
    SLOG_INFO("Dimensions", "ExtensionsReloaded", "count={}", shared_.handlers->extensions.size());
}

std::size_t Dimensions::passOnReloadToExtensions(std::string_view command)
{
    return extensionManager_.passOnReload(shared_.handlers->extensions, command);
}

std::string Dimensions::serverCountsReport() const
{
    std::string out;
    for (const auto &[name, server] : *shared_.destinations)
    {
        std::uint32_t count = 0;
        const auto it = shared_.serverDetails->find(name);
        if (it != shared_.serverDetails->end())
        {
            count = it->second.clientCount;
        }
        out += "[" + name + ": " + std::to_string(count) + "] ";
    }
    return out;
}

void Dimensions::printServerCounts() const
{
    SLOG_INFO("Dimensions", "Players", "{}", serverCountsReport());
    SLOG_INFO("Dimensions", "Tracking", "count={} names={}", shared_.tracking->size(),
              shared_.tracking->describe());
}

void Dimensions::attachControlChannel(control::ICommandChannel &channel, std::string name)
{
    channel.setMessageCallback(
        [this, name = std::move(name)](std::string_view ch, std::string_view message) {
            if (ch != name)
            {
                SLOG_DEBUG("Dimensions", "IgnoredMessage", "channel={}", ch);
                return;
            }
            handleCommand(message);
        });
}

void Dimensions::shutdown() noexcept
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;

    for (auto &[port, server] : servers_)
    {
        server->shutdown();
    }
    servers_.clear();
    reporting_.reset();

    extensionManager_.unloadAll(shared_.handlers->extensions);
    SLOG_INFO("Dimensions", "Shutdown", "");
}

void Dimensions::registerDestinations_(const routing::TopologyEntry &entry)
{
    for (const auto &server : entry.routingServers)
    {
        routing::registerDestination(*shared_.destinations, *shared_.serverDetails, server);
    }
}

void Dimensions::createListenServer_(const routing::TopologyEntry &entry)
{
    auto server = deps_.listenServerFactory(entry, shared_);
    if (!server)
    {
        throw std::runtime_error("[Dimensions] listen server factory returned null for port " +
                                 std::to_string(entry.listenPort));
    }
    servers_.emplace(entry.listenPort, std::move(server));
    registerDestinations_(entry);
    SLOG_INFO("Dimensions", "ListenerAdded", "port={} destinations={}", entry.listenPort,
              entry.routingServers.size());
}

void Dimensions::syncReportingSurface_(const core::Options &desired)
{
    if (!desired.restApi.enabled)
    {
        return;
    }
    if (reporting_)
    {
        reporting_->handleReload(desired.restApi.port);
        return;
    }
    if (!deps_.reportingSurfaceFactory)
    {
        SLOG_WARN("Dimensions", "RestApiUnavailable", "port={}", desired.restApi.port);
        return;
    }
    reporting_ = deps_.reportingSurfaceFactory(desired.restApi.port, shared_);
}

} // namespace dimensions
