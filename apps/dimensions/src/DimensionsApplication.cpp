#include "DimensionsApplication.hpp"

#include <dimensions/core/Logger.hpp>
#include <dimensions/extensions/ExtensionSource.hpp>
#include <dimensions/extensions/ModuleLoader.hpp>
#include <dimensions/monitoring/RestApi.hpp>
#include <dimensions/routing/ListenServer.hpp>

#include <chrono>

namespace app
{

namespace
{
dimensions::DimensionsDeps makeDeps(dimensions::net::EventLoop &loop,
                                    const dimensions::core::LaunchConfig &cfg)
{
    dimensions::DimensionsDeps deps{};
    deps.configSource = std::make_shared<dimensions::core::TomlConfigSource>(cfg.configPath);
    deps.listenServerFactory =
        dimensions::routing::makeListenServerFactory(loop, cfg.engine.listenAddress);
    deps.reportingSurfaceFactory =
        dimensions::monitoring::makeRestApiFactory(loop, cfg.engine.listenAddress);
    deps.handlerFactories = dimensions::handlers::defaultHandlerFactories();

    deps.moduleLoader = std::make_shared<dimensions::extensions::DlModuleLoader>();
    if (!cfg.engine.extensionsDir.empty())
    {
        deps.extensionSource = std::make_shared<dimensions::extensions::DirectoryExtensionSource>(
            cfg.engine.extensionsDir, deps.moduleLoader);
    }
    return deps;
}
} // namespace

DimensionsApplication::DimensionsApplication(const dimensions::core::LaunchConfig &cfg)
    : cfg_(cfg),
      loop_(std::chrono::milliseconds(cfg.engine.tickResolutionMs), cfg.engine.timerSlots,
            static_cast<int>(cfg.engine.maxEpollEvents))
{
    dimensions_ = std::make_unique<dimensions::Dimensions>(cfg_.proxy, makeDeps(loop_, cfg_));

    if (cfg_.control.enabled)
    {
        control_ = std::make_unique<dimensions::control::RedisSubscriber>(loop_, cfg_.control);
        dimensions_->attachControlChannel(*control_, cfg_.control.channel);
        control_->start();
    }
}

DimensionsApplication::~DimensionsApplication()
{
    if (control_)
    {
        control_->stop();
    }
    if (dimensions_)
    {
        dimensions_->shutdown();
    }
}

void DimensionsApplication::run()
{
    SLOG_INFO("Dimensions", "Running", "config={} listeners={} control={}", cfg_.configPath,
              dimensions_->listenServers().size(), cfg_.control.enabled);

    while (!signals_.isStopRequested())
    {
        loop_.runOnce();

        if (signals_.consumeReloadRequest())
        {
            dimensions_->handleCommand("reload");
        }
    }

    int signo = 0;
    (void)signals_.consumeStopRequest(&signo);
    SLOG_INFO("Dimensions", "StopRequested", "signal={}",
              dimensions::core::SignalHandler::signalName(signo));

    if (control_)
    {
        control_->stop();
    }
    dimensions_->shutdown();

    // 리스너가 미뤄 둔 세션 파괴를 마저 처리
    loop_.runOnce();
}

} // namespace app
