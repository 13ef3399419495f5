#pragma once

#include <dimensions/SharedState.hpp>
#include <dimensions/control/CommandChannel.hpp>
#include <dimensions/core/ConfigSource.hpp>
#include <dimensions/core/ProxyConfig.hpp>
#include <dimensions/extensions/ExtensionManager.hpp>
#include <dimensions/handlers/HandlerRegistry.hpp>
#include <dimensions/monitoring/RestApi.hpp>
#include <dimensions/routing/IListenServer.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace dimensions
{

/// orchestrator 가 바깥에서 주입받는 것들. 테스트는 전부 fake 로 바꿉니다.
struct DimensionsDeps
{
    std::shared_ptr<core::IConfigSource> configSource;
    routing::ListenServerFactory listenServerFactory;

    /// 비어 있으면 options.restApi.enabled 여도 REST 표면을 만들지 않습니다.
    monitoring::ReportingSurfaceFactory reportingSurfaceFactory;

    handlers::HandlerFactories handlerFactories;

    /// null 이면 빈 source / DlModuleLoader 를 씁니다.
    std::shared_ptr<extensions::IExtensionSource> extensionSource;
    std::shared_ptr<extensions::IModuleLoader> moduleLoader;
};

/// 프록시 전체를 소유하는 orchestrator
///
/// - 포트별 리스너 맵, 공유 레지스트리(SharedState), 핸들러 슬롯, extension 목록을 가집니다.
/// - 원격 명령(players / reload / reloadhandlers / reloadcmds / reloadextensions)을 처리합니다.
/// - 모든 연산은 이벤트 루프 스레드에서 동기적으로 끝납니다.
class Dimensions final : private dimensions::util::NonCopyable
{
  public:
    using ListenServerMap = std::map<std::uint16_t, std::unique_ptr<routing::IListenServer>>;

    /// 초기 토폴로지로 리스너를 만들고 extension 을 로드합니다.
    /// @throws 리스너 생성 실패(포트 사용 중 등), 핸들러 팩토리 실패
    Dimensions(const core::ProxyConfig &initial, DimensionsDeps deps);
    ~Dimensions();

    /// 원격 명령 한 줄을 처리합니다. 모르는 명령은 extension 에게 넘깁니다.
    void handleCommand(std::string_view command);

    /// 설정을 다시 읽어 리스너 맵을 맞춥니다.
    ///
    /// 0. IConfigSource::load() (여기서 실패하면 아무것도 바뀌지 않음), REST 표면 갱신
    /// 1. 이미 있는 포트: updateInfo + 목적지 등록 / 없는 포트: ticket
    /// 2. 사라진 포트: shutdown() 후 맵에서 제거
    /// 3. ticket 마다 팩토리로 새 리스너 생성 + 목적지 등록
    /// 4. 옵션 patch 병합
    ///
    /// 도중 예외는 로그 후 그 자리에서 중단합니다. 이미 적용된 단계는 되돌리지 않습니다.
    /// @return 끝까지 적용했으면 true
    bool reloadServers();

    bool reloadClientHandlers();
    bool reloadBackendHandlers();
    bool reloadCommandHandler();

    /// 전부 unload 후 source 에서 다시 discover/load
    void reloadExtensions();

    /// @return reload() 를 호출한 extension 수
    std::size_t passOnReloadToExtensions(std::string_view command);

    /// "[name: count] " 를 목적지마다 이어 붙인 한 줄
    [[nodiscard]] std::string serverCountsReport() const;
    void printServerCounts() const;

    /// channel 에서 name 채널로 온 메시지만 handleCommand 로 넘깁니다.
    void attachControlChannel(control::ICommandChannel &channel, std::string name);

    /// 리스너/REST 를 닫고 extension 을 unload 합니다. 여러 번 불러도 안전합니다.
    void shutdown() noexcept;

    [[nodiscard]] const ListenServerMap &listenServers() const noexcept { return servers_; }
    [[nodiscard]] const SharedState &sharedState() const noexcept { return shared_; }
    [[nodiscard]] const core::Options &options() const noexcept { return *shared_.options; }
    [[nodiscard]] const handlers::HandlerRegistry &handlers() const noexcept
    {
        return *shared_.handlers;
    }
    [[nodiscard]] monitoring::IReportingSurface *reportingSurface() const noexcept
    {
        return reporting_.get();
    }

  private:
    /// 한 번의 reload 동안만 사는 "새로 만들어야 할 포트" 기록
    struct ReloadTicket
    {
        std::uint16_t listenPort{0};
        std::size_t topologyIndex{0};
    };

    DimensionsDeps deps_;
    SharedState shared_;
    extensions::ExtensionManager extensionManager_;

    ListenServerMap servers_;
    std::unique_ptr<monitoring::IReportingSurface> reporting_;
    bool stopped_{false};

    void registerDestinations_(const routing::TopologyEntry &entry);
    void createListenServer_(const routing::TopologyEntry &entry);
    void syncReportingSurface_(const core::Options &desired);
};

} // namespace dimensions
