#pragma once

#include <dimensions/SharedState.hpp>
#include <dimensions/routing/Topology.hpp>

#include <cstdint>
#include <functional>
#include <memory>

namespace dimensions::routing
{

/// 포트 하나에 바인드된 리스너. orchestrator 는 이 인터페이스로만 다룹니다.
class IListenServer
{
  public:
    virtual ~IListenServer() = default;

    [[nodiscard]] virtual std::uint16_t port() const noexcept = 0;

    /// 백엔드 풀을 교체합니다. 기존 세션은 지금 붙은 백엔드를 유지합니다.
    virtual void updateInfo(const TopologyEntry &entry) = 0;

    /// 리스닝 소켓과 세션을 닫습니다. 드레인을 기다리지 않습니다.
    virtual void shutdown() noexcept = 0;
};

/// @throws 바인드 실패 등 생성 실패는 예외로 전파됩니다. (reload 패스를 중단시킴)
using ListenServerFactory =
    std::function<std::unique_ptr<IListenServer>(const TopologyEntry &, const SharedState &)>;

} // namespace dimensions::routing
