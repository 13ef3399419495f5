#pragma once

#include <dimensions/Dimensions.hpp>
#include <dimensions/control/RedisSubscriber.hpp>
#include <dimensions/core/ProxyConfig.hpp>
#include <dimensions/core/SignalHandler.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <memory>

namespace app
{

/// 프로세스 하나 = 이벤트 루프 하나 + orchestrator 하나
///
/// - 생성자에서 루프/리스너/extension/REST 까지 올립니다. 초기 포트 바인드 실패는 예외로 나갑니다.
/// - run() 은 SIGINT/SIGTERM 이 올 때까지 루프를 돌립니다. SIGHUP 은 "reload" 명령으로 바꿉니다.
class DimensionsApplication final : private dimensions::util::NonCopyable
{
  public:
    explicit DimensionsApplication(const dimensions::core::LaunchConfig &cfg);
    ~DimensionsApplication();

    void run();

  private:
    dimensions::core::LaunchConfig cfg_;
    dimensions::core::SignalHandler signals_;
    dimensions::net::EventLoop loop_;
    std::unique_ptr<dimensions::Dimensions> dimensions_;
    std::unique_ptr<dimensions::control::RedisSubscriber> control_;
};

} // namespace app
