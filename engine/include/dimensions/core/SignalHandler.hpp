#pragma once

#include <dimensions/util/NonCopyable.hpp>

#include <array>
#include <csignal>
#include <string_view>

#include <signal.h>

namespace dimensions::core
{

/// 프로세스 신호를 플래그로 바꿔 주는 RAII 설치기입니다.
///
/// - SIGINT/SIGTERM: 종료 요청
/// - SIGHUP: 설정 reload 요청 (reloadServers 와 같은 경로)
/// - SIGPIPE: 무시
/// 메인 루프가 매 반복마다 플래그를 확인합니다. 핸들러 안에서는 플래그만 씁니다.
class SignalHandler : private dimensions::util::Pinned
{
  public:
    /// @throws std::system_error sigaction 실패
    SignalHandler();
    ~SignalHandler() noexcept;

    [[nodiscard]] bool isStopRequested() const noexcept;

    /// 요청이 있었다면 플래그를 내리고 true
    bool consumeStopRequest(int *outSignal = nullptr) noexcept;
    bool consumeReloadRequest() noexcept;

    void reset() noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void handleSignal(int signo) noexcept;

    static constexpr std::array<int, 4> kSignals = {SIGINT, SIGTERM, SIGHUP, SIGPIPE};

    std::array<struct sigaction, kSignals.size()> oldActions_{};
    bool installed_{false};

    void installOrThrow();
    void uninstall() noexcept;
};

} // namespace dimensions::core
