#pragma once

#include <cstdint>

#include <dimensions/net/EpollReactor.hpp>

namespace dimensions::net {

class EventLoop;

/// EventLoop 에 등록되는 모든 fd 의 이벤트 수신자입니다.
///
/// - fd 하나당 핸들러 하나. 이벤트는 등록된 핸들러의 handleEvent() 로만 전달됩니다.
/// - 핸들러는 fd 가 등록되어 있는 동안 살아 있어야 합니다. 닫을 때는 removeFd 를 먼저 호출합니다.
/// - fdTag(): "listener", "connection", "dial", "redis", "rest" 같은 고정 문자열
class IFdHandler {
  public:
    virtual ~IFdHandler() = default;

    [[nodiscard]] virtual const char *fdTag() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t fdDebugId() const noexcept = 0;

    virtual void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) = 0;
};

} // namespace dimensions::net
