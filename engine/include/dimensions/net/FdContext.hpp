#pragma once

#include <cstdint>

namespace dimensions::net {

class IFdHandler;

/// EventLoop 가 fd 마다 들고 있는 라우팅/디버깅 정보입니다.
///
/// 디스패치 직전에 fd 로 다시 조회하므로, 같은 epoll_wait 배치 안에서 먼저 처리된 핸들러가
/// 다른 fd 를 removeFd 해도 뒤따르는 지연 이벤트는 버려집니다.
struct FdContext {
    int fd{-1};
    IFdHandler *handler{nullptr}; ///< non-owning
    const char *tag{"unknown"};
    std::uint64_t debugId{0};
    std::uint32_t registeredEvents{0};
};

} // namespace dimensions::net
