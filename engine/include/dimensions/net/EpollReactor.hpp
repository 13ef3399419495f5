#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include <dimensions/util/NonCopyable.hpp>

namespace dimensions::net
{

/// epoll 인스턴스 하나를 소유하는 thin wrapper 입니다.
/// fd → 핸들러 매핑은 EventLoop 가 들고 있고, 여기서는 epoll_ctl/epoll_wait 만 합니다.
class EpollReactor : private dimensions::util::Pinned
{
  public:
    using Fd = int;

    enum class Event : std::uint32_t
    {
        Read = EPOLLIN,
        Write = EPOLLOUT,
        ReadHangup = EPOLLRDHUP,
        Error = EPOLLERR,
        Hangup = EPOLLHUP,
        EdgeTriggered = EPOLLET,
    };

    struct ReadyEvent
    {
        Fd fd{-1};
        std::uint32_t events{0};

        [[nodiscard]] bool has(Event e) const noexcept
        {
            return (events & static_cast<std::uint32_t>(e)) != 0;
        }
        [[nodiscard]] bool hungUp() const noexcept
        {
            return has(Event::Hangup) || has(Event::ReadHangup);
        }
    };

    // ===== 프록시가 쓰는 등록 마스크 (전부 edge-triggered) =====

    /// 리스닝 소켓: accept 가능 + 오류
    static constexpr std::uint32_t kListenInterest = EPOLLIN | EPOLLET | EPOLLERR | EPOLLHUP;

    /// 클라이언트/백엔드/Redis/REST 스트림. 쓰기 대기는 kWriteInterest 를 더한다.
    static constexpr std::uint32_t kStreamInterest =
        EPOLLIN | EPOLLET | EPOLLRDHUP | EPOLLERR | EPOLLHUP;
    static constexpr std::uint32_t kWriteInterest = EPOLLOUT;

    /// 진행 중인 non-blocking connect: 쓰기 가능해지면 SO_ERROR 로 결과 확인
    static constexpr std::uint32_t kDialInterest = EPOLLOUT | EPOLLET | EPOLLERR | EPOLLHUP;

    /// @throws std::system_error epoll_create1 실패
    explicit EpollReactor(int maxEvents);
    ~EpollReactor() noexcept;

    bool registerFd(Fd fd, std::uint32_t events) noexcept { return control_(Op::Add, fd, events); }
    bool modifyFd(Fd fd, std::uint32_t events) noexcept { return control_(Op::Modify, fd, events); }
    bool unregisterFd(Fd fd) noexcept { return control_(Op::Remove, fd, 0); }

    /// 준비된 이벤트. 다음 wait() 호출 전까지만 유효합니다.
    /// timeout, EINTR, epoll 오류는 모두 빈 span 입니다. (오류는 여기서 로그)
    [[nodiscard]] std::span<const ReadyEvent> wait(int timeoutMs) noexcept;

  private:
    enum class Op
    {
        Add,
        Modify,
        Remove
    };

    Fd epollFd_{-1};
    std::vector<::epoll_event> rawEvents_;
    std::vector<ReadyEvent> ready_;

    bool control_(Op op, Fd fd, std::uint32_t events) noexcept;
};

} // namespace dimensions::net
