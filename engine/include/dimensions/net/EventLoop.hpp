#pragma once

#include <dimensions/core/TimerWheel.hpp>
#include <dimensions/net/EpollReactor.hpp>
#include <dimensions/net/FdContext.hpp>
#include <dimensions/net/FdHandler.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <unordered_map>
#include <vector>

namespace dimensions::net
{

/// 프로세스 전체가 공유하는 단일 스레드 이벤트 루프입니다.
///
/// - 리스너, 클라이언트/백엔드 커넥션, Redis 구독, REST 서버가 모두 이 루프 위에서 돕니다.
/// - 모든 API 는 루프를 돌리는 스레드에서만 호출합니다. (크로스 스레드 post 는 없음)
/// - post() 로 넣은 작업은 다음 runOnce() 의 시작/끝에서 FIFO 로 실행됩니다.
///   핸들러 안에서 자기 자신을 파괴해야 하는 경우(리스너 shutdown 등) 이 경로로 미룹니다.
class EventLoop : private dimensions::util::NonCopyable
{
  public:
    using Duration = core::TimerWheel::Duration;
    using Task = std::function<void()>;
    using TimerId = core::TimerWheel::TimerId;

    EventLoop(Duration tickResolution, std::size_t timerSlots, int maxEpollEvents);
    ~EventLoop() = default;

    bool addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept;
    bool updateFd(int fd, std::uint32_t events) noexcept;
    bool removeFd(int fd) noexcept;

    [[nodiscard]] bool hasFd(int fd) const noexcept { return fdContexts_.count(fd) != 0; }
    [[nodiscard]] std::size_t fdCount() const noexcept { return fdContexts_.size(); }

    void post(Task task);

    TimerId addTimer(Duration delay, core::TimerWheel::Callback cb);
    bool cancelTimer(TimerId id) noexcept;

    /// epoll_wait 한 번 + 만료 타이머 + posted 작업
    void runOnce() noexcept;

    /// runningFlag 가 false 가 될 때까지 runOnce() 반복
    void run(const std::atomic_bool &runningFlag) noexcept;

    /// done() 이 true 가 되거나 timeout 이 지날 때까지 돌립니다. (테스트 보조)
    /// @return done() 을 만족했으면 true
    bool runUntil(const std::function<bool()> &done, Duration timeout) noexcept;

    [[nodiscard]] core::TimerWheel &timerWheel() noexcept { return timerWheel_; }

  private:
    EpollReactor reactor_;
    core::TimerWheel timerWheel_;

    std::unordered_map<int, FdContext> fdContexts_;
    std::deque<Task> tasks_;

    void drainTasks_() noexcept;
    void dispatch_(const EpollReactor::ReadyEvent &ev) noexcept;
    [[nodiscard]] int computePollTimeoutMs_() const noexcept;
};

} // namespace dimensions::net
