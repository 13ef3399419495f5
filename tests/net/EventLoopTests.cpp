#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/FdHandler.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

using dimensions::net::EpollReactor;
using dimensions::net::EventLoop;
using dimensions::net::IFdHandler;

namespace {

using namespace std::chrono_literals;

/// eventfd 를 읽어 카운터를 올리는 핸들러. ET 규약대로 EAGAIN 까지 drain 합니다.
class CountingEventfdHandler final : public IFdHandler {
  public:
    explicit CountingEventfdHandler(int fd) : fd_(fd) {}

    const char *fdTag() const noexcept override { return "eventfd_test"; }
    std::uint64_t fdDebugId() const noexcept override { return 7; }

    void handleEvent(EventLoop &, const EpollReactor::ReadyEvent &ev) override {
        if (!ev.has(EpollReactor::Event::Read)) {
            return;
        }
        for (;;) {
            std::uint64_t v = 0;
            const ssize_t n = ::read(fd_, &v, sizeof(v));
            if (n == static_cast<ssize_t>(sizeof(v))) {
                total += v;
                ++wakeups;
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
    }

    std::uint64_t total{0};
    int wakeups{0};

  private:
    int fd_{-1};
};

/// 등록한 fd 의 이벤트가 그 fd 의 핸들러로 전달되어야 합니다.
bool test_fd_event_routes_to_handler() {
    EventLoop loop(10ms, 64, 16);

    const int efd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (efd < 0) {
        std::cerr << "[route] eventfd failed errno=" << errno << "\n";
        return false;
    }

    CountingEventfdHandler handler(efd);
    if (!loop.addFd(efd, EpollReactor::kStreamInterest, &handler) || !loop.hasFd(efd)) {
        std::cerr << "[route] addFd failed\n";
        ::close(efd);
        return false;
    }

    const std::uint64_t one = 3;
    (void)::write(efd, &one, sizeof(one));

    const bool done = loop.runUntil([&]() { return handler.total == 3; }, 1000ms);

    (void)loop.removeFd(efd);
    ::close(efd);

    if (!done) {
        std::cerr << "[route] handler total=" << handler.total << " (expected 3)\n";
        return false;
    }
    if (loop.hasFd(efd) || loop.fdCount() != 0) {
        std::cerr << "[route] fd still registered after removeFd\n";
        return false;
    }
    return true;
}

/// 핸들러가 없거나 fd 가 음수면 addFd 가 거절합니다.
bool test_add_fd_rejects_invalid() {
    EventLoop loop(10ms, 64, 16);
    CountingEventfdHandler handler(-1);

    if (loop.addFd(-1, EPOLLIN, &handler)) {
        std::cerr << "[invalid] addFd(-1) accepted\n";
        return false;
    }
    if (loop.addFd(0, EPOLLIN, nullptr)) {
        std::cerr << "[invalid] addFd(null handler) accepted\n";
        return false;
    }
    if (loop.removeFd(12345)) {
        std::cerr << "[invalid] removeFd of unknown fd returned true\n";
        return false;
    }
    return loop.fdCount() == 0;
}

/// post 작업은 FIFO. 실행 중에 post 된 작업은 다음 배치로 넘어갑니다.
bool test_post_order_and_nested_post() {
    EventLoop loop(10ms, 64, 16);
    std::vector<int> order;

    loop.post([&]() {
        order.push_back(1);
        loop.post([&]() { order.push_back(3); });
    });
    loop.post([&]() { order.push_back(2); });

    loop.runOnce();

    if (order.size() < 2 || order[0] != 1 || order[1] != 2) {
        std::cerr << "[post] unexpected order after first batch\n";
        return false;
    }

    if (!loop.runUntil([&]() { return order.size() == 3; }, 500ms) || order[2] != 3) {
        std::cerr << "[post] nested post did not run\n";
        return false;
    }
    return true;
}

/// 작업이 예외를 던져도 루프는 계속 돌고 다음 작업이 실행됩니다.
bool test_task_exception_is_contained() {
    EventLoop loop(10ms, 64, 16);
    bool after = false;

    loop.post([]() { throw std::runtime_error("boom"); });
    loop.post([&]() { after = true; });

    loop.runOnce();
    if (!after) {
        std::cerr << "[exception] task after the throwing one did not run\n";
        return false;
    }
    return true;
}

/// 타이머는 실제 시간으로 만료되고, 취소한 타이머는 실행되지 않습니다.
bool test_timers_fire_through_run_until() {
    EventLoop loop(10ms, 64, 16);
    bool fired = false;
    bool cancelledFired = false;

    (void)loop.addTimer(30ms, [&]() { fired = true; });
    const auto id = loop.addTimer(30ms, [&]() { cancelledFired = true; });
    if (!loop.cancelTimer(id)) {
        std::cerr << "[timer] cancelTimer returned false\n";
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    if (!loop.runUntil([&]() { return fired; }, 1000ms)) {
        std::cerr << "[timer] timer did not fire within 1s\n";
        return false;
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed < 20ms) {
        std::cerr << "[timer] fired too early\n";
        return false;
    }

    loop.runUntil([]() { return false; }, 60ms);
    if (cancelledFired) {
        std::cerr << "[timer] cancelled timer fired\n";
        return false;
    }
    return true;
}

/// 빈 reactor 의 wait 는 timeout 후 빈 span, eventfd 에 쓰면 Read 로 한 건 보고됩니다.
bool test_reactor_wait_reports_ready_events() {
    EpollReactor reactor(8);
    if (!reactor.wait(0).empty()) {
        std::cerr << "[reactor] idle wait returned events\n";
        return false;
    }

    const int efd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (efd < 0 || !reactor.registerFd(efd, EpollReactor::kStreamInterest)) {
        std::cerr << "[reactor] register failed\n";
        if (efd >= 0) {
            ::close(efd);
        }
        return false;
    }
    if (reactor.registerFd(efd, EpollReactor::kStreamInterest)) {
        std::cerr << "[reactor] duplicate register accepted\n";
        ::close(efd);
        return false;
    }

    const std::uint64_t one = 1;
    (void)::write(efd, &one, sizeof(one));

    const auto ready = reactor.wait(100);
    const bool ok = ready.size() == 1 && ready[0].fd == efd &&
                    ready[0].has(EpollReactor::Event::Read) && !ready[0].hungUp() &&
                    !ready[0].has(EpollReactor::Event::Error);
    const bool removed = reactor.unregisterFd(efd);
    ::close(efd);

    if (!ok || !removed) {
        std::cerr << "[reactor] unexpected ready set size=" << ready.size() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_reactor_wait_reports_ready_events();
    ok = ok && test_fd_event_routes_to_handler();
    ok = ok && test_add_fd_rejects_invalid();
    ok = ok && test_post_order_and_nested_post();
    ok = ok && test_task_exception_is_contained();
    ok = ok && test_timers_fire_through_run_until();

    if (!ok) {
        std::cerr << "EventLoop tests FAILED\n";
        return 1;
    }

    std::cout << "EventLoop tests PASSED\n";
    return 0;
}
