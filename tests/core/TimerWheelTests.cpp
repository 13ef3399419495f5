#include <dimensions/core/TimerWheel.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>

using dimensions::core::TimerWheel;

namespace {

/// 25ms 타이머는 10ms tick 기준 3번째 tick 에서 한 번만 실행되어야 합니다.
bool test_fires_once_at_ceil_tick() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    int fired = 0;
    (void)wheel.addTimer(25ms, [&]() { ++fired; });

    wheel.tick();
    wheel.tick();
    if (fired != 0) {
        std::cerr << "[ceil] fired before tick 3\n";
        return false;
    }

    wheel.tick();
    wheel.tick();
    if (fired != 1) {
        std::cerr << "[ceil] fired=" << fired << " (expected 1)\n";
        return false;
    }
    if (wheel.pendingTimers() != 0) {
        std::cerr << "[ceil] pendingTimers=" << wheel.pendingTimers() << " after firing\n";
        return false;
    }
    return true;
}

/// slotCount 보다 긴 delay 는 wheel 을 여러 바퀴 돈 뒤에 실행됩니다.
bool test_wrap_around() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 4);

    std::uint64_t tick = 0;
    std::uint64_t firedAt = 0;
    (void)wheel.addTimer(90ms, [&]() { firedAt = tick; });

    for (int i = 0; i < 12; ++i) {
        ++tick;
        wheel.tick();
    }

    if (firedAt != 9) {
        std::cerr << "[wrap] fired at tick " << firedAt << " (expected 9)\n";
        return false;
    }
    return true;
}

/// 취소한 타이머는 실행되지 않고, 두 번째 취소는 false 입니다.
bool test_cancel() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    bool fired = false;
    const auto id = wheel.addTimer(20ms, [&]() { fired = true; });

    if (!wheel.cancelTimer(id)) {
        std::cerr << "[cancel] first cancel returned false\n";
        return false;
    }
    if (wheel.cancelTimer(id)) {
        std::cerr << "[cancel] second cancel returned true\n";
        return false;
    }
    if (wheel.cancelTimer(TimerWheel::kInvalidTimer)) {
        std::cerr << "[cancel] cancelling kInvalidTimer returned true\n";
        return false;
    }

    for (int i = 0; i < 5; ++i) {
        wheel.tick();
    }

    if (fired || wheel.pendingTimers() != 0) {
        std::cerr << "[cancel] fired=" << fired << " pending=" << wheel.pendingTimers() << "\n";
        return false;
    }
    return true;
}

/// 같은 tick 에 만료되는 타이머를 앞선 콜백이 취소하면 뒤 타이머는 실행되지 않습니다.
bool test_cancel_from_callback_same_tick() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    bool secondFired = false;
    TimerWheel::TimerId second = TimerWheel::kInvalidTimer;

    (void)wheel.addTimer(10ms, [&]() { (void)wheel.cancelTimer(second); });
    second = wheel.addTimer(10ms, [&]() { secondFired = true; });

    wheel.tick();

    if (secondFired) {
        std::cerr << "[cancel-cb] cancelled timer still fired\n";
        return false;
    }
    return true;
}

/// 콜백 안에서 다시 등록한 타이머는 다음 tick 이후에 실행됩니다. (주기 작업 패턴)
bool test_rearm_from_callback() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    int runs = 0;
    std::function<void()> rearm = [&]() {
        ++runs;
        if (runs < 3) {
            (void)wheel.addTimer(10ms, rearm);
        }
    };
    (void)wheel.addTimer(10ms, rearm);

    for (int i = 0; i < 6; ++i) {
        wheel.tick();
    }

    if (runs != 3) {
        std::cerr << "[rearm] runs=" << runs << " (expected 3)\n";
        return false;
    }
    return true;
}

bool test_invalid_arguments() {
    using namespace std::chrono_literals;

    bool threw = false;
    try {
        TimerWheel wheel(0ms, 8);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[args] zero tick resolution accepted\n";
        return false;
    }

    TimerWheel wheel(10ms, 8);
    threw = false;
    try {
        (void)wheel.addTimer(10ms, TimerWheel::Callback{});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[args] empty callback accepted\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_fires_once_at_ceil_tick();
    ok = ok && test_wrap_around();
    ok = ok && test_cancel();
    ok = ok && test_cancel_from_callback_same_tick();
    ok = ok && test_rearm_from_callback();
    ok = ok && test_invalid_arguments();

    if (!ok) {
        std::cerr << "TimerWheel tests FAILED\n";
        return 1;
    }

    std::cout << "TimerWheel tests PASSED\n";
    return 0;
}
