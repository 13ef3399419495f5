#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

#include <dimensions/util/NonCopyable.hpp>

namespace dimensions::core {

/// 이벤트 루프 스레드 전용 coarse-grained 타이머 휠입니다.
///
/// - 시간은 tickResolution 단위로 양자화됩니다. addTimer() 의 delay 는 tick 단위로 올림(ceil).
/// - one-shot 타이머만 지원합니다. 주기 작업은 콜백 안에서 다시 addTimer() 합니다.
/// - cancelTimer(id) 는 아직 실행되지 않은 타이머를 무효화합니다.
///   (백엔드 disable 해제 타이머, Redis 재접속 타이머를 shutdown 시 정리하는 용도)
class TimerWheel : private dimensions::util::NonCopyable {
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    static constexpr TimerId kInvalidTimer = 0;

    /// @throws std::invalid_argument tickResolution <= 0 또는 slotCount == 0
    TimerWheel(Duration tickResolution, std::size_t slotCount);

    ~TimerWheel() = default;

    [[nodiscard]] Duration tickResolution() const noexcept { return tickResolution_; }
    [[nodiscard]] std::size_t slotCount() const noexcept { return slotCount_; }
    [[nodiscard]] std::uint64_t currentTick() const noexcept { return currentTick_; }

    /// 아직 실행/취소되지 않은 타이머 개수
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return activeTimers_; }

    /// delay 이후 한 번 실행될 타이머를 등록합니다. 최소 1 tick 뒤에 실행됩니다.
    TimerId addTimer(Duration delay, Callback callback);

    /// 실행 전이면 취소하고 true. 이미 실행됐거나 모르는 id 면 false.
    bool cancelTimer(TimerId id) noexcept;

    /// 논리 tick 하나 전진 (테스트용)
    void tick();

    /// 마지막 tick 이후 흐른 실제 시간만큼 여러 tick 을 처리합니다.
    void tick(Clock::time_point now);

  private:
    struct Timer {
        TimerId id{};
        std::uint64_t expirationTick{};
        Callback callback;
    };

    Duration tickResolution_;
    std::size_t slotCount_{0};
    std::vector<std::vector<Timer>> slots_;

    Clock::time_point lastTickTime_{};
    std::uint64_t currentTick_{0};
    TimerId nextId_{1};
    std::size_t activeTimers_{0};

    std::unordered_set<TimerId> live_;
    std::vector<Timer> scratch_;

    [[nodiscard]] std::uint64_t durationToTicks(Duration delay) const noexcept;
    [[nodiscard]] TimerId nextTimerId() noexcept;
    void processCurrentTick();
};

} // namespace dimensions::core
