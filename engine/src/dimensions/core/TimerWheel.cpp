#include <dimensions/core/TimerWheel.hpp>

#include <stdexcept>
#include <utility>

namespace dimensions::core
{

TimerWheel::TimerWheel(Duration tickResolution, std::size_t slotCount)
    : tickResolution_(tickResolution), slotCount_(slotCount), slots_(slotCount),
      lastTickTime_(Clock::now())
{
    if (tickResolution_ <= Duration::zero())
    {
        throw std::invalid_argument("TimerWheel tickResolution must be > 0");
    }
    if (slotCount_ == 0)
    {
        throw std::invalid_argument("TimerWheel slotCount must be > 0");
    }
}

TimerWheel::TimerId TimerWheel::addTimer(Duration delay, Callback callback)
{
    if (!callback)
    {
        throw std::invalid_argument("TimerWheel::addTimer requires a valid callback");
    }

    const auto ticks = durationToTicks(delay);
    const std::uint64_t delayTicks = (ticks == 0) ? 1 : ticks;

    const auto expirationTick = currentTick_ + delayTicks;
    const auto slotIndex = static_cast<std::size_t>(expirationTick % slotCount_);

    const TimerId id = nextTimerId();
    slots_[slotIndex].push_back(Timer{id, expirationTick, std::move(callback)});
    live_.insert(id);
    ++activeTimers_;

    return id;
}

bool TimerWheel::cancelTimer(TimerId id) noexcept
{
    // 슬롯에서 바로 지우지 않고 live_ 에서만 빼 둔다. 만료 tick 에 조용히 버려진다.
    if (id == kInvalidTimer || live_.erase(id) == 0)
    {
        return false;
    }
    if (activeTimers_ > 0)
    {
        --activeTimers_;
    }
    return true;
}

void TimerWheel::tick()
{
    ++currentTick_;
    processCurrentTick();
}

void TimerWheel::tick(Clock::time_point now)
{
    if (now <= lastTickTime_)
    {
        return;
    }

    const auto elapsedMs = std::chrono::duration_cast<Duration>(now - lastTickTime_);
    if (elapsedMs < tickResolution_)
    {
        return;
    }

    const auto totalMs = static_cast<std::uint64_t>(elapsedMs.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    const auto ticksToAdvance = totalMs / tickMs;

    for (std::uint64_t i = 0; i < ticksToAdvance; ++i)
    {
        tick();
    }

    // 누적 오차를 줄이기 위해 now 가 아니라 tick 배수만큼만 전진
    lastTickTime_ += tickResolution_ * static_cast<std::int64_t>(ticksToAdvance);
}

std::uint64_t TimerWheel::durationToTicks(Duration delay) const noexcept
{
    if (delay <= Duration::zero())
    {
        return 0;
    }

    const auto delayMs = static_cast<std::uint64_t>(delay.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    return (delayMs + tickMs - 1) / tickMs;
}

TimerWheel::TimerId TimerWheel::nextTimerId() noexcept
{
    TimerId id = nextId_;
    ++nextId_;
    if (nextId_ == kInvalidTimer)
    {
        nextId_ = 1;
    }
    return id;
}

void TimerWheel::processCurrentTick()
{
    const auto slotIndex = static_cast<std::size_t>(currentTick_ % slotCount_);
    auto &bucket = slots_[slotIndex];

    if (bucket.empty())
    {
        return;
    }

    // 콜백 안에서 addTimer() 가 같은 슬롯에 넣어도 이번 순회 목록은 깨지지 않는다.
    std::vector<Timer> due;
    due.swap(bucket);
    scratch_.clear();

    for (auto &timer : due)
    {
        if (timer.expirationTick > currentTick_)
        {
            const auto idx = static_cast<std::size_t>(timer.expirationTick % slotCount_);
            slots_[idx].push_back(std::move(timer));
            continue;
        }

        if (live_.count(timer.id) == 0)
        {
            continue; // cancelled
        }
        scratch_.push_back(std::move(timer));
    }

    // 실행은 재배치가 끝난 뒤에 (콜백이 cancelTimer/addTimer 를 불러도 안전)
    auto ready = std::move(scratch_);
    scratch_.clear();
    for (auto &timer : ready)
    {
        // 앞선 콜백이 뒤 타이머를 취소했을 수 있다
        if (live_.erase(timer.id) == 0)
        {
            continue;
        }
        if (activeTimers_ > 0)
        {
            --activeTimers_;
        }
        timer.callback();
    }
}

} // namespace dimensions::core
