#include <dimensions/net/EventLoop.hpp>

#include <dimensions/core/Logger.hpp>

#include <cerrno>
#include <limits>
#include <utility>

namespace dimensions::net
{

EventLoop::EventLoop(Duration tickResolution, std::size_t timerSlots, int maxEpollEvents)
    : reactor_(maxEpollEvents), timerWheel_(tickResolution, timerSlots)
{
    SLOG_INFO("EventLoop", "Created", "tick_ms={} timer_slots={} max_epoll_events={}",
              timerWheel_.tickResolution().count(), timerWheel_.slotCount(), maxEpollEvents);
}

bool EventLoop::addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept
{
    if (fd < 0 || !handler)
    {
        errno = (fd < 0) ? EBADF : EINVAL;
        SLOG_ERROR("EventLoop", "AddFdInvalid", "fd={} handler_present={}", fd,
                   handler ? 1 : 0);
        return false;
    }

    if (!reactor_.registerFd(fd, events))
    {
        return false;
    }

    FdContext ctx{};
    ctx.fd = fd;
    ctx.handler = handler;
    ctx.tag = handler->fdTag();
    ctx.debugId = handler->fdDebugId();
    ctx.registeredEvents = events;

    auto [it, inserted] = fdContexts_.emplace(fd, ctx);
    if (!inserted)
    {
        SLOG_WARN("EventLoop", "FdContextOverwrite", "fd={} tag={} id={}", fd, ctx.tag,
                  ctx.debugId);
        it->second = ctx;
    }

    SLOG_DEBUG("EventLoop", "FdRegistered", "fd={} tag={} id={} events=0x{:x}", fd, ctx.tag,
               ctx.debugId, events);
    return true;
}

bool EventLoop::updateFd(int fd, std::uint32_t events) noexcept
{
    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        errno = ENOENT;
        SLOG_ERROR("EventLoop", "UpdateFdMissingContext", "fd={}", fd);
        return false;
    }

    if (!reactor_.modifyFd(fd, events))
    {
        return false;
    }
    it->second.registeredEvents = events;
    return true;
}

bool EventLoop::removeFd(int fd) noexcept
{
    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        return false;
    }

    SLOG_DEBUG("EventLoop", "FdUnregistered", "fd={} tag={} id={}", fd, it->second.tag,
               it->second.debugId);
    fdContexts_.erase(it);
    return reactor_.unregisterFd(fd);
}

void EventLoop::post(Task task)
{
    if (task)
    {
        tasks_.push_back(std::move(task));
    }
}

EventLoop::TimerId EventLoop::addTimer(Duration delay, core::TimerWheel::Callback cb)
{
    return timerWheel_.addTimer(delay, std::move(cb));
}

bool EventLoop::cancelTimer(TimerId id) noexcept
{
    return timerWheel_.cancelTimer(id);
}

int EventLoop::computePollTimeoutMs_() const noexcept
{
    if (!tasks_.empty())
    {
        return 0;
    }

    const auto ms = timerWheel_.tickResolution().count();
    if (ms <= 0)
    {
        return 1;
    }
    if (ms > static_cast<long long>(std::numeric_limits<int>::max()))
    {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

void EventLoop::drainTasks_() noexcept
{
    // 이번 배치에서 실행 중 새로 post 된 작업은 다음 배치로 넘긴다.
    std::deque<Task> batch;
    batch.swap(tasks_);

    for (auto &task : batch)
    {
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventLoop", "TaskException", "what='{}'", e.what());
        }
    }
}

void EventLoop::dispatch_(const EpollReactor::ReadyEvent &ev) noexcept
{
    auto it = fdContexts_.find(ev.fd);
    if (it == fdContexts_.end() || !it->second.handler)
    {
        SLOG_DEBUG("EventLoop", "EventWithoutContext", "fd={} events=0x{:x}", ev.fd, ev.events);
        return;
    }

    const FdContext ctx = it->second;

    SLOG_TRACE("EventLoop", "Dispatch", "fd={} tag={} id={} ready_events=0x{:x}", ev.fd, ctx.tag,
               ctx.debugId, ev.events);

    try
    {
        ctx.handler->handleEvent(*this, ev);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("EventLoop", "HandlerException", "fd={} tag={} what='{}'", ev.fd, ctx.tag,
                   e.what());
    }
}

void EventLoop::runOnce() noexcept
{
    drainTasks_();
    timerWheel_.tick(core::TimerWheel::Clock::now());

    for (const auto &ev : reactor_.wait(computePollTimeoutMs_()))
    {
        dispatch_(ev);
    }

    timerWheel_.tick(core::TimerWheel::Clock::now());
    drainTasks_();
}

void EventLoop::run(const std::atomic_bool &runningFlag) noexcept
{
    while (runningFlag.load(std::memory_order_acquire))
    {
        runOnce();
    }
}

bool EventLoop::runUntil(const std::function<bool()> &done, Duration timeout) noexcept
{
    const auto deadline = core::TimerWheel::Clock::now() + timeout;
    while (core::TimerWheel::Clock::now() < deadline)
    {
        if (done && done())
        {
            return true;
        }
        runOnce();
    }
    return done && done();
}

} // namespace dimensions::net
