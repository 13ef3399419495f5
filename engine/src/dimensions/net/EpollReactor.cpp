#include <dimensions/net/EpollReactor.hpp>

#include <dimensions/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace dimensions::net
{

EpollReactor::EpollReactor(int maxEvents)
{
    if (maxEvents <= 0)
    {
        maxEvents = 64;
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "EpollReactor: epoll_create1 failed");
    }

    rawEvents_.resize(static_cast<std::size_t>(maxEvents));
    ready_.reserve(rawEvents_.size());
    SLOG_DEBUG("EpollReactor", "Created", "fd={} max_events={}", epollFd_, maxEvents);
}

EpollReactor::~EpollReactor() noexcept
{
    if (epollFd_ >= 0)
    {
        ::close(epollFd_);
        epollFd_ = -1;
    }
}

bool EpollReactor::control_(Op op, Fd fd, std::uint32_t events) noexcept
{
    if (fd < 0)
    {
        errno = EBADF;
        return false;
    }

    int ctlOp = EPOLL_CTL_ADD;
    const char *opName = "add";
    if (op == Op::Modify)
    {
        ctlOp = EPOLL_CTL_MOD;
        opName = "mod";
    }
    else if (op == Op::Remove)
    {
        ctlOp = EPOLL_CTL_DEL;
        opName = "del";
    }

    ::epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(epollFd_, ctlOp, fd, op == Op::Remove ? nullptr : &ev) == 0)
    {
        return true;
    }

    // del 실패는 대부분 이미 close 된 fd (커널이 먼저 뺐음)
    if (op == Op::Remove)
    {
        SLOG_WARN("EpollReactor", "CtlFailed", "op={} fd={} errno={} msg='{}'", opName, fd, errno,
                  std::strerror(errno));
    }
    else
    {
        SLOG_ERROR("EpollReactor", "CtlFailed", "op={} fd={} events=0x{:x} errno={} msg='{}'",
                   opName, fd, events, errno, std::strerror(errno));
    }
    return false;
}

std::span<const EpollReactor::ReadyEvent> EpollReactor::wait(int timeoutMs) noexcept
{
    ready_.clear();

    const int n = ::epoll_wait(epollFd_, rawEvents_.data(), static_cast<int>(rawEvents_.size()),
                               timeoutMs);
    if (n < 0)
    {
        if (errno != EINTR)
        {
            SLOG_ERROR("EpollReactor", "WaitFailed", "errno={} msg='{}'", errno,
                       std::strerror(errno));
        }
        return {};
    }

    for (int i = 0; i < n; ++i)
    {
        const auto &raw = rawEvents_[static_cast<std::size_t>(i)];
        ready_.push_back(ReadyEvent{raw.data.fd, raw.events});
    }
    return ready_;
}

} // namespace dimensions::net
