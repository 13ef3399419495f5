#include <dimensions/net/Dialer.hpp>

#include <dimensions/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <utility>

namespace dimensions::net
{

struct Dialer::DialState final : public IFdHandler
{
    DialId id{0};
    Dialer *owner{nullptr};
    std::string ip;
    std::uint16_t port{0};
    Callback cb;

    Socket sock;
    bool registered{false};
    EventLoop::TimerId timer{core::TimerWheel::kInvalidTimer};

    [[nodiscard]] const char *fdTag() const noexcept override { return "dial"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override { return id; }

    void handleEvent(EventLoop & /*loop*/, const EpollReactor::ReadyEvent & /*ev*/) override
    {
        const int soErr = sock.pendingError();
        if (soErr != 0)
        {
            owner->finish_(id, false, std::strerror(soErr));
            return;
        }
        owner->finish_(id, true, {});
    }
};

Dialer::~Dialer()
{
    cancelAll();
}

Dialer::DialId Dialer::dial(const std::string &ip, std::uint16_t port,
                            std::chrono::milliseconds timeout, Callback cb)
{
    auto st = std::make_shared<DialState>();
    st->id = nextId_++;
    st->owner = this;
    st->ip = ip;
    st->port = port;
    st->cb = std::move(cb);

    dials_.emplace(st->id, st);

    SLOG_DEBUG("Dial", "Start", "dial_id={} host='{}' port={}", st->id, ip, port);

    st->sock = Socket::createTcpIPv4();
    if (!st->sock.isValid() || !st->sock.setNonBlocking(true))
    {
        failLater_(st, std::string("socket setup failed: ") + std::strerror(errno));
        return st->id;
    }
    (void)st->sock.setNoDelay(true);

    if (!st->sock.connect(ip, port) && errno != EINPROGRESS)
    {
        failLater_(st, std::strerror(errno));
        return st->id;
    }

    // 즉시 연결된 경우에도 EPOLLOUT 이 바로 올라오므로 같은 경로로 처리된다.
    if (!loop_.addFd(st->sock.nativeHandle(), EpollReactor::kDialInterest, st.get()))
    {
        failLater_(st, "epoll registration failed");
        return st->id;
    }
    st->registered = true;

    if (timeout.count() > 0)
    {
        std::weak_ptr<DialState> weak = st;
        st->timer = loop_.addTimer(timeout, [weak]() {
            if (auto s = weak.lock())
            {
                s->timer = core::TimerWheel::kInvalidTimer;
                s->owner->finish_(s->id, false, "dial timeout");
            }
        });
    }

    return st->id;
}

void Dialer::failLater_(const std::shared_ptr<DialState> &st, std::string err)
{
    std::weak_ptr<DialState> weak = st;
    loop_.post([weak, err = std::move(err)]() mutable {
        if (auto s = weak.lock())
        {
            s->owner->finish_(s->id, false, std::move(err));
        }
    });
}

void Dialer::finish_(DialId id, bool ok, std::string err) noexcept
{
    auto it = dials_.find(id);
    if (it == dials_.end())
    {
        return;
    }

    auto st = std::move(it->second);
    dials_.erase(it);

    if (st->registered)
    {
        (void)loop_.removeFd(st->sock.nativeHandle());
        st->registered = false;
    }
    if (st->timer != core::TimerWheel::kInvalidTimer)
    {
        (void)loop_.cancelTimer(st->timer);
        st->timer = core::TimerWheel::kInvalidTimer;
    }

    Socket connected;
    if (ok)
    {
        connected = std::move(st->sock);
        SLOG_DEBUG("Dial", "Ok", "dial_id={} host='{}' port={}", id, st->ip, st->port);
    }
    else
    {
        st->sock.close();
        SLOG_DEBUG("Dial", "Failed", "dial_id={} host='{}' port={} err='{}'", id, st->ip,
                   st->port, err);
    }

    auto cb = std::move(st->cb);
    if (!cb)
    {
        return;
    }

    try
    {
        cb(ok, std::move(connected), std::move(err));
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Dial", "CallbackException", "dial_id={} what='{}'", id, e.what());
    }
}

void Dialer::cancel(DialId id) noexcept
{
    auto it = dials_.find(id);
    if (it == dials_.end())
    {
        return;
    }

    auto &st = it->second;
    if (st->registered)
    {
        (void)loop_.removeFd(st->sock.nativeHandle());
    }
    if (st->timer != core::TimerWheel::kInvalidTimer)
    {
        (void)loop_.cancelTimer(st->timer);
    }
    st->sock.close();
    dials_.erase(it);
}

void Dialer::cancelAll() noexcept
{
    while (!dials_.empty())
    {
        cancel(dials_.begin()->first);
    }
}

} // namespace dimensions::net
