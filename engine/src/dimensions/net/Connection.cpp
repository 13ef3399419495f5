#include <dimensions/net/Connection.hpp>

#include <dimensions/core/Defaults.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/net/EventLoop.hpp>

#include <array>
#include <cerrno>
#include <cstring>

namespace dimensions::net
{

Connection::Connection(PrivateTag, EventLoop &loop, Socket &&socket, std::uint64_t id,
                       std::string peer) noexcept
    : loop_(loop), socket_(std::move(socket)), id_(id), peer_(std::move(peer))
{
}

Connection::~Connection()
{
    if (socket_.isValid())
    {
        teardown_();
    }
}

std::shared_ptr<Connection> Connection::create(EventLoop &loop, Socket &&socket, std::uint64_t id,
                                               std::string peer)
{
    return std::make_shared<Connection>(PrivateTag{}, loop, std::move(socket), id,
                                        std::move(peer));
}

std::uint32_t Connection::baseMask_() noexcept
{
    return EpollReactor::kStreamInterest;
}

bool Connection::start() noexcept
{
    if (!socket_.isValid() || registered_)
    {
        return registered_;
    }

    if (!loop_.addFd(socket_.nativeHandle(), baseMask_(), this))
    {
        SLOG_ERROR("Connection", "RegisterFailed", "cid={} peer={} errno={}", id_, peer_, errno);
        socket_.close();
        state_ = ConnectionState::Closed;
        return false;
    }
    registered_ = true;
    return true;
}

void Connection::handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev)
{
    (void)loop;
    if (state_ == ConnectionState::Closed)
    {
        return;
    }

    auto self = shared_from_this();
    using Event = EpollReactor::Event;

    // EPOLLIN|EPOLLRDHUP 가 같이 오면 먼저 끝까지 읽는다. (마지막 패킷 유실 방지)
    if (ev.has(Event::Read))
    {
        onReadable_();
        if (state_ == ConnectionState::Closed)
        {
            return;
        }
    }

    if (ev.has(Event::Write))
    {
        if (!flush_())
        {
            return;
        }
    }

    if (ev.has(Event::Error))
    {
        fail_("epoll_err", socket_.pendingError());
        return;
    }
    if (ev.hungUp())
    {
        fail_(ev.has(Event::ReadHangup) ? "epoll_rdhup" : "epoll_hup", 0);
    }
}

void Connection::onReadable_() noexcept
{
    std::array<std::uint8_t, core::defaults::kReadChunkBytes> chunk{};

    for (;;)
    {
        const ::ssize_t n = socket_.recv(chunk.data(), chunk.size());

        if (n > 0)
        {
            if (state_ != ConnectionState::Open)
            {
                continue; // flushing: 더 이상 올려보내지 않는다
            }

            const auto bytes = static_cast<std::size_t>(n);
            if (inbound_.size() + bytes > core::defaults::kMaxInboundBytes)
            {
                SLOG_WARN("Connection", "InboundOverflow", "cid={} peer={} size={}", id_, peer_,
                          inbound_.size() + bytes);
                fail_("inbound_overflow", 0);
                return;
            }

            inbound_.insert(inbound_.end(), chunk.begin(), chunk.begin() + n);

            if (onData_)
            {
                try
                {
                    onData_(*this, inbound_);
                }
                catch (const std::exception &e)
                {
                    SLOG_ERROR("Connection", "DataCallbackException", "cid={} what='{}'", id_,
                               e.what());
                    fail_("data_callback_exception", 0);
                    return;
                }
            }

            if (state_ == ConnectionState::Closed)
            {
                return;
            }
            continue;
        }

        if (n == 0)
        {
            fail_("peer_close", 0);
            return;
        }

        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return;
        }

        fail_("recv_error", errno);
        return;
    }
}

bool Connection::send(std::span<const std::uint8_t> bytes) noexcept
{
    if (state_ != ConnectionState::Open)
    {
        return false;
    }
    if (bytes.empty())
    {
        return true;
    }

    std::size_t offset = 0;

    // backlog 가 없을 때만 바로 쓴다. (순서 보장)
    if (pendingOutbound() == 0)
    {
        while (offset < bytes.size())
        {
            const ::ssize_t n = socket_.send(bytes.data() + offset, bytes.size() - offset);
            if (n > 0)
            {
                offset += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                break;
            }

            auto self = shared_from_this();
            fail_("send_failed", n < 0 ? errno : 0);
            return false;
        }
    }

    if (offset == bytes.size())
    {
        return true;
    }

    if (pendingOutbound() + (bytes.size() - offset) > core::defaults::kMaxOutboundBytes)
    {
        SLOG_WARN("Connection", "OutboundOverflow", "cid={} peer={} pending={}", id_, peer_,
                  pendingOutbound());
        auto self = shared_from_this();
        fail_("outbound_overflow", 0);
        return false;
    }

    outbound_.insert(outbound_.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                     bytes.end());
    setWriteInterest_(true);
    return state_ == ConnectionState::Open;
}

bool Connection::flush_() noexcept
{
    while (pendingOutbound() > 0)
    {
        const ::ssize_t n = socket_.send(outbound_.data() + outHead_, pendingOutbound());
        if (n > 0)
        {
            outHead_ += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            break;
        }

        fail_("send_failed", n < 0 ? errno : 0);
        return false;
    }

    if (pendingOutbound() == 0)
    {
        outbound_.clear();
        outHead_ = 0;

        if (state_ == ConnectionState::Flushing)
        {
            teardown_();
            return false;
        }
        setWriteInterest_(false);
    }
    else if (outHead_ > outbound_.size() / 2)
    {
        outbound_.erase(outbound_.begin(),
                        outbound_.begin() + static_cast<std::ptrdiff_t>(outHead_));
        outHead_ = 0;
    }

    return state_ != ConnectionState::Closed;
}

void Connection::setWriteInterest_(bool enable) noexcept
{
    if (!registered_ || writeInterest_ == enable || state_ == ConnectionState::Closed)
    {
        return;
    }

    const std::uint32_t mask =
        enable ? (baseMask_() | EpollReactor::kWriteInterest) : baseMask_();

    if (!loop_.updateFd(socket_.nativeHandle(), mask))
    {
        fail_("epoll_mod_failed", errno);
        return;
    }
    writeInterest_ = enable;
}

void Connection::close() noexcept
{
    if (state_ == ConnectionState::Closed)
    {
        return;
    }
    onData_ = nullptr;
    onClose_ = nullptr;
    teardown_();
}

void Connection::closeAfterFlush() noexcept
{
    if (state_ != ConnectionState::Open)
    {
        return;
    }

    onData_ = nullptr;
    onClose_ = nullptr;
    inbound_.clear();

    if (pendingOutbound() == 0)
    {
        teardown_();
        return;
    }
    state_ = ConnectionState::Flushing;
}

void Connection::fail_(std::string_view reason, int err) noexcept
{
    if (state_ == ConnectionState::Closed)
    {
        return;
    }

    SLOG_DEBUG("Connection", "Closed", "cid={} peer={} reason='{}' err={} err_str='{}'", id_,
               peer_, reason, err, err != 0 ? std::strerror(err) : "ok");

    auto cb = std::move(onClose_);
    onClose_ = nullptr;
    onData_ = nullptr;
    teardown_();

    if (cb)
    {
        try
        {
            cb(*this, reason, err);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Connection", "CloseCallbackException", "cid={} what='{}'", id_, e.what());
        }
    }
}

void Connection::teardown_() noexcept
{
    // epoll 해제가 close 보다 먼저 (같은 배치의 지연 이벤트 방지)
    if (registered_ && socket_.isValid())
    {
        (void)loop_.removeFd(socket_.nativeHandle());
    }
    registered_ = false;
    writeInterest_ = false;
    socket_.close();
    state_ = ConnectionState::Closed;
    outbound_.clear();
    outHead_ = 0;
}

} // namespace dimensions::net
