#include <dimensions/control/RedisSubscriber.hpp>

#include <dimensions/core/Logger.hpp>

#include <chrono>
#include <span>
#include <utility>

namespace dimensions::control
{

RedisSubscriber::RedisSubscriber(net::EventLoop &loop, core::ControlSettings settings)
    : loop_(loop), settings_(std::move(settings)), dialer_(loop)
{
}

RedisSubscriber::~RedisSubscriber()
{
    stop();
}

void RedisSubscriber::start()
{
    if (running_)
    {
        return;
    }
    running_ = true;
    SLOG_INFO("RedisSubscriber", "Start", "host={} port={} channel={}", settings_.redisHost,
              settings_.redisPort, settings_.channel);
    connect_();
}

void RedisSubscriber::stop() noexcept
{
    if (!running_)
    {
        return;
    }
    running_ = false;
    subscribed_ = false;

    if (reconnectTimer_ != core::TimerWheel::kInvalidTimer)
    {
        (void)loop_.cancelTimer(reconnectTimer_);
        reconnectTimer_ = core::TimerWheel::kInvalidTimer;
    }
    dialer_.cancelAll();

    if (conn_)
    {
        conn_->close();
        conn_.reset();
    }
    SLOG_INFO("RedisSubscriber", "Stopped", "channel={}", settings_.channel);
}

void RedisSubscriber::connect_()
{
    (void)dialer_.dial(settings_.redisHost, settings_.redisPort,
                       std::chrono::milliseconds(settings_.connectTimeoutMs),
                       [this](bool ok, net::Socket &&sock, std::string err) {
                           if (!running_)
                           {
                               return;
                           }
                           if (!ok)
                           {
                               fail_(err);
                               return;
                           }
                           onConnected_(std::move(sock));
                       });
}

void RedisSubscriber::onConnected_(net::Socket &&sock)
{
    conn_ = net::Connection::create(loop_, std::move(sock), nextConnId_++,
                                    settings_.redisHost + ":" +
                                        std::to_string(settings_.redisPort));

    conn_->setDataCallback(
        [this](net::Connection &, std::vector<std::uint8_t> &inbound) { onData_(inbound); });
    conn_->setCloseCallback([this](net::Connection &, std::string_view reason, int) {
        fail_(reason);
    });

    if (!conn_->start())
    {
        fail_("epoll registration failed");
        return;
    }

    const auto cmd = encodeRespCommand({"SUBSCRIBE", settings_.channel});
    (void)conn_->send(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t *>(cmd.data()), cmd.size()));
}

void RedisSubscriber::onData_(std::vector<std::uint8_t> &inbound)
{
    std::size_t offset = 0;

    while (offset < inbound.size())
    {
        RespValue value{};
        std::size_t consumed = 0;
        const auto r = RespParser::parse(
            std::span<const std::uint8_t>(inbound).subspan(offset), value, consumed);

        if (r == RespResult::NeedMore)
        {
            break;
        }
        if (r == RespResult::Invalid)
        {
            inbound.clear();
            fail_("protocol error");
            return;
        }

        offset += consumed;
        handleValue_(value);

        if (!conn_)
        {
            return; // 콜백 안에서 stop()
        }
    }

    inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(offset));
}

void RedisSubscriber::handleValue_(const RespValue &v)
{
    if (v.type == RespValue::Type::Error)
    {
        SLOG_ERROR("RedisSubscriber", "RedisError", "reply='{}'", v.str);
        return;
    }

    if (!v.isArray() || v.elements.size() < 3 || !v.elements[0].isStringLike())
    {
        SLOG_DEBUG("RedisSubscriber", "IgnoredReply", "type={}", static_cast<int>(v.type));
        return;
    }

    const auto &kind = v.elements[0].str;
    if (kind == "subscribe")
    {
        subscribed_ = true;
        SLOG_INFO("RedisSubscriber", "Subscribed", "channel={}", v.elements[1].str);
        return;
    }

    if (kind == "message" && v.elements[1].isStringLike() && v.elements[2].isStringLike())
    {
        SLOG_DEBUG("RedisSubscriber", "Message", "channel={} payload='{}'", v.elements[1].str,
                   v.elements[2].str);
        if (onMessage_)
        {
            onMessage_(v.elements[1].str, v.elements[2].str);
        }
    }
}

void RedisSubscriber::fail_(std::string_view reason)
{
    SLOG_ERROR("RedisSubscriber", "RedisError", "host={} port={} reason='{}'",
               settings_.redisHost, settings_.redisPort, reason);

    subscribed_ = false;
    if (conn_)
    {
        // 콜백 안에서 불릴 수 있으므로 파괴는 루프에 미룬다
        auto old = std::move(conn_);
        old->close();
        loop_.post([old]() {});
    }
    scheduleReconnect_();
}

void RedisSubscriber::scheduleReconnect_()
{
    if (!running_ || reconnectTimer_ != core::TimerWheel::kInvalidTimer)
    {
        return;
    }

    reconnectTimer_ =
        loop_.addTimer(std::chrono::milliseconds(settings_.reconnectDelayMs), [this]() {
            reconnectTimer_ = core::TimerWheel::kInvalidTimer;
            if (!running_)
            {
                return;
            }
            ++reconnects_;
            connect_();
        });
}

} // namespace dimensions::control
