#pragma once

#include <dimensions/control/CommandChannel.hpp>
#include <dimensions/control/RespParser.hpp>
#include <dimensions/core/ProxyConfig.hpp>
#include <dimensions/net/Connection.hpp>
#include <dimensions/net/Dialer.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::control
{

/// Redis pub/sub 구독자 (RESP2, 평문 TCP)
///
/// - start(): 접속 → SUBSCRIBE <channel> → "message" push 마다 콜백
/// - 접속 한 번은 connectTimeoutMs 안에 끝나야 합니다.
/// - 접속 실패/끊김/프로토콜 오류는 던지지 않고 "RedisSubscriber | RedisError" 로 남긴 뒤
///   reconnectDelayMs 후 다시 접속합니다.
/// - 아무것도 publish 하지 않습니다.
class RedisSubscriber final : public ICommandChannel, private dimensions::util::NonCopyable
{
  public:
    RedisSubscriber(net::EventLoop &loop, core::ControlSettings settings);
    ~RedisSubscriber() override;

    void setMessageCallback(MessageCallback cb) override { onMessage_ = std::move(cb); }
    void start() override;
    void stop() noexcept override;

    [[nodiscard]] bool isSubscribed() const noexcept { return subscribed_; }
    [[nodiscard]] std::uint64_t reconnects() const noexcept { return reconnects_; }

  private:
    net::EventLoop &loop_;
    core::ControlSettings settings_;
    net::Dialer dialer_;

    std::shared_ptr<net::Connection> conn_;
    MessageCallback onMessage_;

    bool running_{false};
    bool subscribed_{false};
    std::uint64_t reconnects_{0};
    std::uint64_t nextConnId_{1};
    net::EventLoop::TimerId reconnectTimer_{core::TimerWheel::kInvalidTimer};

    void connect_();
    void onConnected_(net::Socket &&sock);
    void onData_(std::vector<std::uint8_t> &inbound);
    void handleValue_(const RespValue &v);
    void fail_(std::string_view reason);
    void scheduleReconnect_();
};

} // namespace dimensions::control
