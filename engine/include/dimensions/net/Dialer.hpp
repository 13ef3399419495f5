#pragma once

#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/Socket.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace dimensions::net
{

/// 숫자 IPv4 주소로 논블로킹 TCP connect 를 거는 도우미입니다.
///
/// - 결과 콜백은 항상 EventLoop 위에서 비동기로 호출됩니다. (dial() 안에서 바로 부르지 않음)
/// - 성공 시 연결된 논블로킹 소켓을 넘깁니다. 실패/타임아웃이면 ok=false 와 에러 문자열.
/// - cancel()/cancelAll()/소멸 시에는 콜백이 호출되지 않습니다.
class Dialer : private dimensions::util::NonCopyable
{
  public:
    using DialId = std::uint64_t;
    using Callback = std::function<void(bool ok, Socket &&socket, std::string err)>;

    explicit Dialer(EventLoop &loop) noexcept : loop_(loop) {}
    ~Dialer();

    DialId dial(const std::string &ip, std::uint16_t port, std::chrono::milliseconds timeout,
                Callback cb);

    void cancel(DialId id) noexcept;
    void cancelAll() noexcept;

    [[nodiscard]] std::size_t pending() const noexcept { return dials_.size(); }

  private:
    struct DialState;

    EventLoop &loop_;
    DialId nextId_{1};
    std::unordered_map<DialId, std::shared_ptr<DialState>> dials_;

    void finish_(DialId id, bool ok, std::string err) noexcept;
    void failLater_(const std::shared_ptr<DialState> &st, std::string err);
};

} // namespace dimensions::net
