#pragma once

#include <functional>
#include <string_view>

namespace dimensions::control
{

/// 원격 명령 버스 추상화. 구현은 RedisSubscriber, 테스트는 직접 콜백을 부르는 fake.
class ICommandChannel
{
  public:
    using MessageCallback = std::function<void(std::string_view channel, std::string_view message)>;

    virtual ~ICommandChannel() = default;

    virtual void setMessageCallback(MessageCallback cb) = 0;
    virtual void start() = 0;
    virtual void stop() noexcept = 0;
};

} // namespace dimensions::control
