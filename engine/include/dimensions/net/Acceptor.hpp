#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <dimensions/core/Defaults.hpp>
#include <dimensions/net/FdHandler.hpp>
#include <dimensions/net/Socket.hpp>
#include <dimensions/util/NonCopyable.hpp>

namespace dimensions::net {

/// TCP 리스닝 소켓을 소유하고 EventLoop 에서 accept 를 처리합니다.
///
/// - 생성자에서 socket/bind/listen 까지 끝내며, 실패하면 std::system_error 를 던집니다.
/// - start(loop) 이후 EPOLLIN 이 오면 EAGAIN 까지 accept 해서 콜백으로 넘깁니다.
/// - stop() 은 epoll 해제 후 소켓을 닫습니다. 여러 번 불러도 안전합니다.
class Acceptor final : private dimensions::util::NonCopyable, public IFdHandler {
  public:
    struct PeerEndpoint {
        std::string ip;
        std::uint16_t port{0};
    };

    using AcceptCallback = std::function<void(Socket &&client, const PeerEndpoint &peer)>;

    Acceptor(std::string listenAddress, std::uint16_t listenPort,
             int backlog = core::defaults::kListenBacklog);
    ~Acceptor() override;

    void setAcceptCallback(AcceptCallback cb) noexcept { onAccept_ = std::move(cb); }

    /// @throws std::system_error epoll 등록 실패
    void start(EventLoop &loop);
    void stop() noexcept;

    [[nodiscard]] bool isListening() const noexcept { return listenSocket_.isValid(); }
    [[nodiscard]] std::string_view listenAddress() const noexcept { return listenAddress_; }

    /// port 0 으로 만들었으면 커널이 고른 실제 포트가 들어 있습니다.
    [[nodiscard]] std::uint16_t listenPort() const noexcept { return listenPort_; }

    // ===== IFdHandler =====
    [[nodiscard]] const char *fdTag() const noexcept override { return "listener"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override { return listenPort_; }
    void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) override;

  private:
    Socket listenSocket_;
    std::string listenAddress_;
    std::uint16_t listenPort_{0};
    EventLoop *loop_{nullptr};

    AcceptCallback onAccept_;

    void onReadable_();
    static void fillPeerEndpoint(const ::sockaddr *sa, PeerEndpoint &out) noexcept;
};

} // namespace dimensions::net
