#pragma once

#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/Dialer.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/routing/IListenServer.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace dimensions::routing
{

class ClientSession;

/// 실제 TCP 리스너
///
/// - accept 한 클라이언트마다 ClientSession 을 만들고, 가장 한가한 백엔드로 dial 합니다.
/// - 백엔드 dial 실패가 backend.maxFailedAttempts 번 쌓이면 그 목적지를 backend.disableMs 동안
///   disabled 로 표시합니다. 해제는 취소 가능한 타이머로 합니다.
/// - 생성자에서 bind 하므로 포트가 사용 중이면 std::system_error 를 던집니다.
class ListenServer final : public IListenServer, private dimensions::util::NonCopyable
{
  public:
    ListenServer(net::EventLoop &loop, const TopologyEntry &entry, SharedState shared,
                 const std::string &listenAddress);
    ~ListenServer() override;

    [[nodiscard]] std::uint16_t port() const noexcept override { return port_; }
    void updateInfo(const TopologyEntry &entry) override;
    void shutdown() noexcept override;

    /// 설정 포트가 0 이면 커널이 고른 포트 (테스트용)
    [[nodiscard]] std::uint16_t boundPort() const noexcept;
    [[nodiscard]] std::size_t sessionCount() const noexcept { return sessions_.size(); }
    [[nodiscard]] const TopologyEntry &entry() const noexcept { return entry_; }

    // ===== ClientSession 전용 =====
    [[nodiscard]] net::EventLoop &loop() noexcept { return loop_; }
    [[nodiscard]] net::Dialer &dialer() noexcept { return dialer_; }
    [[nodiscard]] const SharedState &shared() const noexcept { return shared_; }

    /// disabled 가 아니고 clientCount 가 가장 작은 목적지. exclude 이름은 건너뜁니다.
    [[nodiscard]] std::shared_ptr<RoutingServer> chooseDestination(const std::string &exclude) const;

    void onBackendAttached(const std::string &name);
    void onBackendDetached(const std::string &name) noexcept;
    void onDialFailed(const std::string &name, const std::string &err);
    void onSessionClosed(std::uint64_t clientId) noexcept;

  private:
    net::EventLoop &loop_;
    TopologyEntry entry_;
    SharedState shared_;
    std::uint16_t port_{0};

    std::unique_ptr<net::Acceptor> acceptor_;
    net::Dialer dialer_;
    std::unordered_map<std::uint64_t, std::shared_ptr<ClientSession>> sessions_;
    std::map<std::string, net::EventLoop::TimerId> disableTimers_;
    bool stopped_{false};

    void onAccept_(net::Socket &&client, const net::Acceptor::PeerEndpoint &peer);
    void disableDestination_(const std::string &name);
    void enableDestination_(const std::string &name) noexcept;
};

/// ListenServerFactory 기본 구현: 같은 EventLoop 위에 ListenServer 를 만듭니다.
[[nodiscard]] ListenServerFactory makeListenServerFactory(net::EventLoop &loop,
                                                          std::string listenAddress);

} // namespace dimensions::routing
