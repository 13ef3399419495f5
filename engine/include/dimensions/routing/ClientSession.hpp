#pragma once

#include <dimensions/handlers/ClientContext.hpp>
#include <dimensions/net/Connection.hpp>
#include <dimensions/net/Dialer.hpp>
#include <dimensions/protocol/PacketTypes.hpp>
#include <dimensions/routing/Topology.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::routing
{

class ListenServer;

enum class SessionState : std::uint8_t
{
    Dialing = 0, ///< 백엔드 연결 대기 (클라이언트 프레임은 버퍼에 쌓임)
    Relaying,
    Closed,
};

/// 클라이언트 한 명과 그가 붙은 백엔드 한 개를 잇는 릴레이
///
/// - 프레임 단위로 handlers 레지스트리를 거쳐 반대편으로 전달합니다.
/// - 백엔드를 바꿀 때(/<name>) 처음 받은 ConnectRequest 를 새 백엔드에 다시 보냅니다.
/// - 닫힐 때 이름 추적과 clientCount 를 되돌리고 리스너에서 빠집니다.
class ClientSession final : public handlers::IClientContext,
                            public std::enable_shared_from_this<ClientSession>,
                            private dimensions::util::NonCopyable
{
  public:
    ClientSession(ListenServer &owner, std::uint64_t clientId,
                  std::shared_ptr<net::Connection> client);
    ~ClientSession() override;

    /// 클라이언트 소켓 등록 + 첫 백엔드 선택/dial
    void start();

    /// 리스너 shutdown 경로: 콜백 없이 양쪽을 닫습니다.
    void closeFromListener() noexcept;

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool backendAttached() const noexcept { return attached_; }

    // ===== IClientContext =====
    [[nodiscard]] std::uint64_t clientId() const noexcept override { return clientId_; }
    [[nodiscard]] std::uint16_t listenPort() const noexcept override;
    [[nodiscard]] const std::string &playerName() const noexcept override { return playerName_; }
    void setPlayerName(std::string name) override { playerName_ = std::move(name); }
    [[nodiscard]] std::string currentDestination() const override;
    bool sendToClient(std::vector<std::uint8_t> frame) override;
    bool sendToBackend(std::vector<std::uint8_t> frame) override;
    bool requestTransfer(const std::string &destination) override;
    void disconnect(std::string_view reason) override;

  private:
    ListenServer &owner_;
    std::uint64_t clientId_{0};
    SessionState state_{SessionState::Dialing};

    std::shared_ptr<net::Connection> client_;
    std::shared_ptr<net::Connection> backend_;
    std::shared_ptr<RoutingServer> destination_;
    bool attached_{false};
    bool retried_{false};
    bool transferring_{false};
    net::Dialer::DialId dialId_{0};

    std::string playerName_;
    std::vector<std::uint8_t> connectRequest_;
    std::vector<std::vector<std::uint8_t>> pendingToBackend_;
    std::size_t pendingBytes_{0};

    void dial_(std::shared_ptr<RoutingServer> target);
    void onDialResult_(const std::string &name, bool ok, net::Socket &&sock,
                       const std::string &err);
    void onClientData_(std::vector<std::uint8_t> &inbound);
    void onBackendData_(std::vector<std::uint8_t> &inbound);
    void onBackendClosed_(std::string_view reason, int err);
    void detachBackend_() noexcept;
    void finish_(bool notifyOwner) noexcept;
};

} // namespace dimensions::routing
