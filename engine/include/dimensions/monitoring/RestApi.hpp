#pragma once

#include <dimensions/SharedState.hpp>
#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/Connection.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dimensions::monitoring
{

/// 공유 레지스트리를 외부에 보여주는 읽기 전용 표면
class IReportingSurface
{
  public:
    virtual ~IReportingSurface() = default;

    /// reload 때마다 호출됩니다. 포트가 바뀌었으면 새 포트로 다시 바인드합니다.
    virtual void handleReload(std::uint16_t port) = 0;

    [[nodiscard]] virtual std::uint16_t port() const noexcept = 0;
};

using ReportingSurfaceFactory =
    std::function<std::unique_ptr<IReportingSurface>(std::uint16_t port, const SharedState &)>;

// ===== 응답 본문 (plain text) =====

/// "name port=N dest=X" 한 줄씩
[[nodiscard]] std::string renderPlayers(const SharedState &shared);

/// "name ip:port clients=N disabled=0|1" 한 줄씩
[[nodiscard]] std::string renderDimensions(const SharedState &shared);

/// Prometheus text exposition
[[nodiscard]] std::string renderMetrics(const SharedState &shared);

/// EventLoop 위에서 도는 초경량 HTTP 서버
/// - GET /api/players, /api/dimensions, /metrics 만 지원
/// - 요청 하나에 응답 하나를 보내고 연결을 닫습니다. (Connection: close)
/// - 생성자에서 바인드하며 실패하면 std::system_error 를 던집니다.
class RestApi final : public IReportingSurface, private dimensions::util::NonCopyable
{
  public:
    RestApi(net::EventLoop &loop, std::string bindIp, std::uint16_t port, SharedState shared);
    ~RestApi() override;

    void handleReload(std::uint16_t port) override;
    [[nodiscard]] std::uint16_t port() const noexcept override { return port_; }

    /// port 0 으로 만들었으면 커널이 고른 실제 포트
    [[nodiscard]] std::uint16_t boundPort() const noexcept;

    void stop() noexcept;

  private:
    net::EventLoop &loop_;
    std::string bindIp_;
    std::uint16_t port_{0};
    SharedState shared_;

    std::unique_ptr<net::Acceptor> acceptor_;
    std::unordered_map<std::uint64_t, std::shared_ptr<net::Connection>> conns_;
    std::uint64_t nextConnId_{1};

    [[nodiscard]] std::unique_ptr<net::Acceptor> bind_(std::uint16_t port);
    void onAccept_(net::Socket &&client, const net::Acceptor::PeerEndpoint &peer);
    void onData_(net::Connection &conn, std::vector<std::uint8_t> &inbound);
    void respond_(net::Connection &conn, std::string_view method, std::string_view target);
    void sweep_() noexcept;

    static bool parseRequestTarget_(std::string_view req, std::string_view &outMethod,
                                    std::string_view &outTarget) noexcept;
    static void sendTextResponse_(net::Connection &conn, int code, std::string_view reason,
                                  std::string_view contentType, const std::string &body);
};

/// ReportingSurfaceFactory 기본 구현
[[nodiscard]] ReportingSurfaceFactory makeRestApiFactory(net::EventLoop &loop, std::string bindIp);

} // namespace dimensions::monitoring
