#include <dimensions/SharedState.hpp>
#include <dimensions/handlers/HandlerRegistry.hpp>
#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/Connection.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/Socket.hpp>
#include <dimensions/protocol/Packets.hpp>
#include <dimensions/protocol/TerrariaFramer.hpp>
#include <dimensions/routing/ListenServer.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace net = dimensions::net;
namespace proto = dimensions::protocol;
namespace routing = dimensions::routing;

using dimensions::SharedState;

namespace {

using namespace std::chrono_literals;

SharedState makeShared() {
    SharedState s;
    s.destinations = std::make_shared<routing::DestinationRegistry>();
    s.serverDetails = std::make_shared<routing::ServerDetailsRegistry>();
    s.tracking = std::make_shared<routing::GlobalTracking>();
    s.handlers = std::make_shared<dimensions::handlers::HandlerRegistry>();
    s.options = std::make_shared<dimensions::core::Options>();

    const auto f = dimensions::handlers::defaultHandlerFactories();
    s.handlers->command = f.command();
    s.handlers->clientPacketHandler = f.clientPacketHandler();
    s.handlers->backendPacketHandler = f.backendPacketHandler();
    return s;
}

std::shared_ptr<routing::RoutingServer> makeServer(const std::string &name, std::uint16_t port) {
    auto s = std::make_shared<routing::RoutingServer>();
    s->name = name;
    s->serverIp = "127.0.0.1";
    s->serverPort = port;
    return s;
}

routing::TopologyEntry makeEntry(SharedState &shared,
                                 std::vector<std::shared_ptr<routing::RoutingServer>> servers) {
    routing::TopologyEntry entry;
    entry.listenPort = 0;
    for (const auto &s : servers) {
        routing::registerDestination(*shared.destinations, *shared.serverDetails, s);
    }
    entry.routingServers = std::move(servers);
    return entry;
}

/// 열었다 닫은 포트. 그 포트로의 dial 은 거절됩니다.
std::uint16_t deadPort() {
    net::Acceptor spare("127.0.0.1", 0);
    return spare.listenPort();
}

/// 받은 바이트를 쌓아 두는 루프백 백엔드
class FakeBackend {
  public:
    explicit FakeBackend(net::EventLoop &loop) : loop_(loop), acceptor_("127.0.0.1", 0) {
        acceptor_.setAcceptCallback(
            [this](net::Socket &&sock, const net::Acceptor::PeerEndpoint &peer) {
                auto conn = net::Connection::create(loop_, std::move(sock), conns.size() + 1,
                                                    peer.ip);
                conn->setDataCallback([this](net::Connection &, std::vector<std::uint8_t> &in) {
                    received.insert(received.end(), in.begin(), in.end());
                    in.clear();
                });
                (void)conn->start();
                conns.push_back(conn);
            });
        acceptor_.start(loop_);
    }

    [[nodiscard]] std::uint16_t port() const noexcept { return acceptor_.listenPort(); }

    std::vector<std::shared_ptr<net::Connection>> conns;
    std::vector<std::uint8_t> received;

  private:
    net::EventLoop &loop_;
    net::Acceptor acceptor_;
};

/// 논블로킹 테스트 클라이언트. poll() 은 루프 predicate 안에서 부릅니다.
struct TestClient {
    net::Socket sock;
    std::vector<std::uint8_t> received;
    bool eof{false};

    bool connect(std::uint16_t port) {
        sock = net::Socket::createTcpIPv4();
        return sock.connect("127.0.0.1", port) && sock.setNonBlocking(true);
    }

    void send(const std::vector<std::uint8_t> &bytes) {
        (void)sock.send(bytes.data(), bytes.size());
    }

    void poll() {
        std::uint8_t buf[4096];
        for (;;) {
            const auto n = sock.recv(buf, sizeof(buf));
            if (n > 0) {
                received.insert(received.end(), buf, buf + n);
                continue;
            }
            if (n == 0) {
                eof = true;
            }
            return;
        }
    }

    /// 받은 바이트 중 첫 Disconnect 프레임의 사유
    [[nodiscard]] std::optional<std::string> disconnectReason() const {
        std::span<const std::uint8_t> in(received);
        std::size_t len = 0;
        while (proto::TerrariaFramer::tryFrame(in, len) == proto::FrameResult::Framed) {
            const auto p = proto::makePacket(std::vector<std::uint8_t>(in.begin(), in.begin() + len));
            if (auto reason = proto::parseDisconnectReason(p)) {
                return reason;
            }
            in = in.subspan(len);
        }
        return std::nullopt;
    }
};

/// 클라이언트 → 리스너 → 백엔드로 바이트가 흐르고 clientCount 가 오르내립니다.
bool test_relay_and_client_count() {
    net::EventLoop loop(10ms, 64, 64);
    FakeBackend backend(loop);

    auto shared = makeShared();
    const auto entry = makeEntry(shared, {makeServer("Lobby", backend.port())});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    TestClient client;
    if (!client.connect(listener.boundPort())) {
        std::cerr << "[relay] client connect failed\n";
        return false;
    }

    const auto hello = proto::buildConnectRequest("Terraria279");
    client.send(hello);

    if (!loop.runUntil([&]() { return backend.received.size() >= hello.size(); }, 2000ms)) {
        std::cerr << "[relay] backend received " << backend.received.size() << " bytes\n";
        return false;
    }
    if (backend.received != hello) {
        std::cerr << "[relay] backend bytes differ from the ConnectRequest\n";
        return false;
    }
    if (shared.serverDetails->at("Lobby").clientCount != 1 || listener.sessionCount() != 1) {
        std::cerr << "[relay] clientCount=" << shared.serverDetails->at("Lobby").clientCount
                  << " sessions=" << listener.sessionCount() << "\n";
        return false;
    }

    // 백엔드 → 클라이언트
    const auto chat = proto::buildChatMessage("welcome");
    (void)backend.conns.at(0)->send(chat);
    if (!loop.runUntil([&]() { client.poll(); return client.received.size() >= chat.size(); },
                       2000ms) ||
        client.received != chat) {
        std::cerr << "[relay] client did not get the backend frame\n";
        return false;
    }

    client.sock.close();
    if (!loop.runUntil([&]() {
            return listener.sessionCount() == 0 &&
                   shared.serverDetails->at("Lobby").clientCount == 0;
        },
                       2000ms)) {
        std::cerr << "[relay] session not cleaned up after client close\n";
        return false;
    }
    return true;
}

/// PlayerInfo 로 잡힌 이름은 세션이 끝나면 풀립니다.
bool test_player_name_tracked_and_released() {
    net::EventLoop loop(10ms, 64, 64);
    FakeBackend backend(loop);

    auto shared = makeShared();
    const auto entry = makeEntry(shared, {makeServer("Lobby", backend.port())});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    TestClient client;
    if (!client.connect(listener.boundPort())) {
        return false;
    }
    client.send(proto::buildConnectRequest("Terraria279"));
    client.send(proto::buildPlayerInfo(0, "Steve"));

    if (!loop.runUntil([&]() { return shared.tracking->names().count("Steve") == 1; }, 2000ms)) {
        std::cerr << "[tracking] name not claimed\n";
        return false;
    }
    if (!loop.runUntil([&]() { return shared.tracking->names().at("Steve").destination == "Lobby"; },
                       2000ms)) {
        std::cerr << "[tracking] destination not recorded\n";
        return false;
    }

    client.sock.close();
    if (!loop.runUntil([&]() { return shared.tracking->size() == 0; }, 2000ms)) {
        std::cerr << "[tracking] name not released on disconnect\n";
        return false;
    }
    return true;
}

/// 목적지가 하나도 없으면 "No available dimension" 으로 끊깁니다.
bool test_no_destination_kicks() {
    net::EventLoop loop(10ms, 64, 64);

    auto shared = makeShared();
    const auto entry = makeEntry(shared, {});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    TestClient client;
    if (!client.connect(listener.boundPort())) {
        return false;
    }

    if (!loop.runUntil([&]() { client.poll(); return client.eof; }, 2000ms)) {
        std::cerr << "[nodest] client not closed\n";
        return false;
    }
    const auto reason = client.disconnectReason();
    if (!reason || *reason != "No available dimension") {
        std::cerr << "[nodest] reason='" << (reason ? *reason : "(none)") << "'\n";
        return false;
    }
    return listener.sessionCount() == 0;
}

/// 첫 목적지 dial 이 실패하면 다른 목적지로 한 번 더 시도합니다.
bool test_dial_failure_falls_back_once() {
    net::EventLoop loop(10ms, 64, 64);
    FakeBackend backend(loop);

    auto shared = makeShared();
    const auto entry =
        makeEntry(shared, {makeServer("Dead", deadPort()), makeServer("Alive", backend.port())});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    TestClient client;
    if (!client.connect(listener.boundPort())) {
        return false;
    }
    client.send(proto::buildConnectRequest("Terraria279"));

    if (!loop.runUntil([&]() { return !backend.received.empty(); }, 3000ms)) {
        std::cerr << "[fallback] second destination never got data\n";
        return false;
    }
    if (shared.serverDetails->at("Dead").failedConnAttempts != 1 ||
        shared.serverDetails->at("Alive").clientCount != 1) {
        std::cerr << "[fallback] details not updated as expected\n";
        return false;
    }
    return true;
}

/// maxFailedAttempts 에 닿으면 disabled, disableMs 뒤에 다시 enabled 입니다.
bool test_disable_and_reenable() {
    net::EventLoop loop(10ms, 64, 64);

    auto shared = makeShared();
    shared.options->backend.maxFailedAttempts = 1;
    shared.options->backend.disableMs = 100;
    const auto entry = makeEntry(shared, {makeServer("Dead", deadPort())});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    TestClient client;
    if (!client.connect(listener.boundPort())) {
        return false;
    }

    if (!loop.runUntil([&]() { return shared.serverDetails->at("Dead").disabled; }, 3000ms)) {
        std::cerr << "[disable] destination never disabled\n";
        return false;
    }
    if (!loop.runUntil([&]() { client.poll(); return client.eof; }, 2000ms) ||
        client.disconnectReason().value_or("") != "No available dimension") {
        std::cerr << "[disable] client not kicked with 'No available dimension'\n";
        return false;
    }
    if (listener.chooseDestination({})) {
        std::cerr << "[disable] disabled destination still chosen\n";
        return false;
    }

    if (!loop.runUntil([&]() { return !shared.serverDetails->at("Dead").disabled; }, 2000ms)) {
        std::cerr << "[disable] destination not re-enabled\n";
        return false;
    }
    if (shared.serverDetails->at("Dead").failedConnAttempts != 0) {
        std::cerr << "[disable] failure counter not reset on enable\n";
        return false;
    }
    return true;
}

/// 가장 한가한 목적지, 동률이면 설정 순서상 앞의 것
bool test_choose_destination() {
    net::EventLoop loop(10ms, 64, 16);

    auto shared = makeShared();
    const auto entry = makeEntry(shared, {makeServer("A", 1001), makeServer("B", 1002),
                                          makeServer("C", 1003)});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    if (listener.chooseDestination({})->name != "A") {
        std::cerr << "[choose] tie did not pick the first\n";
        return false;
    }

    (*shared.serverDetails)["A"].clientCount = 3;
    (*shared.serverDetails)["B"].clientCount = 2;
    (*shared.serverDetails)["C"].clientCount = 2;
    if (listener.chooseDestination({})->name != "B") {
        std::cerr << "[choose] expected B\n";
        return false;
    }

    (*shared.serverDetails)["B"].disabled = true;
    if (listener.chooseDestination({})->name != "C") {
        std::cerr << "[choose] disabled B not skipped\n";
        return false;
    }
    if (listener.chooseDestination("C")->name != "A") {
        std::cerr << "[choose] exclude not honoured\n";
        return false;
    }
    return true;
}

/// onBackendDetached 는 0 아래로 내려가지 않습니다.
bool test_detach_never_negative() {
    net::EventLoop loop(10ms, 64, 16);
    auto shared = makeShared();
    const auto entry = makeEntry(shared, {makeServer("A", 1001)});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");

    listener.onBackendAttached("A");
    listener.onBackendDetached("A");
    listener.onBackendDetached("A");
    if (shared.serverDetails->at("A").clientCount != 0) {
        std::cerr << "[detach] clientCount=" << shared.serverDetails->at("A").clientCount << "\n";
        return false;
    }
    return true;
}

/// shutdown 은 세션을 닫고 포트를 풀고, disabled 목적지를 바로 되살립니다.
bool test_shutdown_releases_everything() {
    net::EventLoop loop(10ms, 64, 64);
    FakeBackend backend(loop);

    auto shared = makeShared();
    shared.options->backend.maxFailedAttempts = 1;
    shared.options->backend.disableMs = 60000;
    const auto entry = makeEntry(shared, {makeServer("Lobby", backend.port())});
    routing::ListenServer listener(loop, entry, shared, "127.0.0.1");
    const auto port = listener.boundPort();

    TestClient client;
    if (!client.connect(port)) {
        return false;
    }
    client.send(proto::buildConnectRequest("Terraria279"));
    if (!loop.runUntil([&]() { return !backend.received.empty(); }, 2000ms)) {
        std::cerr << "[shutdown] relay not established\n";
        return false;
    }

    listener.onDialFailed("Lobby", "synthetic");
    if (!shared.serverDetails->at("Lobby").disabled) {
        std::cerr << "[shutdown] destination not disabled\n";
        return false;
    }

    listener.shutdown();
    listener.shutdown();

    if (listener.sessionCount() != 0 || shared.serverDetails->at("Lobby").disabled) {
        std::cerr << "[shutdown] sessions left or destination still disabled\n";
        return false;
    }
    if (!loop.runUntil([&]() { client.poll(); return client.eof; }, 2000ms)) {
        std::cerr << "[shutdown] client socket not closed\n";
        return false;
    }

    try {
        net::Acceptor again("127.0.0.1", port);
    } catch (const std::exception &e) {
        std::cerr << "[shutdown] port still bound: " << e.what() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_relay_and_client_count();
    ok = ok && test_player_name_tracked_and_released();
    ok = ok && test_no_destination_kicks();
    ok = ok && test_dial_failure_falls_back_once();
    ok = ok && test_disable_and_reenable();
    ok = ok && test_choose_destination();
    ok = ok && test_detach_never_negative();
    ok = ok && test_shutdown_releases_everything();

    if (!ok) {
        std::cerr << "ListenServer tests FAILED\n";
        return 1;
    }

    std::cout << "ListenServer tests PASSED\n";
    return 0;
}
