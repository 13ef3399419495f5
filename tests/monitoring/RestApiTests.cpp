#include <dimensions/SharedState.hpp>
#include <dimensions/monitoring/RestApi.hpp>
#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/Socket.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace monitoring = dimensions::monitoring;
namespace net = dimensions::net;
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

    auto lobby = std::make_shared<routing::RoutingServer>();
    lobby->name = "Lobby";
    lobby->serverIp = "10.0.0.1";
    lobby->serverPort = 7001;
    auto arena = std::make_shared<routing::RoutingServer>();
    arena->name = "Arena";
    arena->serverIp = "10.0.0.2";
    arena->serverPort = 7002;
    routing::registerDestination(*s.destinations, *s.serverDetails, lobby);
    routing::registerDestination(*s.destinations, *s.serverDetails, arena);

    (*s.serverDetails)["Lobby"].clientCount = 2;
    (*s.serverDetails)["Arena"].disabled = true;
    (*s.serverDetails)["Arena"].failedConnAttempts = 3;

    (void)s.tracking->claimName("Steve", routing::TrackedPlayer{1, 7777, "Lobby"});
    return s;
}

/// 요청 한 번 보내고 서버가 닫을 때까지 받은 전체 응답
std::string httpRequest(net::EventLoop &loop, std::uint16_t port, const std::string &request) {
    net::Socket sock = net::Socket::createTcpIPv4();
    if (!sock.connect("127.0.0.1", port) || !sock.setNonBlocking(true)) {
        return {};
    }
    (void)sock.send(request.data(), request.size());

    std::string response;
    bool eof = false;
    loop.runUntil(
        [&]() {
            char buf[4096];
            for (;;) {
                const auto n = sock.recv(buf, sizeof(buf));
                if (n > 0) {
                    response.append(buf, static_cast<std::size_t>(n));
                    continue;
                }
                eof = (n == 0);
                break;
            }
            return eof;
        },
        2000ms);
    return response;
}

bool test_render_players() {
    const auto shared = makeShared();
    const auto body = monitoring::renderPlayers(shared);
    if (body != "Steve port=7777 dest=Lobby\n") {
        std::cerr << "[players] got '" << body << "'\n";
        return false;
    }
    return true;
}

bool test_render_dimensions() {
    const auto shared = makeShared();
    const auto body = monitoring::renderDimensions(shared);
    const std::string expected = "Arena 10.0.0.2:7002 clients=0 disabled=1\n"
                                 "Lobby 10.0.0.1:7001 clients=2 disabled=0\n";
    if (body != expected) {
        std::cerr << "[dimensions] got '" << body << "'\n";
        return false;
    }
    return true;
}

bool test_render_metrics() {
    const auto shared = makeShared();
    const auto body = monitoring::renderMetrics(shared);

    const char *expectedLines[] = {
        "# TYPE dimensions_clients gauge\n",
        "dimensions_clients{dimension=\"Lobby\"} 2\n",
        "dimensions_disabled{dimension=\"Arena\"} 1\n",
        "dimensions_failed_conn_attempts{dimension=\"Arena\"} 3\n",
        "dimensions_tracked_players 1\n",
    };
    for (const auto *line : expectedLines) {
        if (body.find(line) == std::string::npos) {
            std::cerr << "[metrics] missing line: " << line;
            return false;
        }
    }
    return true;
}

/// GET 세 경로는 200, 쿼리 문자열은 무시, 모르는 경로는 404, GET 이 아니면 405
bool test_http_routes() {
    net::EventLoop loop(10ms, 64, 32);
    const auto shared = makeShared();
    monitoring::RestApi api(loop, "127.0.0.1", 0, shared);
    const auto port = api.boundPort();

    const auto dims = httpRequest(loop, port, "GET /api/dimensions HTTP/1.1\r\nHost: x\r\n\r\n");
    if (dims.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 ||
        dims.find("Lobby 10.0.0.1:7001 clients=2 disabled=0") == std::string::npos ||
        dims.find("Connection: close") == std::string::npos) {
        std::cerr << "[http] /api/dimensions response:\n" << dims << "\n";
        return false;
    }

    const auto players = httpRequest(loop, port, "GET /api/players?verbose=1 HTTP/1.1\r\n\r\n");
    if (players.rfind("HTTP/1.1 200 OK", 0) != 0 ||
        players.find("Steve port=7777 dest=Lobby") == std::string::npos) {
        std::cerr << "[http] /api/players response:\n" << players << "\n";
        return false;
    }

    const auto metrics = httpRequest(loop, port, "GET /metrics HTTP/1.1\r\n\r\n");
    if (metrics.find("dimensions_tracked_players 1") == std::string::npos) {
        std::cerr << "[http] /metrics response:\n" << metrics << "\n";
        return false;
    }

    if (httpRequest(loop, port, "GET /api/playersx HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 404", 0) !=
        0) {
        std::cerr << "[http] prefix path was not 404\n";
        return false;
    }
    if (httpRequest(loop, port, "POST /api/players HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 405", 0) !=
        0) {
        std::cerr << "[http] POST was not 405\n";
        return false;
    }
    if (httpRequest(loop, port, "garbage\r\n\r\n").rfind("HTTP/1.1 400", 0) != 0) {
        std::cerr << "[http] malformed request was not 400\n";
        return false;
    }
    return true;
}

/// 응답은 요청 시점의 레지스트리를 반영합니다.
bool test_http_reflects_live_state() {
    net::EventLoop loop(10ms, 64, 32);
    auto shared = makeShared();
    monitoring::RestApi api(loop, "127.0.0.1", 0, shared);

    (*shared.serverDetails)["Lobby"].clientCount = 9;
    const auto dims = httpRequest(loop, api.boundPort(), "GET /api/dimensions HTTP/1.1\r\n\r\n");
    if (dims.find("Lobby 10.0.0.1:7001 clients=9") == std::string::npos) {
        std::cerr << "[live] stale registry in response\n";
        return false;
    }
    return true;
}

/// handleReload 는 새 포트를 잡은 뒤 이전 포트를 놓습니다. 같은 포트면 아무것도 안 합니다.
bool test_handle_reload_rebinds() {
    net::EventLoop loop(10ms, 64, 32);
    const auto shared = makeShared();

    std::uint16_t fixedPort = 0;
    {
        net::Acceptor spare("127.0.0.1", 0);
        fixedPort = spare.listenPort();
    }
    monitoring::RestApi api(loop, "127.0.0.1", fixedPort, shared);
    if (api.port() != fixedPort) {
        std::cerr << "[reload] port()=" << api.port() << "\n";
        return false;
    }

    api.handleReload(fixedPort);
    if (api.boundPort() != fixedPort) {
        std::cerr << "[reload] same-port reload changed the bind\n";
        return false;
    }

    std::uint16_t nextPort = 0;
    {
        net::Acceptor spare("127.0.0.1", 0);
        nextPort = spare.listenPort();
    }
    api.handleReload(nextPort);
    if (api.port() != nextPort || api.boundPort() != nextPort) {
        std::cerr << "[reload] not rebound to " << nextPort << "\n";
        return false;
    }
    if (httpRequest(loop, nextPort, "GET /metrics HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 200", 0) !=
        0) {
        std::cerr << "[reload] new port does not answer\n";
        return false;
    }

    // 이전 포트는 풀렸으므로 다시 바인드할 수 있어야 함
    try {
        net::Acceptor again("127.0.0.1", fixedPort);
    } catch (const std::exception &e) {
        std::cerr << "[reload] old port still bound: " << e.what() << "\n";
        return false;
    }

    // 새 포트가 이미 쓰이면 던지고 기존 바인드는 유지
    net::Acceptor blocker("127.0.0.1", 0);
    try {
        api.handleReload(blocker.listenPort());
        std::cerr << "[reload] bind conflict did not throw\n";
        return false;
    } catch (const std::system_error &) {
    }
    if (api.port() != nextPort || api.boundPort() != nextPort) {
        std::cerr << "[reload] failed reload lost the old bind\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_render_players();
    ok = ok && test_render_dimensions();
    ok = ok && test_render_metrics();
    ok = ok && test_http_routes();
    ok = ok && test_http_reflects_live_state();
    ok = ok && test_handle_reload_rebinds();

    if (!ok) {
        std::cerr << "RestApi tests FAILED\n";
        return 1;
    }

    std::cout << "RestApi tests PASSED\n";
    return 0;
}
