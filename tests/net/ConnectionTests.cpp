#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/Connection.hpp>
#include <dimensions/net/Dialer.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/Socket.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using dimensions::net::Acceptor;
using dimensions::net::Connection;
using dimensions::net::ConnectionState;
using dimensions::net::Dialer;
using dimensions::net::EventLoop;
using dimensions::net::Socket;

namespace {

using namespace std::chrono_literals;

std::vector<std::uint8_t> bytesOf(const std::string &s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

/// 방금 열었다 닫은 포트 번호. 그 포트로의 connect 는 거절됩니다.
std::uint16_t closedPort() {
    Socket s = Socket::createTcpIPv4();
    if (!s.bind("127.0.0.1", 0)) {
        return 0;
    }
    return s.localPort();
}

/// Dialer 로 연결하고 Connection 두 개가 echo 를 주고받습니다.
bool test_dial_and_echo() {
    EventLoop loop(10ms, 64, 32);

    Acceptor acceptor("127.0.0.1", 0);
    std::shared_ptr<Connection> server;
    acceptor.setAcceptCallback([&](Socket &&sock, const Acceptor::PeerEndpoint &peer) {
        server = Connection::create(loop, std::move(sock), 1, peer.ip);
        server->setDataCallback([](Connection &c, std::vector<std::uint8_t> &in) {
            (void)c.send(in);
            in.clear();
        });
        (void)server->start();
    });
    acceptor.start(loop);

    Dialer dialer(loop);
    std::shared_ptr<Connection> client;
    std::string received;
    bool dialDone = false;
    bool dialOk = false;

    (void)dialer.dial("127.0.0.1", acceptor.listenPort(), 1000ms,
                      [&](bool ok, Socket &&sock, std::string err) {
                          dialDone = true;
                          dialOk = ok;
                          if (!ok) {
                              std::cerr << "[echo] dial failed: " << err << "\n";
                              return;
                          }
                          client = Connection::create(loop, std::move(sock), 2, "backend");
                          client->setDataCallback(
                              [&](Connection &, std::vector<std::uint8_t> &in) {
                                  received.append(in.begin(), in.end());
                                  in.clear();
                              });
                          (void)client->start();
                      });

    if (dialDone) {
        std::cerr << "[echo] dial callback ran synchronously\n";
        return false;
    }

    if (!loop.runUntil([&]() { return dialDone && server != nullptr; }, 2000ms) || !dialOk) {
        std::cerr << "[echo] dial/accept did not complete\n";
        return false;
    }

    const auto payload = bytesOf("hello dimensions");
    if (!client->send(payload)) {
        std::cerr << "[echo] client send failed\n";
        return false;
    }

    if (!loop.runUntil([&]() { return received == "hello dimensions"; }, 2000ms)) {
        std::cerr << "[echo] received='" << received << "'\n";
        return false;
    }
    return dialer.pending() == 0;
}

/// 상대가 끊으면 close 콜백이 한 번 호출되고, 우리가 close() 하면 호출되지 않습니다.
bool test_close_callback_only_on_peer_close() {
    EventLoop loop(10ms, 64, 32);

    Acceptor acceptor("127.0.0.1", 0);
    std::vector<std::shared_ptr<Connection>> accepted;
    int serverCloses = 0;
    acceptor.setAcceptCallback([&](Socket &&sock, const Acceptor::PeerEndpoint &peer) {
        auto conn = Connection::create(loop, std::move(sock), accepted.size() + 1, peer.ip);
        conn->setCloseCallback([&](Connection &, std::string_view, int) { ++serverCloses; });
        (void)conn->start();
        accepted.push_back(conn);
    });
    acceptor.start(loop);

    Socket peer = Socket::createTcpIPv4();
    if (!peer.connect("127.0.0.1", acceptor.listenPort())) {
        std::cerr << "[close] connect failed\n";
        return false;
    }
    if (!loop.runUntil([&]() { return accepted.size() == 1; }, 2000ms)) {
        std::cerr << "[close] not accepted\n";
        return false;
    }

    peer.close();
    if (!loop.runUntil([&]() { return serverCloses == 1; }, 2000ms)) {
        std::cerr << "[close] close callback not invoked on peer close\n";
        return false;
    }
    if (accepted[0]->state() != ConnectionState::Closed || loop.fdCount() != 1) {
        std::cerr << "[close] connection not torn down\n";
        return false;
    }

    Socket peer2 = Socket::createTcpIPv4();
    if (!peer2.connect("127.0.0.1", acceptor.listenPort()) ||
        !loop.runUntil([&]() { return accepted.size() == 2; }, 2000ms)) {
        std::cerr << "[close] second connect failed\n";
        return false;
    }

    accepted[1]->close();
    loop.runUntil([]() { return false; }, 50ms);
    if (serverCloses != 1) {
        std::cerr << "[close] close() invoked the close callback\n";
        return false;
    }
    return true;
}

/// closeAfterFlush 는 보낸 데이터가 상대에게 도착한 뒤에 닫습니다.
bool test_close_after_flush_delivers() {
    EventLoop loop(10ms, 64, 32);

    Acceptor acceptor("127.0.0.1", 0);
    std::shared_ptr<Connection> server;
    acceptor.setAcceptCallback([&](Socket &&sock, const Acceptor::PeerEndpoint &peer) {
        server = Connection::create(loop, std::move(sock), 1, peer.ip);
        (void)server->start();
        (void)server->send(bytesOf("bye"));
        server->closeAfterFlush();
    });
    acceptor.start(loop);

    Dialer dialer(loop);
    std::shared_ptr<Connection> client;
    std::string received;
    bool clientClosed = false;
    (void)dialer.dial("127.0.0.1", acceptor.listenPort(), 1000ms,
                      [&](bool ok, Socket &&sock, std::string) {
                          if (!ok) {
                              return;
                          }
                          client = Connection::create(loop, std::move(sock), 2, "server");
                          client->setDataCallback(
                              [&](Connection &, std::vector<std::uint8_t> &in) {
                                  received.append(in.begin(), in.end());
                                  in.clear();
                              });
                          client->setCloseCallback(
                              [&](Connection &, std::string_view, int) { clientClosed = true; });
                          (void)client->start();
                      });

    if (!loop.runUntil([&]() { return clientClosed; }, 2000ms)) {
        std::cerr << "[flush] client never saw the close\n";
        return false;
    }
    if (received != "bye") {
        std::cerr << "[flush] received='" << received << "'\n";
        return false;
    }
    return true;
}

/// 닫힌 포트로 dial 하면 ok=false 가 비동기로 옵니다.
bool test_dial_refused() {
    EventLoop loop(10ms, 64, 16);
    Dialer dialer(loop);

    const auto port = closedPort();
    if (port == 0) {
        std::cerr << "[refused] could not reserve a port\n";
        return false;
    }

    bool done = false;
    bool ok = true;
    std::string err;
    (void)dialer.dial("127.0.0.1", port, 1000ms, [&](bool success, Socket &&sock, std::string e) {
        done = true;
        ok = success || sock.isValid();
        err = std::move(e);
    });

    if (!loop.runUntil([&]() { return done; }, 2000ms)) {
        std::cerr << "[refused] no callback\n";
        return false;
    }
    if (ok || err.empty()) {
        std::cerr << "[refused] expected failure with an error string\n";
        return false;
    }
    return dialer.pending() == 0 && loop.fdCount() == 0;
}

/// 호스트 이름은 거절되지만 콜백은 여전히 비동기입니다.
bool test_dial_hostname_fails_async() {
    EventLoop loop(10ms, 64, 16);
    Dialer dialer(loop);

    bool done = false;
    bool ok = true;
    (void)dialer.dial("localhost", 7777, 1000ms, [&](bool success, Socket &&, std::string) {
        done = true;
        ok = success;
    });
    if (done) {
        std::cerr << "[hostname] callback ran synchronously\n";
        return false;
    }

    loop.runOnce();
    if (!done || ok) {
        std::cerr << "[hostname] expected asynchronous failure\n";
        return false;
    }
    return true;
}

/// cancel 한 dial 은 콜백을 부르지 않습니다.
bool test_dial_cancel_is_silent() {
    EventLoop loop(10ms, 64, 16);
    Acceptor acceptor("127.0.0.1", 0);

    Dialer dialer(loop);
    int callbacks = 0;
    const auto id = dialer.dial("127.0.0.1", acceptor.listenPort(), 1000ms,
                                [&](bool, Socket &&, std::string) { ++callbacks; });
    (void)dialer.dial("localhost", 1, 1000ms, [&](bool, Socket &&, std::string) { ++callbacks; });

    dialer.cancel(id);
    dialer.cancelAll();

    loop.runUntil([]() { return false; }, 50ms);
    if (callbacks != 0 || dialer.pending() != 0) {
        std::cerr << "[cancel] callbacks=" << callbacks << " pending=" << dialer.pending()
                  << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_dial_and_echo();
    ok = ok && test_close_callback_only_on_peer_close();
    ok = ok && test_close_after_flush_delivers();
    ok = ok && test_dial_refused();
    ok = ok && test_dial_hostname_fails_async();
    ok = ok && test_dial_cancel_is_silent();

    if (!ok) {
        std::cerr << "Connection tests FAILED\n";
        return 1;
    }

    std::cout << "Connection tests PASSED\n";
    return 0;
}
