#include <dimensions/net/Acceptor.hpp>
#include <dimensions/net/EventLoop.hpp>
#include <dimensions/net/Socket.hpp>

#include <chrono>
#include <iostream>
#include <system_error>
#include <vector>

using dimensions::net::Acceptor;
using dimensions::net::EventLoop;
using dimensions::net::Socket;

namespace {

using namespace std::chrono_literals;

/// 접속 두 개를 만들면 EventLoop 위에서 두 번 콜백이 와야 합니다.
bool test_accepts_on_event_loop() {
    EventLoop loop(10ms, 64, 16);

    Acceptor acceptor("127.0.0.1", 0);
    const auto port = acceptor.listenPort();
    if (port == 0) {
        std::cerr << "[accept] listenPort() == 0\n";
        return false;
    }

    std::vector<Socket> accepted;
    std::vector<Acceptor::PeerEndpoint> peers;
    acceptor.setAcceptCallback([&](Socket &&client, const Acceptor::PeerEndpoint &peer) {
        accepted.push_back(std::move(client));
        peers.push_back(peer);
    });
    acceptor.start(loop);

    Socket c1 = Socket::createTcpIPv4();
    Socket c2 = Socket::createTcpIPv4();
    if (!c1.connect("127.0.0.1", port) || !c2.connect("127.0.0.1", port)) {
        std::cerr << "[accept] client connect failed\n";
        return false;
    }

    if (!loop.runUntil([&]() { return accepted.size() == 2; }, 2000ms)) {
        std::cerr << "[accept] accepted=" << accepted.size() << " (expected 2)\n";
        return false;
    }

    if (peers[0].ip != "127.0.0.1" || peers[0].port == 0) {
        std::cerr << "[accept] peer endpoint not filled: ip='" << peers[0].ip
                  << "' port=" << peers[0].port << "\n";
        return false;
    }
    return true;
}

/// 이미 쓰는 포트에 바인드하면 생성자가 std::system_error 를 던집니다.
bool test_bind_in_use_throws() {
    Acceptor first("127.0.0.1", 0);

    try {
        Acceptor second("127.0.0.1", first.listenPort());
    } catch (const std::system_error &) {
        return true;
    }
    std::cerr << "[in-use] second bind on the same port succeeded\n";
    return false;
}

/// stop() 은 루프에서 fd 를 빼고 소켓을 닫습니다. 두 번 불러도 됩니다.
bool test_stop_unregisters() {
    EventLoop loop(10ms, 64, 16);
    Acceptor acceptor("127.0.0.1", 0);
    acceptor.start(loop);

    if (loop.fdCount() != 1) {
        std::cerr << "[stop] fdCount=" << loop.fdCount() << " after start\n";
        return false;
    }

    acceptor.stop();
    acceptor.stop();

    if (loop.fdCount() != 0 || acceptor.isListening()) {
        std::cerr << "[stop] acceptor still registered or listening\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_accepts_on_event_loop();
    ok = ok && test_bind_in_use_throws();
    ok = ok && test_stop_unregisters();

    if (!ok) {
        std::cerr << "Acceptor tests FAILED\n";
        return 1;
    }

    std::cout << "Acceptor tests PASSED\n";
    return 0;
}
