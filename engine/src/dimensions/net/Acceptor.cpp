#include <dimensions/net/Acceptor.hpp>

#include <dimensions/core/Logger.hpp>
#include <dimensions/net/EventLoop.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <utility>

namespace dimensions::net
{

namespace
{

[[noreturn]] void throwSysError(const char *what)
{
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

Acceptor::Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog)
    : listenAddress_(std::move(listenAddress)), listenPort_(listenPort)
{
    listenSocket_ = Socket::createTcpIPv4();
    if (!listenSocket_.isValid())
    {
        throwSysError("Acceptor: socket(AF_INET, SOCK_STREAM) failed");
    }

    if (!listenSocket_.setReuseAddr(true))
    {
        throwSysError("Acceptor: setsockopt(SO_REUSEADDR) failed");
    }

    if (!listenSocket_.setNonBlocking(true))
    {
        throwSysError("Acceptor: O_NONBLOCK failed");
    }

    if (!listenSocket_.bind(listenAddress_, listenPort_))
    {
        throwSysError("Acceptor: bind() failed");
    }

    if (const auto bound = listenSocket_.localPort(); bound != 0)
    {
        listenPort_ = bound;
    }

    if (!listenSocket_.listen(backlog))
    {
        throwSysError("Acceptor: listen() failed");
    }

    SLOG_INFO("Acceptor", "Listening", "addr={} port={} backlog={}", listenAddress_, listenPort_,
              backlog);
}

Acceptor::~Acceptor()
{
    stop();
}

void Acceptor::start(EventLoop &loop)
{
    if (!loop.addFd(listenSocket_.nativeHandle(), EpollReactor::kListenInterest, this))
    {
        throwSysError("Acceptor: epoll registration failed");
    }
    loop_ = &loop;
}

void Acceptor::stop() noexcept
{
    if (!listenSocket_.isValid())
    {
        return;
    }

    if (loop_)
    {
        (void)loop_->removeFd(listenSocket_.nativeHandle());
        loop_ = nullptr;
    }
    listenSocket_.close();

    SLOG_INFO("Acceptor", "Stopped", "addr={} port={}", listenAddress_, listenPort_);
}

void Acceptor::handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev)
{
    (void)loop;

    if (ev.has(EpollReactor::Event::Error) || ev.has(EpollReactor::Event::Hangup))
    {
        SLOG_ERROR("Acceptor", "ListenSocketError", "port={} events=0x{:x}", listenPort_,
                   ev.events);
        stop();
        return;
    }

    if (ev.has(EpollReactor::Event::Read))
    {
        onReadable_();
    }
}

void Acceptor::onReadable_()
{
    // 콜백이 stop() 을 부를 수 있으므로 매 반복마다 소켓 유효성을 다시 본다.
    while (listenSocket_.isValid())
    {
        ::sockaddr_storage ss{};
        ::socklen_t slen = sizeof(ss);

        Socket client = listenSocket_.accept(reinterpret_cast<::sockaddr *>(&ss), &slen);
        if (!client.isValid())
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED)
            {
                continue;
            }

            SLOG_ERROR("Acceptor", "AcceptFailed", "port={} errno={} msg='{}'", listenPort_, errno,
                       std::strerror(errno));
            break;
        }

        (void)client.setNoDelay(true);

        PeerEndpoint peer{};
        fillPeerEndpoint(reinterpret_cast<::sockaddr *>(&ss), peer);

        SLOG_DEBUG("Acceptor", "Accepted", "port={} peer_ip={} peer_port={} fd={}", listenPort_,
                   peer.ip, peer.port, client.nativeHandle());

        if (!onAccept_)
        {
            continue; // client 는 여기서 닫힘
        }

        try
        {
            onAccept_(std::move(client), peer);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Acceptor", "OnAcceptException", "port={} what='{}'", listenPort_,
                       e.what());
        }
    }
}

void Acceptor::fillPeerEndpoint(const ::sockaddr *sa, PeerEndpoint &out) noexcept
{
    out.ip = "unknown";
    out.port = 0;

    if (!sa || sa->sa_family != AF_INET)
    {
        return;
    }

    char buf[INET_ADDRSTRLEN] = {};
    const auto *in = reinterpret_cast<const ::sockaddr_in *>(sa);
    if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)) != nullptr)
    {
        out.ip = buf;
    }
    out.port = ntohs(in->sin_port);
}

} // namespace dimensions::net
