#include <dimensions/net/Socket.hpp>

#include <arpa/inet.h>   // inet_pton
#include <cerrno>
#include <fcntl.h>       // fcntl, O_NONBLOCK
#include <netinet/in.h>  // sockaddr_in
#include <netinet/tcp.h> // TCP_NODELAY
#include <unistd.h>      // close

namespace dimensions::net
{

namespace
{

bool fillIpv4(const std::string &ip, std::uint16_t port, ::sockaddr_in &out) noexcept
{
    out = ::sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return ::inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

} // namespace

Socket::Socket(Handle fd) noexcept : fd_(fd) {}

Socket::~Socket() noexcept
{
    close();
}

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::createTcpIPv4() noexcept
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return Socket{};
    }
    return Socket{fd};
}

void Socket::close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::setNonBlocking(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
    {
        return false;
    }

    const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd_, F_SETFL, newFlags) != -1;
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != -1;
}

bool Socket::setNoDelay(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != -1;
}

bool Socket::bind(const std::string &ip, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    if (!fillIpv4(ip, port, addr))
    {
        errno = EINVAL;
        return false;
    }

    return ::bind(fd_, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != -1;
}

bool Socket::listen(int backlog) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::listen(fd_, backlog) != -1;
}

Socket Socket::accept(::sockaddr *addr, ::socklen_t *len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    const int newFd = ::accept4(fd_, addr, len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (newFd < 0)
    {
        return Socket{};
    }
    return Socket{newFd};
}

bool Socket::connect(const std::string &ip, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    if (!fillIpv4(ip, port, addr))
    {
        errno = EINVAL;
        return false;
    }

    return ::connect(fd_, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != -1;
}

std::uint16_t Socket::localPort() const noexcept
{
    if (!isValid())
    {
        return 0;
    }

    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<::sockaddr *>(&addr), &len) == -1)
    {
        return 0;
    }
    return addr.sin_family == AF_INET ? ntohs(addr.sin_port) : 0;
}

int Socket::pendingError() const noexcept
{
    if (!isValid())
    {
        return EBADF;
    }

    int soErr = 0;
    ::socklen_t slen = sizeof(soErr);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soErr, &slen) == -1)
    {
        return errno;
    }
    return soErr;
}

::ssize_t Socket::send(const void *data, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags | MSG_NOSIGNAL);
}

::ssize_t Socket::recv(void *buffer, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, flags);
}

} // namespace dimensions::net
