#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>  // ssize_t
#include <sys/socket.h> // sockaddr, socklen_t

#include <dimensions/util/NonCopyable.hpp>

namespace dimensions::net {

/// POSIX 소켓 fd 를 RAII 로 감싸는 move-only 래퍼입니다.
///
/// - 클라이언트 소켓, 백엔드 dial 소켓, 리스닝 소켓 모두 이 타입으로 소유합니다.
/// - 프로토콜/연결 상태는 알지 못합니다. (그건 Connection 의 몫)
class Socket : private dimensions::util::NonCopyable {
  public:
    using Handle = int;

    Socket() noexcept = default;
    explicit Socket(Handle fd) noexcept;
    ~Socket() noexcept;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    /// TCP/IPv4 스트림 소켓 (CLOEXEC)
    [[nodiscard]] static Socket createTcpIPv4() noexcept;

    /// 이미 닫힌 소켓에 호출해도 안전합니다.
    void close() noexcept;

    [[nodiscard]] bool setNonBlocking(bool enable) noexcept;
    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;

    /// IPv4 문자열 주소/포트로 bind 합니다. (예: "0.0.0.0", 7777)
    [[nodiscard]] bool bind(const std::string &ip, std::uint16_t port) noexcept;
    [[nodiscard]] bool listen(int backlog) noexcept;

    /// 실패 시 isValid()==false 인 Socket. 성공한 소켓은 NONBLOCK|CLOEXEC 입니다.
    [[nodiscard]] Socket accept(::sockaddr *addr, ::socklen_t *len) noexcept;

    /// 논블로킹 소켓이면 false + errno==EINPROGRESS 가 정상 경로입니다.
    [[nodiscard]] bool connect(const std::string &ip, std::uint16_t port) noexcept;

    /// getsockname 기준 로컬 포트 (port 0 bind 후 실제 포트 확인용). 실패 시 0.
    [[nodiscard]] std::uint16_t localPort() const noexcept;

    /// getsockopt(SO_ERROR). 조회 자체가 실패하면 errno 를 반환합니다.
    [[nodiscard]] int pendingError() const noexcept;

    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len, int flags = 0) noexcept;

  private:
    Handle fd_{-1};
};

} // namespace dimensions::net
