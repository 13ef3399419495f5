#pragma once

#include <dimensions/net/FdHandler.hpp>
#include <dimensions/net/Socket.hpp>
#include <dimensions/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::net
{

class EventLoop;

enum class ConnectionState : std::uint8_t
{
    Open = 0,
    Flushing, ///< closeAfterFlush() 이후: 남은 outbound 만 내보내고 닫힘
    Closed,
};

/// EventLoop 위의 TCP 스트림 하나 (클라이언트 쪽 또는 백엔드 쪽)
///
/// - edge-triggered. 읽기는 EAGAIN 까지 drain 해서 inbound 버퍼에 쌓고 data 콜백을 부릅니다.
///   콜백은 처리한 바이트를 inbound 앞에서 지웁니다. (남은 건 다음 수신 때 이어 붙음)
/// - send() 는 바로 write 를 시도하고 못 보낸 나머지만 outbound 에 쌓은 뒤 EPOLLOUT 을 켭니다.
/// - 상대가 끊거나 소켓 오류가 나면 close 콜백이 정확히 한 번 호출됩니다.
///   close()/closeAfterFlush() 처럼 우리가 먼저 닫는 경우에는 호출되지 않습니다.
/// - 소유자는 shared_ptr 로 들고 있습니다. 이벤트 처리 중에는 self 를 잡아 수명을 고정합니다.
class Connection final : private dimensions::util::NonCopyable,
                         public IFdHandler,
                         public std::enable_shared_from_this<Connection>
{
    struct PrivateTag
    {
    };

  public:
    using DataCallback = std::function<void(Connection &, std::vector<std::uint8_t> &inbound)>;
    using CloseCallback = std::function<void(Connection &, std::string_view reason, int err)>;

    Connection(PrivateTag, EventLoop &loop, Socket &&socket, std::uint64_t id,
               std::string peer) noexcept;
    ~Connection() override;

    [[nodiscard]] static std::shared_ptr<Connection> create(EventLoop &loop, Socket &&socket,
                                                            std::uint64_t id, std::string peer);

    void setDataCallback(DataCallback cb) noexcept { onData_ = std::move(cb); }
    void setCloseCallback(CloseCallback cb) noexcept { onClose_ = std::move(cb); }

    /// epoll 등록. 실패하면 소켓을 닫고 false.
    [[nodiscard]] bool start() noexcept;

    /// @return 연결이 여전히 열려 있으면 true
    bool send(std::span<const std::uint8_t> bytes) noexcept;

    /// 즉시 닫습니다. 콜백은 호출되지 않습니다.
    void close() noexcept;

    /// outbound 를 다 보낸 뒤 닫습니다. 이후 수신 데이터는 버려집니다.
    void closeAfterFlush() noexcept;

    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] bool isOpen() const noexcept { return state_ == ConnectionState::Open; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string &peer() const noexcept { return peer_; }
    [[nodiscard]] std::size_t pendingOutbound() const noexcept { return outbound_.size() - outHead_; }

    // ===== IFdHandler =====
    [[nodiscard]] const char *fdTag() const noexcept override { return "connection"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override { return id_; }
    void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) override;

  private:
    EventLoop &loop_;
    Socket socket_;
    std::uint64_t id_{0};
    std::string peer_;
    ConnectionState state_{ConnectionState::Open};
    bool registered_{false};
    bool writeInterest_{false};

    std::vector<std::uint8_t> inbound_;
    std::vector<std::uint8_t> outbound_;
    std::size_t outHead_{0};

    DataCallback onData_;
    CloseCallback onClose_;

    void onReadable_() noexcept;
    bool flush_() noexcept;
    void setWriteInterest_(bool enable) noexcept;
    void fail_(std::string_view reason, int err) noexcept;
    void teardown_() noexcept;

    [[nodiscard]] static std::uint32_t baseMask_() noexcept;
};

} // namespace dimensions::net
