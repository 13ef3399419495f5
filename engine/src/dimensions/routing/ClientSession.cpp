#include <dimensions/routing/ClientSession.hpp>

#include <dimensions/core/Defaults.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/protocol/Packets.hpp>
#include <dimensions/protocol/TerrariaFramer.hpp>
#include <dimensions/routing/ListenServer.hpp>

#include <chrono>
#include <span>
#include <utility>

namespace dimensions::routing
{

ClientSession::ClientSession(ListenServer &owner, std::uint64_t clientId,
                             std::shared_ptr<net::Connection> client)
    : owner_(owner), clientId_(clientId), client_(std::move(client))
{
}

ClientSession::~ClientSession()
{
    // owner_ 는 이미 사라졌을 수 있으므로 소켓만 정리한다
    if (backend_)
    {
        backend_->close();
    }
    if (client_)
    {
        client_->close();
    }
}

void ClientSession::start()
{
    const std::weak_ptr<ClientSession> weak = weak_from_this();

    client_->setDataCallback([weak](net::Connection &, std::vector<std::uint8_t> &inbound) {
        if (auto self = weak.lock())
        {
            self->onClientData_(inbound);
        }
    });
    client_->setCloseCallback([weak](net::Connection &, std::string_view reason, int err) {
        auto self = weak.lock();
        if (!self || self->state_ == SessionState::Closed)
        {
            return;
        }
        if (err != 0)
        {
            SLOG_CH_WARN(core::LogChannel::ClientError, "ClientSession", "ClientError",
                         "cid={} name='{}' reason='{}' err={}", self->clientId_,
                         self->playerName_, reason, err);
        }
        SLOG_CH_INFO(core::LogChannel::ClientDisconnect, "ClientSession", "ClientDisconnected",
                     "cid={} name='{}' dest={}", self->clientId_, self->playerName_,
                     self->currentDestination());
        self->finish_(true);
    });

    if (!client_->start())
    {
        SLOG_ERROR("ClientSession", "StartFailed", "cid={} peer={}", clientId_, client_->peer());
        finish_(true);
        return;
    }

    auto target = owner_.chooseDestination({});
    if (!target)
    {
        disconnect("No available dimension");
        return;
    }
    dial_(std::move(target));
}

void ClientSession::closeFromListener() noexcept
{
    if (state_ == SessionState::Closed)
    {
        return;
    }
    if (client_)
    {
        client_->close();
    }
    finish_(false);
}

std::uint16_t ClientSession::listenPort() const noexcept
{
    return owner_.port();
}

std::string ClientSession::currentDestination() const
{
    return destination_ ? destination_->name : std::string{};
}

bool ClientSession::sendToClient(std::vector<std::uint8_t> frame)
{
    if (!client_ || !client_->isOpen())
    {
        return false;
    }
    return client_->send(frame);
}

bool ClientSession::sendToBackend(std::vector<std::uint8_t> frame)
{
    if (state_ == SessionState::Closed)
    {
        return false;
    }

    if (state_ == SessionState::Relaying && backend_)
    {
        return backend_->send(frame);
    }

    // dial 중: 연결되면 순서대로 흘려보낸다
    pendingBytes_ += frame.size();
    if (pendingBytes_ > core::defaults::kMaxOutboundBytes)
    {
        SLOG_CH_WARN(core::LogChannel::ClientError, "ClientSession", "ClientError",
                     "cid={} reason='pending overflow' bytes={}", clientId_, pendingBytes_);
        disconnect("Too much data while connecting");
        return false;
    }
    pendingToBackend_.push_back(std::move(frame));
    return true;
}

bool ClientSession::requestTransfer(const std::string &destination)
{
    if (state_ == SessionState::Closed)
    {
        return false;
    }

    const auto &destinations = *owner_.shared().destinations;
    const auto it = destinations.find(destination);
    if (it == destinations.end() || !it->second)
    {
        return false;
    }

    SLOG_INFO("ClientSession", "Transfer", "cid={} name='{}' from={} to={}", clientId_,
              playerName_, currentDestination(), destination);

    detachBackend_();
    transferring_ = true;
    retried_ = true; // 직접 고른 목적지이므로 다른 곳으로 넘기지 않는다
    dial_(it->second);
    return true;
}

void ClientSession::disconnect(std::string_view reason)
{
    if (state_ == SessionState::Closed)
    {
        return;
    }

    SLOG_CH_INFO(core::LogChannel::ClientDisconnect, "ClientSession", "Kick",
                 "cid={} name='{}' reason='{}'", clientId_, playerName_, reason);

    if (client_ && client_->isOpen())
    {
        (void)client_->send(protocol::buildDisconnect(reason));
        client_->closeAfterFlush();
    }
    finish_(true);
}

void ClientSession::dial_(std::shared_ptr<RoutingServer> target)
{
    destination_ = std::move(target);
    state_ = SessionState::Dialing;

    const std::weak_ptr<ClientSession> weak = weak_from_this();
    const auto name = destination_->name;
    const auto timeout =
        std::chrono::milliseconds(owner_.shared().options->backend.connectTimeoutMs);

    SLOG_DEBUG("ClientSession", "Dial", "cid={} dest={} addr={}:{}", clientId_, name,
               destination_->serverIp, destination_->serverPort);

    dialId_ = owner_.dialer().dial(
        destination_->serverIp, destination_->serverPort, timeout,
        [weak, name](bool ok, net::Socket &&sock, std::string err) {
            if (auto self = weak.lock())
            {
                self->onDialResult_(name, ok, std::move(sock), err);
            }
        });
}

void ClientSession::onDialResult_(const std::string &name, bool ok, net::Socket &&sock,
                                  const std::string &err)
{
    dialId_ = 0;
    if (state_ == SessionState::Closed)
    {
        return;
    }

    if (!ok)
    {
        owner_.onDialFailed(name, err);
        if (!retried_)
        {
            retried_ = true;
            auto next = owner_.chooseDestination(name);
            if (next)
            {
                dial_(std::move(next));
                return;
            }
        }
        disconnect("No available dimension");
        return;
    }

    const std::weak_ptr<ClientSession> weak = weak_from_this();
    backend_ = net::Connection::create(owner_.loop(), std::move(sock), clientId_, name);
    backend_->setDataCallback([weak](net::Connection &, std::vector<std::uint8_t> &inbound) {
        if (auto self = weak.lock())
        {
            self->onBackendData_(inbound);
        }
    });
    backend_->setCloseCallback([weak](net::Connection &, std::string_view reason, int err) {
        if (auto self = weak.lock())
        {
            self->onBackendClosed_(reason, err);
        }
    });

    if (!backend_->start())
    {
        backend_.reset();
        owner_.onDialFailed(name, "epoll registration failed");
        disconnect("No available dimension");
        return;
    }

    attached_ = true;
    owner_.onBackendAttached(name);
    state_ = SessionState::Relaying;

    if (!playerName_.empty())
    {
        owner_.shared().tracking->updateDestination(playerName_, clientId_, name);
    }

    SLOG_DEBUG("ClientSession", "BackendAttached", "cid={} dest={} transfer={}", clientId_, name,
               transferring_);

    // 새 백엔드는 핸드셰이크부터 다시 봐야 한다
    if (transferring_ && !connectRequest_.empty())
    {
        (void)backend_->send(connectRequest_);
    }
    transferring_ = false;
    retried_ = false;

    auto pending = std::move(pendingToBackend_);
    pendingToBackend_.clear();
    pendingBytes_ = 0;
    for (const auto &frame : pending)
    {
        if (!backend_ || !backend_->send(frame))
        {
            break;
        }
    }
}

void ClientSession::onClientData_(std::vector<std::uint8_t> &inbound)
{
    std::size_t offset = 0;

    while (state_ != SessionState::Closed && offset < inbound.size())
    {
        std::size_t frameLen = 0;
        const auto r = protocol::TerrariaFramer::tryFrame(
            std::span<const std::uint8_t>(inbound).subspan(offset), frameLen);

        if (r == protocol::FrameResult::NeedMore)
        {
            break;
        }
        if (r == protocol::FrameResult::Invalid)
        {
            SLOG_CH_WARN(core::LogChannel::ClientError, "ClientSession", "ClientError",
                         "cid={} reason='{}'", clientId_,
                         protocol::TerrariaFramer::lastErrorReason());
            inbound.clear();
            client_->close();
            finish_(true);
            return;
        }

        const auto first = inbound.begin() + static_cast<std::ptrdiff_t>(offset);
        auto packet = protocol::makePacket(
            std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(frameLen)));
        offset += frameLen;

        // 처리 도중 reloadhandlers 가 와도 이 패킷은 지금 잡은 핸들러로 끝낸다
        const auto &shared = owner_.shared();
        auto handler = shared.handlers->clientPacketHandler;

        auto verdict = protocol::PacketVerdict::Drop;
        try
        {
            verdict = handler->handlePacket(*this, packet, shared);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("ClientSession", "HandlerFailed", "cid={} type={} what='{}'", clientId_,
                       packet.type, e.what());
        }

        if (state_ == SessionState::Closed)
        {
            break;
        }
        if (verdict == protocol::PacketVerdict::Forward)
        {
            if (packet.is(protocol::PacketType::ConnectRequest))
            {
                connectRequest_ = packet.data;
            }
            (void)sendToBackend(std::move(packet.data));
        }
    }

    if (state_ == SessionState::Closed)
    {
        inbound.clear();
        return;
    }
    inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(offset));
}

void ClientSession::onBackendData_(std::vector<std::uint8_t> &inbound)
{
    std::size_t offset = 0;

    while (state_ == SessionState::Relaying && offset < inbound.size())
    {
        std::size_t frameLen = 0;
        const auto r = protocol::TerrariaFramer::tryFrame(
            std::span<const std::uint8_t>(inbound).subspan(offset), frameLen);

        if (r == protocol::FrameResult::NeedMore)
        {
            break;
        }
        if (r == protocol::FrameResult::Invalid)
        {
            SLOG_CH_ERROR(core::LogChannel::BackendError, "ClientSession", "BackendError",
                          "cid={} dest={} reason='{}'", clientId_, currentDestination(),
                          protocol::TerrariaFramer::lastErrorReason());
            inbound.clear();
            disconnect("Lost connection to " + currentDestination());
            return;
        }

        const auto first = inbound.begin() + static_cast<std::ptrdiff_t>(offset);
        auto packet = protocol::makePacket(
            std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(frameLen)));
        offset += frameLen;

        const auto &shared = owner_.shared();
        auto handler = shared.handlers->backendPacketHandler;

        auto verdict = protocol::PacketVerdict::Drop;
        try
        {
            verdict = handler->handlePacket(*this, packet, shared);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("ClientSession", "HandlerFailed", "cid={} type={} what='{}'", clientId_,
                       packet.type, e.what());
        }

        if (verdict == protocol::PacketVerdict::Forward)
        {
            (void)sendToClient(std::move(packet.data));
        }
    }

    // 전송(requestTransfer)으로 backend_ 가 바뀌었으면 이 버퍼는 이전 백엔드 것이다
    if (state_ != SessionState::Relaying)
    {
        inbound.clear();
        return;
    }
    inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(offset));
}

void ClientSession::onBackendClosed_(std::string_view reason, int err)
{
    if (state_ == SessionState::Closed)
    {
        return;
    }

    const auto name = currentDestination();
    SLOG_CH_ERROR(core::LogChannel::BackendError, "ClientSession", "BackendClosed",
                  "cid={} dest={} reason='{}' err={}", clientId_, name, reason, err);

    detachBackend_();
    disconnect("Lost connection to " + name);
}

void ClientSession::detachBackend_() noexcept
{
    if (dialId_ != 0)
    {
        owner_.dialer().cancel(dialId_);
        dialId_ = 0;
    }
    if (backend_)
    {
        backend_->close();
        backend_.reset();
    }
    if (attached_ && destination_)
    {
        owner_.onBackendDetached(destination_->name);
    }
    attached_ = false;
}

void ClientSession::finish_(bool notifyOwner) noexcept
{
    if (state_ == SessionState::Closed)
    {
        return;
    }
    state_ = SessionState::Closed;

    detachBackend_();
    if (!playerName_.empty())
    {
        (void)owner_.shared().tracking->releaseName(playerName_, clientId_);
    }
    pendingToBackend_.clear();
    pendingBytes_ = 0;

    if (notifyOwner)
    {
        owner_.onSessionClosed(clientId_);
    }
}

} // namespace dimensions::routing
