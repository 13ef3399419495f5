#include <dimensions/routing/ListenServer.hpp>

#include <dimensions/core/Logger.hpp>
#include <dimensions/routing/ClientSession.hpp>

#include <chrono>
#include <limits>
#include <utility>

namespace dimensions::routing
{

namespace
{
// 리스너가 여러 개여도 이름 추적 표에서 겹치지 않도록 프로세스 단위로 발급
std::uint64_t nextClientId() noexcept
{
    static std::uint64_t next = 1;
    return next++;
}
} // namespace

ListenServer::ListenServer(net::EventLoop &loop, const TopologyEntry &entry, SharedState shared,
                           const std::string &listenAddress)
    : loop_(loop), entry_(entry), shared_(std::move(shared)), port_(entry.listenPort),
      dialer_(loop)
{
    acceptor_ = std::make_unique<net::Acceptor>(listenAddress, entry.listenPort);
    acceptor_->setAcceptCallback(
        [this](net::Socket &&client, const net::Acceptor::PeerEndpoint &peer) {
            onAccept_(std::move(client), peer);
        });
    acceptor_->start(loop_);

    SLOG_INFO("ListenServer", "Listening", "addr={} port={} destinations={}", listenAddress,
              boundPort(), entry_.routingServers.size());
}

ListenServer::~ListenServer()
{
    shutdown();
}

std::uint16_t ListenServer::boundPort() const noexcept
{
    return acceptor_ ? acceptor_->listenPort() : port_;
}

void ListenServer::updateInfo(const TopologyEntry &entry)
{
    entry_ = entry;
    SLOG_INFO("ListenServer", "Updated", "port={} destinations={}", port_,
              entry_.routingServers.size());
}

void ListenServer::shutdown() noexcept
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;

    if (acceptor_)
    {
        acceptor_->stop();
    }
    dialer_.cancelAll();

    // 세션 파괴는 루프로 미룬다 (콜백 스택 위에 있을 수 있음)
    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto &[id, session] : sessions)
    {
        session->closeFromListener();
    }

    // 해제 타이머를 취소하면서 목적지는 바로 되살린다
    auto timers = std::move(disableTimers_);
    disableTimers_.clear();
    for (const auto &[name, timer] : timers)
    {
        (void)loop_.cancelTimer(timer);
        enableDestination_(name);
    }

    SLOG_INFO("ListenServer", "Shutdown", "port={} sessions={}", port_, sessions.size());

    try
    {
        loop_.post([sessions]() {});
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("ListenServer", "DeferFailed", "port={} what='{}'", port_, e.what());
    }
}

std::shared_ptr<RoutingServer> ListenServer::chooseDestination(const std::string &exclude) const
{
    std::shared_ptr<RoutingServer> best;
    std::uint32_t bestCount = std::numeric_limits<std::uint32_t>::max();

    for (const auto &server : entry_.routingServers)
    {
        if (!server || server->name == exclude)
        {
            continue;
        }

        std::uint32_t count = 0;
        const auto it = shared_.serverDetails->find(server->name);
        if (it != shared_.serverDetails->end())
        {
            if (it->second.disabled)
            {
                continue;
            }
            count = it->second.clientCount;
        }

        // 동률이면 설정 순서상 앞의 것
        if (!best || count < bestCount)
        {
            best = server;
            bestCount = count;
        }
    }
    return best;
}

void ListenServer::onBackendAttached(const std::string &name)
{
    auto &details = (*shared_.serverDetails)[name];
    ++details.clientCount;
    details.failedConnAttempts = 0;
}

void ListenServer::onBackendDetached(const std::string &name) noexcept
{
    const auto it = shared_.serverDetails->find(name);
    if (it != shared_.serverDetails->end() && it->second.clientCount > 0)
    {
        --it->second.clientCount;
    }
}

void ListenServer::onDialFailed(const std::string &name, const std::string &err)
{
    auto &details = (*shared_.serverDetails)[name];
    ++details.failedConnAttempts;

    SLOG_CH_ERROR(core::LogChannel::BackendError, "ListenServer", "BackendDialFailed",
                  "port={} dest={} attempts={} err='{}'", port_, name, details.failedConnAttempts,
                  err);

    const auto maxAttempts = shared_.options->backend.maxFailedAttempts;
    if (!stopped_ && maxAttempts > 0 && !details.disabled &&
        details.failedConnAttempts >= maxAttempts)
    {
        disableDestination_(name);
    }
}

void ListenServer::onSessionClosed(std::uint64_t clientId) noexcept
{
    const auto it = sessions_.find(clientId);
    if (it == sessions_.end())
    {
        return;
    }

    auto session = std::move(it->second);
    sessions_.erase(it);

    try
    {
        loop_.post([session]() {});
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("ListenServer", "DeferFailed", "cid={} what='{}'", clientId, e.what());
    }
}

void ListenServer::onAccept_(net::Socket &&client, const net::Acceptor::PeerEndpoint &peer)
{
    if (stopped_)
    {
        return;
    }

    const auto id = nextClientId();
    auto conn = net::Connection::create(loop_, std::move(client), id,
                                        peer.ip + ":" + std::to_string(peer.port));
    auto session = std::make_shared<ClientSession>(*this, id, std::move(conn));
    sessions_.emplace(id, session);

    SLOG_CH_INFO(core::LogChannel::ClientConnect, "ListenServer", "ClientConnected",
                 "cid={} peer={}:{} port={}", id, peer.ip, peer.port, port_);

    session->start();
}

void ListenServer::disableDestination_(const std::string &name)
{
    auto &details = (*shared_.serverDetails)[name];
    details.disabled = true;

    const auto disableMs = shared_.options->backend.disableMs;
    SLOG_WARN("ListenServer", "DestinationDisabled", "dest={} attempts={} for_ms={}", name,
              details.failedConnAttempts, disableMs);

    disableTimers_[name] = loop_.addTimer(std::chrono::milliseconds(disableMs), [this, name]() {
        disableTimers_.erase(name);
        enableDestination_(name);
    });
}

void ListenServer::enableDestination_(const std::string &name) noexcept
{
    const auto it = shared_.serverDetails->find(name);
    if (it == shared_.serverDetails->end())
    {
        return;
    }
    it->second.disabled = false;
    it->second.failedConnAttempts = 0;
    SLOG_INFO("ListenServer", "DestinationEnabled", "dest={}", name);
}

ListenServerFactory makeListenServerFactory(net::EventLoop &loop, std::string listenAddress)
{
    return [&loop, listenAddress = std::move(listenAddress)](
               const TopologyEntry &entry,
               const SharedState &shared) -> std::unique_ptr<IListenServer> {
        return std::make_unique<ListenServer>(loop, entry, shared, listenAddress);
    };
}

} // namespace dimensions::routing
