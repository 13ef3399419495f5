#include <dimensions/monitoring/RestApi.hpp>

#include <dimensions/core/Logger.hpp>

#include <span>
#include <sstream>
#include <utility>

namespace dimensions::monitoring
{

namespace
{
constexpr std::size_t kMaxRequestBytes = 8 * 1024;

constexpr const char *kMClients = "dimensions_clients";
constexpr const char *kMDisabled = "dimensions_disabled";
constexpr const char *kMFailedAttempts = "dimensions_failed_conn_attempts";
constexpr const char *kMTrackedPlayers = "dimensions_tracked_players";

inline bool startsWith(std::string_view s, std::string_view prefix) noexcept
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

inline bool matchesPath(std::string_view target, std::string_view path) noexcept
{
    return target == path ||
           (startsWith(target, path) && target.size() > path.size() && target[path.size()] == '?');
}

void appendHeader(std::ostringstream &os, const char *name, const char *help)
{
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " gauge\n";
}

template <typename Fn>
void appendPerDimension(std::ostringstream &os, const char *name, const char *help,
                        const routing::ServerDetailsRegistry &details, Fn &&value)
{
    appendHeader(os, name, help);
    for (const auto &[dimension, d] : details)
    {
        os << name << "{dimension=\"" << dimension << "\"} " << value(d) << "\n";
    }
}
} // namespace

std::string renderPlayers(const SharedState &shared)
{
    std::ostringstream os;
    for (const auto &[name, who] : shared.tracking->names())
    {
        os << name << " port=" << who.listenPort << " dest=" << who.destination << "\n";
    }
    return os.str();
}

std::string renderDimensions(const SharedState &shared)
{
    std::ostringstream os;
    for (const auto &[name, server] : *shared.destinations)
    {
        std::uint32_t clients = 0;
        bool disabled = false;
        const auto it = shared.serverDetails->find(name);
        if (it != shared.serverDetails->end())
        {
            clients = it->second.clientCount;
            disabled = it->second.disabled;
        }
        os << name << " " << server->serverIp << ":" << server->serverPort
           << " clients=" << clients << " disabled=" << (disabled ? 1 : 0) << "\n";
    }
    return os.str();
}

std::string renderMetrics(const SharedState &shared)
{
    const auto &details = *shared.serverDetails;

    std::ostringstream os;
    appendPerDimension(os, kMClients, "Clients currently attached to the dimension.", details,
                       [](const routing::ServerDetails &d) { return d.clientCount; });
    appendPerDimension(os, kMDisabled, "1 while the dimension is disabled after failed dials.",
                       details, [](const routing::ServerDetails &d) { return d.disabled ? 1 : 0; });
    appendPerDimension(os, kMFailedAttempts, "Consecutive failed backend dials.", details,
                       [](const routing::ServerDetails &d) { return d.failedConnAttempts; });

    appendHeader(os, kMTrackedPlayers, "Player names currently tracked across all listeners.");
    os << kMTrackedPlayers << " " << shared.tracking->size() << "\n";
    return os.str();
}

RestApi::RestApi(net::EventLoop &loop, std::string bindIp, std::uint16_t port,
                 SharedState shared)
    : loop_(loop), bindIp_(std::move(bindIp)), port_(port), shared_(std::move(shared))
{
    acceptor_ = bind_(port_);
}

RestApi::~RestApi()
{
    stop();
}

std::uint16_t RestApi::boundPort() const noexcept
{
    return acceptor_ ? acceptor_->listenPort() : port_;
}

void RestApi::stop() noexcept
{
    if (acceptor_)
    {
        acceptor_->stop();
        acceptor_.reset();
        SLOG_INFO("RestApi", "Stopped", "port={}", port_);
    }
    for (auto &[id, conn] : conns_)
    {
        conn->close();
    }
    conns_.clear();
}

void RestApi::handleReload(std::uint16_t port)
{
    if (port == port_ && acceptor_)
    {
        return;
    }

    // 새 포트를 먼저 잡는다. 실패하면 기존 바인드가 그대로 남는다.
    auto fresh = bind_(port);
    if (acceptor_)
    {
        acceptor_->stop();
    }
    acceptor_ = std::move(fresh);

    SLOG_INFO("RestApi", "Rebound", "old_port={} new_port={}", port_, port);
    port_ = port;
}

std::unique_ptr<net::Acceptor> RestApi::bind_(std::uint16_t port)
{
    auto acceptor = std::make_unique<net::Acceptor>(bindIp_, port);
    acceptor->setAcceptCallback(
        [this](net::Socket &&client, const net::Acceptor::PeerEndpoint &peer) {
            onAccept_(std::move(client), peer);
        });
    acceptor->start(loop_);

    SLOG_INFO("RestApi", "Listening", "url=http://{}:{}/api/dimensions", bindIp_,
              acceptor->listenPort());
    return acceptor;
}

void RestApi::onAccept_(net::Socket &&client, const net::Acceptor::PeerEndpoint &peer)
{
    sweep_();

    const auto id = nextConnId_++;
    auto conn = net::Connection::create(loop_, std::move(client), id,
                                        peer.ip + ":" + std::to_string(peer.port));

    conn->setDataCallback([this](net::Connection &c, std::vector<std::uint8_t> &inbound) {
        onData_(c, inbound);
    });
    // 핸들러 실행 중에는 Connection 이 스스로를 잡고 있으므로 여기서 지워도 된다
    conn->setCloseCallback(
        [this](net::Connection &c, std::string_view, int) { conns_.erase(c.id()); });

    if (!conn->start())
    {
        SLOG_WARN("RestApi", "AcceptFailed", "peer={}:{}", peer.ip, peer.port);
        return;
    }
    conns_.emplace(id, std::move(conn));
}

void RestApi::onData_(net::Connection &conn, std::vector<std::uint8_t> &inbound)
{
    const std::string_view req(reinterpret_cast<const char *>(inbound.data()), inbound.size());

    // 첫 줄만 있으면 충분하다
    if (req.find('\n') == std::string_view::npos)
    {
        if (inbound.size() > kMaxRequestBytes)
        {
            inbound.clear();
            sendTextResponse_(conn, 431, "Request Header Fields Too Large",
                              "text/plain; charset=utf-8", "request too large\n");
            conn.closeAfterFlush();
        }
        return;
    }

    std::string_view method;
    std::string_view target;
    if (!parseRequestTarget_(req, method, target))
    {
        sendTextResponse_(conn, 400, "Bad Request", "text/plain; charset=utf-8", "bad request\n");
    }
    else
    {
        respond_(conn, method, target);
    }

    inbound.clear();
    conn.closeAfterFlush();
}

void RestApi::respond_(net::Connection &conn, std::string_view method, std::string_view target)
{
    if (method != "GET")
    {
        sendTextResponse_(conn, 405, "Method Not Allowed", "text/plain; charset=utf-8",
                          "method not allowed\n");
        return;
    }

    if (matchesPath(target, "/api/players"))
    {
        sendTextResponse_(conn, 200, "OK", "text/plain; charset=utf-8", renderPlayers(shared_));
        return;
    }
    if (matchesPath(target, "/api/dimensions"))
    {
        sendTextResponse_(conn, 200, "OK", "text/plain; charset=utf-8",
                          renderDimensions(shared_));
        return;
    }
    if (matchesPath(target, "/metrics"))
    {
        sendTextResponse_(conn, 200, "OK", "text/plain; version=0.0.4; charset=utf-8",
                          renderMetrics(shared_));
        return;
    }

    sendTextResponse_(conn, 404, "Not Found", "text/plain; charset=utf-8", "not found\n");
}

void RestApi::sweep_() noexcept
{
    for (auto it = conns_.begin(); it != conns_.end();)
    {
        if (it->second->state() == net::ConnectionState::Closed)
        {
            it = conns_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool RestApi::parseRequestTarget_(std::string_view req, std::string_view &outMethod,
                                  std::string_view &outTarget) noexcept
{
    // 첫 줄만 파싱: "GET /path HTTP/1.1"
    std::size_t eol = req.find("\r\n");
    if (eol == std::string_view::npos)
    {
        eol = req.find('\n');
        if (eol == std::string_view::npos)
            return false;
    }

    const std::string_view line = req.substr(0, eol);

    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string_view::npos)
        return false;

    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos)
        return false;

    outMethod = line.substr(0, sp1);
    outTarget = line.substr(sp1 + 1, sp2 - (sp1 + 1));
    return true;
}

void RestApi::sendTextResponse_(net::Connection &conn, int code, std::string_view reason,
                                std::string_view contentType, const std::string &body)
{
    std::string out;
    out.reserve(256 + body.size());

    out += "HTTP/1.1 ";
    out += std::to_string(code);
    out += " ";
    out += reason;
    out += "\r\n";

    out += "Content-Type: ";
    out += contentType;
    out += "\r\n";

    out += "Content-Length: ";
    out += std::to_string(body.size());
    out += "\r\n";

    out += "Connection: close\r\n\r\n";
    out += body;

    (void)conn.send(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t *>(out.data()), out.size()));
}

ReportingSurfaceFactory makeRestApiFactory(net::EventLoop &loop, std::string bindIp)
{
    return [&loop, bindIp = std::move(bindIp)](
               std::uint16_t port,
               const SharedState &shared) -> std::unique_ptr<IReportingSurface> {
        return std::make_unique<RestApi>(loop, bindIp, port, shared);
    };
}

} // namespace dimensions::monitoring
