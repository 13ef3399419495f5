#include <dimensions/core/ConfigLoader.hpp>

#include <dimensions/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <arpa/inet.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace dimensions;
using namespace dimensions::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[ConfigLoader] " + detail;
    SLOG_ERROR("ConfigLoader", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}

void printUsage(const char *argv0)
{
    std::string exe = "dimensions";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
    std::cout << "Usage: " << exe << " --config <path.toml>\n";
}

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throwConfigError("Invalid log_level: " + std::string(s));
}

std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// [Strict Mode] 포트는 1..65535 (0 은 허용하지 않음)
std::uint16_t checkedPortFromI64(std::int64_t v, std::string_view key)
{
    if (v < 1 || v > 65535)
        throwConfigError(std::string(key) + " out of range (1..65535): " + std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

std::uint32_t checkedU32FromI64(std::int64_t v, std::string_view key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throwConfigError(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

void requireNumericIpv4(const std::string &ip, std::string_view key)
{
    ::in_addr addr{};
    if (::inet_pton(AF_INET, ip.c_str(), &addr) != 1)
        throwConfigError(std::string(key) + " must be a numeric IPv4 address: '" + ip + "'");
}

// [Strict Mode] Helper: Required Table
const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

// 키가 없으면 nullopt, 있는데 타입이 다르면 에러
std::optional<bool> optionalBool(const toml::table &t, std::string_view key, std::string_view path)
{
    const auto node = t[key];
    if (!node)
        return std::nullopt;
    if (auto b = node.value<bool>())
        return *b;
    throwConfigError(std::string(path) + " must be a boolean");
}

std::optional<std::int64_t> optionalInt(const toml::table &t, std::string_view key,
                                        std::string_view path)
{
    const auto node = t[key];
    if (!node)
        return std::nullopt;
    if (!node.is_integer())
        throwConfigError(std::string(path) + " must be an integer");
    return node.value<std::int64_t>();
}

std::optional<std::string> optionalString(const toml::table &t, std::string_view key,
                                          std::string_view path)
{
    const auto node = t[key];
    if (!node)
        return std::nullopt;
    if (!node.is_string())
        throwConfigError(std::string(path) + " must be a string");
    return node.value<std::string>();
}

std::optional<std::uint16_t> optionalPort(const toml::table &t, std::string_view key,
                                          std::string_view path)
{
    if (auto v = optionalInt(t, key, path))
        return checkedPortFromI64(*v, path);
    return std::nullopt;
}

std::optional<std::uint32_t> optionalU32(const toml::table &t, std::string_view key,
                                         std::string_view path)
{
    if (auto v = optionalInt(t, key, path))
        return checkedU32FromI64(*v, path);
    return std::nullopt;
}

toml::table parseTomlText(std::string_view text)
{
    try
    {
        return toml::parse(text);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.what()));
    }
}

toml::table parseTomlFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    try
    {
        return toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.what()));
    }
}

// -----------------------------------------------------------------------------
// Main Parsing Logic
// -----------------------------------------------------------------------------

void applyEngineToml(EngineSettings &cfg, const toml::table &root)
{
    // [Strict] [engine] 섹션 필수
    const toml::table &engine = requireTable(root, "engine");

    if (auto s = optionalString(engine, "log_level", "engine.log_level"))
        cfg.logLevel = parseLogLevel(*s);
    if (auto s = optionalString(engine, "log_file_path", "engine.log_file_path"))
        cfg.logFilePath = *s;

    if (auto s = optionalString(engine, "listen_address", "engine.listen_address"))
    {
        requireNumericIpv4(*s, "engine.listen_address");
        cfg.listenAddress = *s;
    }

    if (auto v = optionalU32(engine, "tick_resolution_ms", "engine.tick_resolution_ms"))
    {
        if (*v == 0)
            throwConfigError("engine.tick_resolution_ms must be >= 1");
        cfg.tickResolutionMs = *v;
    }
    if (auto v = optionalU32(engine, "timer_slots", "engine.timer_slots"))
    {
        if (*v == 0)
            throwConfigError("engine.timer_slots must be >= 1");
        cfg.timerSlots = *v;
    }
    if (auto v = optionalU32(engine, "max_epoll_events", "engine.max_epoll_events"))
    {
        if (*v == 0)
            throwConfigError("engine.max_epoll_events must be >= 1");
        cfg.maxEpollEvents = *v;
    }

    if (auto s = optionalString(engine, "extensions_dir", "engine.extensions_dir"))
        cfg.extensionsDir = *s;
}

void applyControlToml(ControlSettings &cfg, const toml::table &root)
{
    // [control] 이 없으면 원격 명령 채널 비활성
    const auto *control = root["control"].as_table();
    if (!control)
    {
        cfg.enabled = false;
        return;
    }

    cfg.enabled = optionalBool(*control, "enabled", "control.enabled").value_or(true);

    if (auto s = optionalString(*control, "redis_host", "control.redis_host"))
    {
        requireNumericIpv4(*s, "control.redis_host");
        cfg.redisHost = *s;
    }
    if (auto p = optionalPort(*control, "redis_port", "control.redis_port"))
        cfg.redisPort = *p;
    if (auto s = optionalString(*control, "channel", "control.channel"))
    {
        if (s->empty())
            throwConfigError("control.channel must not be empty");
        cfg.channel = *s;
    }
    if (auto v = optionalU32(*control, "reconnect_delay_ms", "control.reconnect_delay_ms"))
        cfg.reconnectDelayMs = *v;
    if (auto v = optionalU32(*control, "connect_timeout_ms", "control.connect_timeout_ms"))
    {
        if (*v == 0)
            throwConfigError("control.connect_timeout_ms must be > 0");
        cfg.connectTimeoutMs = *v;
    }
}

std::shared_ptr<routing::RoutingServer> parseRoutingServer(const toml::table &t,
                                                           std::string_view path)
{
    auto rs = std::make_shared<routing::RoutingServer>();

    auto name = optionalString(t, "name", std::string(path) + ".name");
    if (!name || name->empty())
        throwConfigError(std::string(path) + ".name is required");
    rs->name = *name;

    auto ip = optionalString(t, "server_ip", std::string(path) + ".server_ip");
    if (!ip)
        throwConfigError(std::string(path) + ".server_ip is required");
    requireNumericIpv4(*ip, std::string(path) + ".server_ip");
    rs->serverIp = *ip;

    auto port = optionalPort(t, "server_port", std::string(path) + ".server_port");
    if (!port)
        throwConfigError(std::string(path) + ".server_port is required");
    rs->serverPort = *port;

    rs->hidden = optionalBool(t, "hidden", std::string(path) + ".hidden").value_or(false);
    return rs;
}

void applyServersToml(ProxyConfig &cfg, const toml::table &root)
{
    const auto *servers = root["servers"].as_array();
    if (!servers || servers->empty())
        throw std::runtime_error("Missing required [[servers]] section");

    std::set<std::uint16_t> ports;
    std::set<std::string> names;

    std::size_t index = 0;
    for (const auto &node : *servers)
    {
        const std::string path = "servers[" + std::to_string(index++) + "]";
        const auto *t = node.as_table();
        if (!t)
            throwConfigError(path + " must be a table");

        routing::TopologyEntry entry{};
        auto listenPort = optionalPort(*t, "listen_port", path + ".listen_port");
        if (!listenPort)
            throwConfigError(path + ".listen_port is required");
        entry.listenPort = *listenPort;

        if (!ports.insert(entry.listenPort).second)
            throwConfigError("duplicate listen_port: " + std::to_string(entry.listenPort));

        const auto *pool = (*t)["routing_servers"].as_array();
        if (!pool || pool->empty())
            throwConfigError(path + ".routing_servers must list at least one server");

        std::size_t j = 0;
        for (const auto &rsNode : *pool)
        {
            const std::string rsPath = path + ".routing_servers[" + std::to_string(j++) + "]";
            const auto *rsTable = rsNode.as_table();
            if (!rsTable)
                throwConfigError(rsPath + " must be a table");

            auto rs = parseRoutingServer(*rsTable, rsPath);
            if (!names.insert(rs->name).second)
                throwConfigError("duplicate routing server name: " + rs->name);
            entry.routingServers.push_back(std::move(rs));
        }

        cfg.servers.push_back(std::move(entry));
    }
}

void applyOptionsToml(OptionsPatch &patch, const toml::table &root)
{
    const auto *options = root["options"].as_table();
    if (!options)
        return;

    if (const auto *log = (*options)["log"].as_table())
    {
        patch.log.extensionLoad = optionalBool(*log, "extension_load", "options.log.extension_load");
        patch.log.clientConnect = optionalBool(*log, "client_connect", "options.log.client_connect");
        patch.log.clientDisconnect =
            optionalBool(*log, "client_disconnect", "options.log.client_disconnect");
        patch.log.clientError = optionalBool(*log, "client_error", "options.log.client_error");
        patch.log.backendError = optionalBool(*log, "backend_error", "options.log.backend_error");
    }

    if (const auto *rest = (*options)["rest_api"].as_table())
    {
        patch.restApi.enabled = optionalBool(*rest, "enabled", "options.rest_api.enabled");
        patch.restApi.port = optionalPort(*rest, "port", "options.rest_api.port");
    }

    if (const auto *fake = (*options)["fake_version"].as_table())
    {
        patch.fakeVersion.enabled = optionalBool(*fake, "enabled", "options.fake_version.enabled");
        patch.fakeVersion.version = optionalU32(*fake, "version", "options.fake_version.version");
    }

    if (const auto *backend = (*options)["backend"].as_table())
    {
        patch.backend.connectTimeoutMs =
            optionalU32(*backend, "connect_timeout_ms", "options.backend.connect_timeout_ms");
        patch.backend.maxFailedAttempts =
            optionalU32(*backend, "max_failed_attempts", "options.backend.max_failed_attempts");
        patch.backend.disableMs = optionalU32(*backend, "disable_ms", "options.backend.disable_ms");
    }
}

void validateFailFast(const ProxyConfig &cfg)
{
    if (cfg.options.restApi.port)
    {
        for (const auto &entry : cfg.servers)
        {
            if (entry.listenPort == *cfg.options.restApi.port)
                throwConfigError("options.rest_api.port must not be equal to a listen_port");
        }
    }
}

ProxyConfig proxyFromToml(const toml::table &root)
{
    ProxyConfig cfg{};
    applyServersToml(cfg, root);
    applyOptionsToml(cfg.options, root);
    validateFailFast(cfg);
    return cfg;
}

LaunchConfig launchFromToml(const toml::table &root)
{
    LaunchConfig cfg{};
    applyEngineToml(cfg.engine, root);
    applyControlToml(cfg.control, root);
    cfg.proxy = proxyFromToml(root);
    return cfg;
}

} // namespace

namespace dimensions::core
{

LaunchConfig ConfigLoader::load(int argc, char **argv)
{
    // Help Check
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }

    const toml::table root = parseTomlFile(*configOpt);

    LaunchConfig cfg = launchFromToml(root);
    cfg.configPath = *configOpt;

    SLOG_INFO("ConfigLoader", "Loaded", "path={} servers={} control={}", cfg.configPath,
              cfg.proxy.servers.size(), cfg.control.enabled ? "on" : "off");
    return cfg;
}

ProxyConfig ConfigLoader::loadProxyFile(const std::string &path)
{
    const toml::table root = parseTomlFile(path);
    return proxyFromToml(root);
}

LaunchConfig ConfigLoader::parseLaunchConfig(std::string_view tomlText)
{
    return launchFromToml(parseTomlText(tomlText));
}

ProxyConfig ConfigLoader::parseProxyConfig(std::string_view tomlText)
{
    return proxyFromToml(parseTomlText(tomlText));
}

} // namespace dimensions::core
