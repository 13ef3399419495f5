#pragma once

#include <dimensions/routing/Topology.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace dimensions::routing
{

/// 목적지 하나의 런타임 상태. 리스너가 갱신하고 orchestrator/REST 가 읽습니다.
struct ServerDetails
{
    std::uint32_t clientCount{0};
    std::uint32_t failedConnAttempts{0};
    bool disabled{false};
};

/// 이름 → 상태. 한 번 만들어진 항목은 지우지 않습니다. (reload 로 목적지가 빠져도 남음)
using ServerDetailsRegistry = std::map<std::string, ServerDetails>;

/// 이름 → 목적지. TopologyEntry 가 들고 있는 것과 같은 객체를 가리킵니다.
using DestinationRegistry = std::map<std::string, std::shared_ptr<RoutingServer>>;

/// 목적지를 이름으로 등록(덮어쓰기)하고, 처음 보는 이름이면 ServerDetails 를 만듭니다.
inline void registerDestination(DestinationRegistry &destinations,
                                ServerDetailsRegistry &details,
                                const std::shared_ptr<RoutingServer> &server)
{
    destinations[server->name] = server;
    details.try_emplace(server->name);
}

} // namespace dimensions::routing
