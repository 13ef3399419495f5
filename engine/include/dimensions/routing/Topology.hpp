#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dimensions::routing
{

/// 백엔드 목적지(= dimension) 하나. 이름은 전체 프로세스에서 유일하다.
struct RoutingServer
{
    std::string name;
    std::string serverIp;
    std::uint16_t serverPort{0};
    bool hidden{false}; ///< /dimensions 목록에서 숨김
};

/// 리스닝 포트 하나와 그 포트가 보낼 수 있는 백엔드 풀.
///
/// routingServers 의 shared_ptr 는 DestinationRegistry 에 그대로 등록된다(복사하지 않음).
struct TopologyEntry
{
    std::uint16_t listenPort{0};
    std::vector<std::shared_ptr<RoutingServer>> routingServers;
};

} // namespace dimensions::routing
