#pragma once

#include <dimensions/core/Defaults.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/core/Options.hpp>
#include <dimensions/routing/Topology.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dimensions::core
{

/// 프로세스 기동 시에만 읽는 설정 ([engine] 섹션). reload 대상이 아닙니다.
struct EngineSettings
{
    LogLevel logLevel{LogLevel::Info};

    /// 빈 문자열이면 std::clog 로 출력합니다.
    std::string logFilePath;

    std::string listenAddress{"0.0.0.0"};

    std::uint32_t tickResolutionMs{defaults::kTickResolutionMs};
    std::size_t timerSlots{defaults::kTimerSlots};
    std::uint32_t maxEpollEvents{defaults::kMaxEpollEvents};

    /// dlopen 대상 *.so 를 찾을 디렉터리. 비어 있으면 extension 을 로드하지 않습니다.
    std::string extensionsDir;
};

/// 원격 명령 버스(Redis pub/sub) 접속 정보 ([control] 섹션)
struct ControlSettings
{
    bool enabled{false};
    std::string redisHost{"127.0.0.1"};
    std::uint16_t redisPort{defaults::kRedisPort};
    std::string channel{defaults::kControlChannel};
    std::uint32_t reconnectDelayMs{defaults::kRedisReconnectDelayMs};
    std::uint32_t connectTimeoutMs{defaults::kRedisConnectTimeoutMs}; ///< 접속 한 번의 제한 시간
};

/// reload 때마다 다시 읽는 부분: 토폴로지 + 옵션 patch
struct ProxyConfig
{
    std::vector<routing::TopologyEntry> servers;
    OptionsPatch options{};
};

struct LaunchConfig
{
    std::string configPath;
    EngineSettings engine{};
    ControlSettings control{};
    ProxyConfig proxy{};
};

} // namespace dimensions::core
