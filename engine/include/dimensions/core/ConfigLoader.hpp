#pragma once

#include <dimensions/core/ProxyConfig.hpp>

#include <string>
#include <string_view>

namespace dimensions::core
{

class ConfigLoader
{
  public:
    // 앱은 이 한 줄만 호출하면 됩니다. (--config <path.toml>, --help)
    static LaunchConfig load(int argc, char **argv);

    /// [engine]/[control] 을 제외한 reload 대상([[servers]], [options.*])만 다시 읽습니다.
    static ProxyConfig loadProxyFile(const std::string &path);

    /// 문자열로 된 TOML 문서 전체를 파싱합니다. (테스트/내장 설정용)
    static LaunchConfig parseLaunchConfig(std::string_view tomlText);

    static ProxyConfig parseProxyConfig(std::string_view tomlText);
};

} // namespace dimensions::core
