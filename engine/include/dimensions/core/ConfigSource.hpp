#pragma once

#include <dimensions/core/ProxyConfig.hpp>

#include <string>
#include <utility>

namespace dimensions::core
{

/// reload 명령 때 새 토폴로지/옵션 문서를 가져오는 출처입니다.
///
/// - load() 는 문서 전체를 파싱/검증한 뒤에만 반환합니다.
///   잘못된 문서는 예외(std::runtime_error / std::invalid_argument)로 보고되고,
///   이 경우 live 상태는 전혀 건드리지 않습니다.
class IConfigSource
{
  public:
    virtual ~IConfigSource() = default;

    [[nodiscard]] virtual ProxyConfig load() = 0;
};

/// --config 로 받은 TOML 파일을 매번 다시 읽습니다.
class TomlConfigSource final : public IConfigSource
{
  public:
    explicit TomlConfigSource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] ProxyConfig load() override;

    [[nodiscard]] const std::string &path() const noexcept { return path_; }

  private:
    std::string path_;
};

} // namespace dimensions::core
