#pragma once

#include <dimensions/extensions/Extension.hpp>
#include <dimensions/extensions/ModuleLoader.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dimensions::extensions
{

/// 현재 로드해야 할 extension 목록을 돌려줍니다. 호출할 때마다 새 인스턴스를 만듭니다.
class IExtensionSource
{
  public:
    virtual ~IExtensionSource() = default;
    virtual std::vector<std::shared_ptr<IExtension>> discover() = 0;
};

/// 디렉터리의 *.so 를 이름순으로 열고 dimensions_extension_create() 를 호출합니다.
///
/// - 모듈 핸들은 인스턴스 shared_ptr 의 deleter 가 들고 있어서 인스턴스보다 먼저 닫히지 않습니다.
/// - 열기 실패, 심볼 없음, ABI 불일치, 생성 실패는 로그만 남기고 그 파일을 건너뜁니다.
/// - 디렉터리가 비었거나 없으면 빈 목록입니다.
class DirectoryExtensionSource final : public IExtensionSource
{
  public:
    DirectoryExtensionSource(std::string directory, std::shared_ptr<IModuleLoader> loader);

    std::vector<std::shared_ptr<IExtension>> discover() override;

    [[nodiscard]] const std::string &directory() const noexcept { return directory_; }

  private:
    std::string directory_;
    std::shared_ptr<IModuleLoader> loader_;

    [[nodiscard]] std::shared_ptr<IExtension> loadOne_(const std::string &path);
};

/// 코드로 만든 extension 을 돌려주는 source (테스트, 정적 링크 빌드)
class StaticExtensionSource final : public IExtensionSource
{
  public:
    using Factory = std::function<std::vector<std::shared_ptr<IExtension>>()>;

    explicit StaticExtensionSource(Factory factory) : factory_(std::move(factory)) {}

    std::vector<std::shared_ptr<IExtension>> discover() override
    {
        return factory_ ? factory_() : std::vector<std::shared_ptr<IExtension>>{};
    }

  private:
    Factory factory_;
};

} // namespace dimensions::extensions
