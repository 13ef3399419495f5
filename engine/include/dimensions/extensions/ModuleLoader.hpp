#pragma once

#include <dimensions/util/NonCopyable.hpp>

#include <memory>
#include <string>

namespace dimensions::extensions
{

/// 열린 공유 라이브러리 하나. 소멸 시 dlclose 합니다.
class LoadedModule : private dimensions::util::Pinned
{
  public:
    LoadedModule(std::string path, void *handle) noexcept;
    ~LoadedModule();

    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    /// 심볼이 없으면 nullptr
    [[nodiscard]] void *symbol(const char *name) const noexcept;

  private:
    std::string path_;
    void *handle_{nullptr};
};

/// 모듈을 여는 능력. extension 의 reload() 가 자기 모듈을 다시 열 때도 이걸 받습니다.
class IModuleLoader
{
  public:
    virtual ~IModuleLoader() = default;

    /// @throws std::runtime_error 열기 실패 (메시지에 dlerror 포함)
    virtual std::shared_ptr<LoadedModule> open(const std::string &path) = 0;
};

/// dlopen(RTLD_NOW | RTLD_LOCAL)
class DlModuleLoader final : public IModuleLoader
{
  public:
    std::shared_ptr<LoadedModule> open(const std::string &path) override;
};

} // namespace dimensions::extensions
