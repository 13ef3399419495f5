#pragma once

#include <dimensions/extensions/Extension.hpp>
#include <dimensions/extensions/ExtensionSource.hpp>
#include <dimensions/extensions/ModuleLoader.hpp>

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace dimensions::extensions
{

/// extension 목록의 unload → discover → load 순환과 명령 pass-through 를 담당합니다.
/// 목록 자체는 HandlerRegistry::extensions 에 있고, 여기서는 그 목록을 인자로 받아 고칩니다.
class ExtensionManager
{
  public:
    ExtensionManager(std::shared_ptr<IExtensionSource> source,
                     std::shared_ptr<IModuleLoader> loader);

    /// discover() 결과를 순서대로 onLoad 하고 능력을 캐시합니다.
    /// onLoad 가 던진 extension 은 로그 후 목록에서 뺍니다.
    /// 로드/언로드 한 줄 로그는 LogChannel::ExtensionLoad 가 켜져 있을 때만 남습니다.
    [[nodiscard]] std::vector<LoadedExtension> loadAll();

    /// 순서대로 onUnload 하고 목록을 비웁니다.
    void unloadAll(std::vector<LoadedExtension> &list) noexcept;

    /// unloadAll 후 loadAll 결과로 채웁니다.
    void reloadAll(std::vector<LoadedExtension> &list);

    /// reloadable 이고 reloadName 이 있는 extension 마다 reload(loader, command).
    /// @return 호출한 extension 수
    std::size_t passOnReload(const std::vector<LoadedExtension> &list, std::string_view command);

    [[nodiscard]] IModuleLoader &moduleLoader() noexcept { return *loader_; }

  private:
    std::shared_ptr<IExtensionSource> source_;
    std::shared_ptr<IModuleLoader> loader_;
};

} // namespace dimensions::extensions
