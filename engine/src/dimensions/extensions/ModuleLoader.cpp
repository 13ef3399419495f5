#include <dimensions/extensions/ModuleLoader.hpp>

#include <dimensions/core/Logger.hpp>

#include <dlfcn.h>
#include <stdexcept>
#include <utility>

namespace dimensions::extensions
{

LoadedModule::LoadedModule(std::string path, void *handle) noexcept
    : path_(std::move(path)), handle_(handle)
{
}

LoadedModule::~LoadedModule()
{
    if (handle_)
    {
        if (::dlclose(handle_) != 0)
        {
            const char *err = ::dlerror();
            SLOG_WARN("ModuleLoader", "CloseFailed", "path={} err='{}'", path_,
                      err ? err : "unknown");
        }
        handle_ = nullptr;
    }
}

void *LoadedModule::symbol(const char *name) const noexcept
{
    if (!handle_ || !name)
    {
        return nullptr;
    }
    (void)::dlerror();
    return ::dlsym(handle_, name);
}

std::shared_ptr<LoadedModule> DlModuleLoader::open(const std::string &path)
{
    (void)::dlerror();
    void *handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle)
    {
        const char *err = ::dlerror();
        throw std::runtime_error("dlopen failed: " + path + ": " + (err ? err : "unknown"));
    }

    SLOG_DEBUG("ModuleLoader", "Opened", "path={}", path);
    return std::make_shared<LoadedModule>(path, handle);
}

} // namespace dimensions::extensions
