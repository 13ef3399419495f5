#include <dimensions/extensions/ExtensionManager.hpp>

#include <dimensions/core/Logger.hpp>

#include <stdexcept>
#include <utility>

namespace dimensions::extensions
{

ExtensionManager::ExtensionManager(std::shared_ptr<IExtensionSource> source,
                                   std::shared_ptr<IModuleLoader> loader)
    : source_(std::move(source)), loader_(std::move(loader))
{
    if (!source_ || !loader_)
    {
        throw std::invalid_argument("ExtensionManager requires a source and a module loader");
    }
}

std::vector<LoadedExtension> ExtensionManager::loadAll()
{
    std::vector<LoadedExtension> out;

    for (auto &instance : source_->discover())
    {
        if (!instance)
        {
            continue;
        }

        LoadedExtension loaded{};
        try
        {
            loaded.info = instance->info();
            instance->onLoad();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Extension", "LoadFailed", "name={} what='{}'", loaded.info.name, e.what());
            continue;
        }
        catch (...)
        {
            SLOG_ERROR("Extension", "LoadFailed", "name={} what='unknown exception'",
                       loaded.info.name);
            continue;
        }

        loaded.clientHook = instance->clientHook();
        loaded.backendHook = instance->backendHook();
        loaded.instance = std::move(instance);

        SLOG_CH_INFO(core::LogChannel::ExtensionLoad, "Extension", "Loaded", "{} {} loaded.",
                     loaded.info.name, loaded.info.version);
        out.push_back(std::move(loaded));
    }

    return out;
}

void ExtensionManager::unloadAll(std::vector<LoadedExtension> &list) noexcept
{
    for (auto &ext : list)
    {
        SLOG_CH_INFO(core::LogChannel::ExtensionLoad, "Extension", "Unloaded", "{} {} unloaded.",
                     ext.info.name, ext.info.version);

        if (!ext.instance)
        {
            continue;
        }
        try
        {
            ext.instance->onUnload();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Extension", "UnloadFailed", "name={} what='{}'", ext.info.name, e.what());
        }
        catch (...)
        {
            SLOG_ERROR("Extension", "UnloadFailed", "name={} what='unknown exception'",
                       ext.info.name);
        }
    }
    list.clear();
}

void ExtensionManager::reloadAll(std::vector<LoadedExtension> &list)
{
    unloadAll(list);
    list = loadAll();
}

std::size_t ExtensionManager::passOnReload(const std::vector<LoadedExtension> &list,
                                           std::string_view command)
{
    std::size_t called = 0;

    for (std::size_t i = 0; i < list.size(); ++i)
    {
        const auto &ext = list[i];
        if (!ext.instance || !ext.info.reloadable || !ext.info.reloadName)
        {
            continue;
        }

        auto keepAlive = ext.instance;
        try
        {
            keepAlive->reload(*loader_, command);
            ++called;
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Extension", "ReloadFailed", "name={} command='{}' what='{}'",
                       ext.info.name, command, e.what());
        }
    }

    return called;
}

} // namespace dimensions::extensions
