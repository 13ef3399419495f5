#include <dimensions/extensions/ExtensionSource.hpp>

#include <dimensions/core/Logger.hpp>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace dimensions::extensions
{

namespace
{

using CreateFn = IExtension *(*)();
using AbiFn = int (*)();

} // namespace

DirectoryExtensionSource::DirectoryExtensionSource(std::string directory,
                                                   std::shared_ptr<IModuleLoader> loader)
    : directory_(std::move(directory)), loader_(std::move(loader))
{
    if (!loader_)
    {
        throw std::invalid_argument("DirectoryExtensionSource requires a module loader");
    }
}

std::vector<std::shared_ptr<IExtension>> DirectoryExtensionSource::discover()
{
    namespace fs = std::filesystem;

    std::vector<std::shared_ptr<IExtension>> out;
    if (directory_.empty())
    {
        return out;
    }

    std::error_code ec;
    if (!fs::is_directory(directory_, ec))
    {
        SLOG_WARN("ExtensionSource", "MissingDirectory", "dir={}", directory_);
        return out;
    }

    std::vector<std::string> paths;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file(ec) && it->path().extension() == ".so")
        {
            paths.push_back(it->path().string());
        }
    }
    if (ec)
    {
        SLOG_ERROR("ExtensionSource", "ScanFailed", "dir={} err='{}'", directory_, ec.message());
    }

    std::sort(paths.begin(), paths.end());

    for (const auto &path : paths)
    {
        try
        {
            if (auto ext = loadOne_(path))
            {
                out.push_back(std::move(ext));
            }
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("ExtensionSource", "LoadFailed", "path={} what='{}'", path, e.what());
        }
    }

    SLOG_DEBUG("ExtensionSource", "Discovered", "dir={} modules={} loaded={}", directory_,
               paths.size(), out.size());
    return out;
}

std::shared_ptr<IExtension> DirectoryExtensionSource::loadOne_(const std::string &path)
{
    auto module = loader_->open(path);

    auto abi = reinterpret_cast<AbiFn>(module->symbol(DIMENSIONS_EXTENSION_ABI_SYMBOL));
    if (abi && abi() != DIMENSIONS_EXTENSION_ABI_VERSION)
    {
        throw std::runtime_error("extension ABI mismatch (module=" + std::to_string(abi()) +
                                 ")");
    }

    auto create = reinterpret_cast<CreateFn>(module->symbol(DIMENSIONS_EXTENSION_CREATE_SYMBOL));
    if (!create)
    {
        throw std::runtime_error("missing symbol " DIMENSIONS_EXTENSION_CREATE_SYMBOL);
    }

    IExtension *raw = create();
    if (!raw)
    {
        throw std::runtime_error("extension factory returned null");
    }

    // 모듈은 인스턴스 삭제가 끝날 때까지 열려 있어야 한다
    return std::shared_ptr<IExtension>(raw, [module](IExtension *p) { delete p; });
}

} // namespace dimensions::extensions
