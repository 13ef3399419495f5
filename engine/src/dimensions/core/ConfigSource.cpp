#include <dimensions/core/ConfigSource.hpp>

#include <dimensions/core/ConfigLoader.hpp>
#include <dimensions/core/Logger.hpp>

namespace dimensions::core
{

ProxyConfig TomlConfigSource::load()
{
    ProxyConfig cfg = ConfigLoader::loadProxyFile(path_);
    SLOG_DEBUG("ConfigSource", "Reloaded", "path={} servers={}", path_, cfg.servers.size());
    return cfg;
}

} // namespace dimensions::core
