#include <dimensions/core/Options.hpp>

namespace dimensions::core
{

namespace
{
template <typename T>
void overwrite(T &field, const std::optional<T> &value, std::size_t &count) noexcept
{
    if (value.has_value())
    {
        field = *value;
        ++count;
    }
}
} // namespace

std::size_t applyOptionsPatch(Options &live, const OptionsPatch &patch) noexcept
{
    std::size_t count = 0;

    overwrite(live.log.extensionLoad, patch.log.extensionLoad, count);
    overwrite(live.log.clientConnect, patch.log.clientConnect, count);
    overwrite(live.log.clientDisconnect, patch.log.clientDisconnect, count);
    overwrite(live.log.clientError, patch.log.clientError, count);
    overwrite(live.log.backendError, patch.log.backendError, count);

    overwrite(live.restApi.enabled, patch.restApi.enabled, count);
    overwrite(live.restApi.port, patch.restApi.port, count);

    overwrite(live.fakeVersion.enabled, patch.fakeVersion.enabled, count);
    overwrite(live.fakeVersion.version, patch.fakeVersion.version, count);

    overwrite(live.backend.connectTimeoutMs, patch.backend.connectTimeoutMs, count);
    overwrite(live.backend.maxFailedAttempts, patch.backend.maxFailedAttempts, count);
    overwrite(live.backend.disableMs, patch.backend.disableMs, count);

    return count;
}

Options makeOptions(const OptionsPatch &patch) noexcept
{
    Options opts{};
    (void)applyOptionsPatch(opts, patch);
    return opts;
}

} // namespace dimensions::core
