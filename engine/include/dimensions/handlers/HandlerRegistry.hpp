#pragma once

#include <dimensions/core/Logger.hpp>
#include <dimensions/extensions/Extension.hpp>
#include <dimensions/handlers/PacketHandlers.hpp>

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace dimensions::handlers
{

/// 리스너들이 패킷마다 읽어 가는 현재 핸들러 묶음
///
/// - 세 슬롯은 생성 이후 절대 null 이 아닙니다. 교체는 shared_ptr 대입 한 번입니다.
/// - 리스너는 패킷 하나를 처리하는 동안 슬롯의 shared_ptr 를 로컬로 복사해 둡니다.
///   그래서 처리 도중 교체되어도 그 패킷은 이전 핸들러로 끝납니다.
struct HandlerRegistry
{
    std::shared_ptr<ICommandHandler> command;
    std::shared_ptr<IClientPacketHandler> clientPacketHandler;
    std::shared_ptr<IBackendPacketHandler> backendPacketHandler;
    std::vector<extensions::LoadedExtension> extensions;
};

/// hot-swap 때 새 인스턴스를 만드는 팩토리. null 을 돌려주거나 던지면 교체하지 않습니다.
struct HandlerFactories
{
    std::function<std::shared_ptr<ICommandHandler>()> command;
    std::function<std::shared_ptr<IClientPacketHandler>()> clientPacketHandler;
    std::function<std::shared_ptr<IBackendPacketHandler>()> backendPacketHandler;
};

/// 기본 구현(ClientCommandHandler / ClientPacketHandler / BackendPacketHandler)을 만드는 팩토리
[[nodiscard]] HandlerFactories defaultHandlerFactories();

/// 팩토리로 새 인스턴스를 만들어 slot 에 대입합니다.
/// @return 교체했으면 true. 실패면 로그만 남기고 기존 인스턴스를 유지합니다.
template <typename T>
bool swapHandler(std::shared_ptr<T> &slot, const std::function<std::shared_ptr<T>()> &factory,
                 std::string_view kind)
{
    if (!factory)
    {
        SLOG_ERROR("Handlers", "SwapFailed", "kind={} reason='no factory'", kind);
        return false;
    }

    std::shared_ptr<T> fresh;
    try
    {
        fresh = factory();
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Handlers", "SwapFailed", "kind={} what='{}'", kind, e.what());
        return false;
    }
    catch (...)
    {
        SLOG_ERROR("Handlers", "SwapFailed", "kind={} what='unknown exception'", kind);
        return false;
    }

    if (!fresh)
    {
        SLOG_ERROR("Handlers", "SwapFailed", "kind={} reason='factory returned null'", kind);
        return false;
    }

    slot = std::move(fresh);
    SLOG_DEBUG("Handlers", "Swapped", "kind={}", kind);
    return true;
}

} // namespace dimensions::handlers
