#pragma once

#include <dimensions/handlers/ClientContext.hpp>
#include <dimensions/protocol/PacketTypes.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dimensions::extensions
{

class IModuleLoader;

struct ExtensionInfo
{
    std::string name;
    std::string version;
    bool reloadable{false};

    /// 있으면 제어 채널의 모르는 명령이 reload() 로 넘어옵니다.
    std::optional<std::string> reloadName;
};

/// 패킷 경로에 끼어드는 훅. Drop 을 돌려주면 패킷을 삼킵니다.
class IPacketHook
{
  public:
    virtual ~IPacketHook() = default;
    virtual protocol::PacketVerdict onPacket(handlers::IClientContext &ctx,
                                             protocol::Packet &packet) = 0;
};

/// 동적으로 로드되는 확장 모듈의 인터페이스
class IExtension
{
  public:
    virtual ~IExtension() = default;

    [[nodiscard]] virtual ExtensionInfo info() const = 0;

    virtual void onLoad() {}
    virtual void onUnload() {}

    /// reloadable 이고 reloadName 이 있을 때만 불립니다.
    virtual void reload(IModuleLoader &loader, std::string_view command)
    {
        (void)loader;
        (void)command;
    }

    [[nodiscard]] virtual IPacketHook *clientHook() noexcept { return nullptr; }
    [[nodiscard]] virtual IPacketHook *backendHook() noexcept { return nullptr; }
};

/// 로드 시점에 한 번 읽어 둔 능력(capability) 캐시
struct LoadedExtension
{
    std::shared_ptr<IExtension> instance;
    ExtensionInfo info;
    IPacketHook *clientHook{nullptr};  ///< instance 가 소유
    IPacketHook *backendHook{nullptr}; ///< instance 가 소유
};

} // namespace dimensions::extensions

/// 모듈(.so)이 export 하는 C 심볼 이름과 ABI 버전
#define DIMENSIONS_EXTENSION_CREATE_SYMBOL "dimensions_extension_create"
#define DIMENSIONS_EXTENSION_ABI_SYMBOL "dimensions_extension_abi_version"
#define DIMENSIONS_EXTENSION_ABI_VERSION 1

/// 모듈 쪽에서 한 번 사용합니다: DIMENSIONS_DECLARE_EXTENSION(MyExtension)
#define DIMENSIONS_DECLARE_EXTENSION(ExtensionClass)                                              \
    extern "C" int dimensions_extension_abi_version()                                              \
    {                                                                                              \
        return DIMENSIONS_EXTENSION_ABI_VERSION;                                                   \
    }                                                                                              \
    extern "C" ::dimensions::extensions::IExtension *dimensions_extension_create()                 \
    {                                                                                              \
        return new ExtensionClass();                                                               \
    }
