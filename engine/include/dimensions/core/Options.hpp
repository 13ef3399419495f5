#pragma once

#include <dimensions/core/Defaults.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace dimensions::core
{

// =============================================================================
// 런타임 옵션 (reload 시 필드 단위로 덮어쓰기)
// =============================================================================

struct LogOptions
{
    bool extensionLoad{true};
    bool clientConnect{true};
    bool clientDisconnect{true};
    bool clientError{true};
    bool backendError{true};
};

struct RestApiOptions
{
    bool enabled{false};
    std::uint16_t port{defaults::kRestApiPort};
};

/// 클라이언트 ConnectRequest 의 버전 문자열을 "Terraria<version>" 으로 바꿔 백엔드에 전달합니다.
struct FakeVersionOptions
{
    bool enabled{false};
    std::uint32_t version{defaults::kFakeVersion};
};

struct BackendOptions
{
    std::uint32_t connectTimeoutMs{defaults::kBackendConnectTimeoutMs};
    std::uint32_t maxFailedAttempts{defaults::kBackendMaxFailedAttempts};
    std::uint32_t disableMs{defaults::kBackendDisableMs};
};

struct Options
{
    LogOptions log{};
    RestApiOptions restApi{};
    FakeVersionOptions fakeVersion{};
    BackendOptions backend{};
};

// =============================================================================
// OptionsPatch
//   설정 문서에 "실제로 적힌" 필드만 값을 가진다.
//   applyOptionsPatch()는 값이 있는 필드만 덮어쓰고 나머지는 그대로 둔다.
// =============================================================================

struct LogOptionsPatch
{
    std::optional<bool> extensionLoad;
    std::optional<bool> clientConnect;
    std::optional<bool> clientDisconnect;
    std::optional<bool> clientError;
    std::optional<bool> backendError;
};

struct RestApiOptionsPatch
{
    std::optional<bool> enabled;
    std::optional<std::uint16_t> port;
};

struct FakeVersionOptionsPatch
{
    std::optional<bool> enabled;
    std::optional<std::uint32_t> version;
};

struct BackendOptionsPatch
{
    std::optional<std::uint32_t> connectTimeoutMs;
    std::optional<std::uint32_t> maxFailedAttempts;
    std::optional<std::uint32_t> disableMs;
};

struct OptionsPatch
{
    LogOptionsPatch log{};
    RestApiOptionsPatch restApi{};
    FakeVersionOptionsPatch fakeVersion{};
    BackendOptionsPatch backend{};
};

/// patch 에 존재하는 필드만 live 옵션에 덮어씁니다. 덮어쓴 필드 개수를 반환합니다.
std::size_t applyOptionsPatch(Options &live, const OptionsPatch &patch) noexcept;

/// 기본값에 patch 를 적용한 새 Options 를 만듭니다. (최초 기동용)
[[nodiscard]] Options makeOptions(const OptionsPatch &patch) noexcept;

} // namespace dimensions::core
