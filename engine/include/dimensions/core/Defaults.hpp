#pragma once
#include <cstddef>
#include <cstdint>

namespace dimensions::core::defaults
{

// ===== Event loop timer / epoll =====
inline constexpr std::uint32_t kTickResolutionMs = 10;
inline constexpr std::size_t kTimerSlots = 512;
inline constexpr int kMaxEpollEvents = 128;

// ===== Listener =====
inline constexpr int kListenBacklog = 128;

// ===== Per-connection buffers =====
inline constexpr std::size_t kReadChunkBytes = 16 * 1024;
inline constexpr std::size_t kMaxInboundBytes = 1024U * 1024U;  // 1 MiB
inline constexpr std::size_t kMaxOutboundBytes = 4096U * 1024U; // 4 MiB

// ===== Control channel (Redis) =====
inline constexpr std::uint16_t kRedisPort = 6379;
inline constexpr const char *kControlChannel = "dimensions_cli";
inline constexpr std::uint32_t kRedisReconnectDelayMs = 2000;
inline constexpr std::uint32_t kRedisConnectTimeoutMs = 1000;

// ===== Reporting surface =====
inline constexpr std::uint16_t kRestApiPort = 3000;

// ===== Backend dialing =====
inline constexpr std::uint32_t kBackendConnectTimeoutMs = 3000;
inline constexpr std::uint32_t kBackendMaxFailedAttempts = 3;
inline constexpr std::uint32_t kBackendDisableMs = 20000;

// ===== Client version advertised when fake_version is on =====
inline constexpr std::uint32_t kFakeVersion = 279;

} // namespace dimensions::core::defaults
