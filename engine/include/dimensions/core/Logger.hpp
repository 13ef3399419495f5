#pragma once

#include <dimensions/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace dimensions::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

/// 설정의 [options.log] 토글 하나에 대응하는 로그 채널
///
/// 채널이 꺼져 있으면 레벨과 상관없이 버립니다. 켜진 채널의 메시지 앞에는
/// logChannelTag() 가 붙습니다. ("[Extension] PacketStats 1.0 loaded.")
enum class LogChannel : std::uint32_t
{
    ExtensionLoad = 0,
    ClientConnect,
    ClientDisconnect,
    ClientError,
    BackendError,
};

namespace detail
{
// 레벨/채널 필터를 lock 없이 확인하기 위한 전역 atomic (Logger.cpp에서 정의)
std::atomic<int> &fastMinLevel();
std::atomic<std::uint32_t> &channelMask();

constexpr std::uint32_t channelBit(LogChannel ch) noexcept
{
    return 1U << static_cast<std::uint32_t>(ch);
}
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

inline bool channelEnabled(LogChannel ch) noexcept
{
    return (detail::channelMask().load(std::memory_order_relaxed) & detail::channelBit(ch)) != 0;
}

/// 기본은 전부 켜짐. 보통은 applyLogOptions() 로 한 번에 바꿉니다.
void setChannelEnabled(LogChannel ch, bool enabled) noexcept;

[[nodiscard]] const char *logLevelName(LogLevel level) noexcept;
[[nodiscard]] const char *logChannelTag(LogChannel ch) noexcept;

class ILogger : private dimensions::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // 메시지는 이미 "comp | evt | key=value..." 형태로 만들어서 넣는다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// stream 하나에 쓰는 기본 Logger. 포맷과 쓰기는 writer 스레드 하나가 맡습니다.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    /// 이 레벨 미만은 큐에 넣지 않습니다.
    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    /// 남은 줄을 모두 쓰고 writer 스레드를 join 합니다. 이후 log() 는 버립니다.
    void shutdown() noexcept override;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Global instance
ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | main tid=123 | INFO  | comp | evt | k=v ..."
//   - prefix(time/thread/level)는 Logger가 찍는다
//   - message(payload)는 "comp | evt | key=value"만 남긴다
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}

// 채널 로그: "comp | evt | [Tag] details"
template <typename... Args>
inline void emitChannel(LogLevel lvl, LogChannel ch, std::string_view comp, std::string_view evt,
                        std::format_string<Args...> fmt, Args &&...args)
{
    if (!channelEnabled(ch) || !fastEnabled(lvl))
        return;
    std::string details = logChannelTag(ch);
    details += ' ';
    details += std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Trace, (comp),                    \
                                   (evt), __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Debug, (comp),                    \
                                   (evt), __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Info, (comp),                     \
                                   (evt), __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Warn, (comp),                     \
                                   (evt), __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Error, (comp),                    \
                                   (evt), __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::dimensions::core::slog::emit(::dimensions::core::LogLevel::Fatal, (comp),                    \
                                   (evt), __VA_ARGS__)

#define SLOG_CH_INFO(ch, comp, evt, ...)                                                           \
    ::dimensions::core::slog::emitChannel(::dimensions::core::LogLevel::Info, (ch), (comp),        \
                                          (evt), __VA_ARGS__)
#define SLOG_CH_WARN(ch, comp, evt, ...)                                                           \
    ::dimensions::core::slog::emitChannel(::dimensions::core::LogLevel::Warn, (ch), (comp),        \
                                          (evt), __VA_ARGS__)
#define SLOG_CH_ERROR(ch, comp, evt, ...)                                                          \
    ::dimensions::core::slog::emitChannel(::dimensions::core::LogLevel::Error, (ch), (comp),       \
                                          (evt), __VA_ARGS__)

} // namespace dimensions::core
