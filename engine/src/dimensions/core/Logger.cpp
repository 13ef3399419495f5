#include <dimensions/core/Logger.hpp>
#include <dimensions/core/ThreadContext.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <thread>
#include <unistd.h> // isatty
#include <vector>

namespace dimensions::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

std::atomic<std::uint32_t> &channelMask()
{
    static std::atomic<std::uint32_t> mask{~0U};
    return mask;
}
} // namespace detail

void setChannelEnabled(LogChannel ch, bool enabled) noexcept
{
    if (enabled)
    {
        detail::channelMask().fetch_or(detail::channelBit(ch), std::memory_order_relaxed);
    }
    else
    {
        detail::channelMask().fetch_and(~detail::channelBit(ch), std::memory_order_relaxed);
    }
}

const char *logChannelTag(LogChannel ch) noexcept
{
    switch (ch)
    {
    case LogChannel::ExtensionLoad:
        return "[Extension]";
    case LogChannel::ClientConnect:
    case LogChannel::ClientDisconnect:
    case LogChannel::ClientError:
        return "[Client]";
    case LogChannel::BackendError:
        return "[Backend]";
    }
    return "[?]";
}

const char *logLevelName(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

namespace
{
// 호출 스레드에서 잡아 두는 한 줄. 포맷은 writer 스레드에서 한다.
struct PendingLine
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point at;
    std::string threadTag;
    long threadId{};
};

const char *levelColor(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:
        return "\x1b[90m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m";
    }
    return "";
}

bool isTerminalStream(const std::ostream &os) noexcept
{
    if (&os == &std::cout)
        return ::isatty(STDOUT_FILENO) != 0;
    if (&os == &std::clog || &os == &std::cerr)
        return ::isatty(STDERR_FILENO) != 0;
    return false;
}

// "HH:MM:SS.uuuuuu | main tid=123 | INFO  | comp | evt | details"
void writeLine(std::ostream &os, const PendingLine &line, bool color)
{
    using namespace std::chrono;

    const auto t = system_clock::to_time_t(line.at);
    std::tm tm{};
    localtime_r(&t, &tm);
    const auto us = duration_cast<microseconds>(line.at.time_since_epoch()) % seconds(1);

    os << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n", tm.tm_hour,
                      tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), line.threadTag,
                      line.threadId, color ? levelColor(line.level) : "",
                      logLevelName(line.level), color ? "\x1b[0m" : "", line.message);
}
} // namespace

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os), color_(isTerminalStream(os))
    {
        writer_ = std::thread([this]() {
            ThreadContext::setCurrentThreadTag("log");
            drain_();
        });
    }

    ~Impl() { stop(); }

    void stop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
        {
            writer_.join();
        }
    }

    void push(LogLevel level, std::string_view msg)
    {
        if (level < minLevel_.load(std::memory_order_relaxed))
            return;

        PendingLine line{level, std::string(msg), std::chrono::system_clock::now(),
                         std::string(ThreadContext::currentThreadTag()),
                         ThreadContext::currentTid()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            pending_.push_back(std::move(line));
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void drain_()
    {
        std::vector<PendingLine> batch;
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
                if (pending_.empty())
                    return; // stopping_ 이고 남은 줄 없음
                batch.swap(pending_);
            }

            for (const auto &line : batch)
            {
                writeLine(os_, line, color_);
            }
            os_.flush();
            batch.clear();
        }
    }

    std::ostream &os_;
    const bool color_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<PendingLine> pending_;
    bool stopping_{false};
    std::thread writer_;
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->push(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::shutdown() noexcept
{
    impl_->stop();
}

// ===== Global Instance Management =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    if (logger)
    {
        detail::fastMinLevel().store(static_cast<int>(logger->minLevel()),
                                     std::memory_order_relaxed);
    }
    else
    {
        detail::fastMinLevel().store(static_cast<int>(LogLevel::Info), std::memory_order_relaxed);
    }
    auto previous = std::exchange(globalLoggerStorage(), std::move(logger));
    if (previous)
    {
        previous->shutdown();
    }
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;

    instance->shutdown();
    instance.reset();
}

} // namespace dimensions::core
