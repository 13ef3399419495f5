#include <dimensions/core/LoggingConfig.hpp>
#include <dimensions/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace dimensions::core
{
namespace
{

// 파일 스트림 수명을 Logger writer 스레드보다 길게 잡는다
class FileSinkLogger final : public ILogger
{
  public:
    FileSinkLogger(std::unique_ptr<std::ofstream> file, LogLevel lvl)
        : file_(std::move(file)), logger_(*file_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.shutdown(); }

  private:
    std::unique_ptr<std::ofstream> file_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const EngineSettings &cfg)
{
    if (cfg.logFilePath.empty())
    {
        auto logger = std::make_shared<Logger>(std::clog);
        logger->setMinLevel(cfg.logLevel);
        setLogger(std::move(logger));
        return;
    }

    auto file = std::make_unique<std::ofstream>(cfg.logFilePath, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
    }

    setLogger(std::make_shared<FileSinkLogger>(std::move(file), cfg.logLevel));
    SLOG_INFO("LoggingConfig", "FileLogger", "path={} level={}", cfg.logFilePath,
              logLevelName(cfg.logLevel));
}

void applyLogOptions(const LogOptions &log) noexcept
{
    setChannelEnabled(LogChannel::ExtensionLoad, log.extensionLoad);
    setChannelEnabled(LogChannel::ClientConnect, log.clientConnect);
    setChannelEnabled(LogChannel::ClientDisconnect, log.clientDisconnect);
    setChannelEnabled(LogChannel::ClientError, log.clientError);
    setChannelEnabled(LogChannel::BackendError, log.backendError);
}

} // namespace dimensions::core
