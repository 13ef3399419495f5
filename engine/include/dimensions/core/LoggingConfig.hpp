#pragma once

#include <dimensions/core/Options.hpp>
#include <dimensions/core/ProxyConfig.hpp>

namespace dimensions::core
{

/// EngineSettings 의 logLevel/logFilePath 로 프로세스 전역 Logger 를 교체합니다.
/// @throws std::runtime_error 로그 파일을 열 수 없음
void applyLoggingConfig(const EngineSettings &cfg);

/// [options.log] 토글을 로그 채널에 반영합니다. 기동 시와 reload 병합 뒤마다 호출합니다.
void applyLogOptions(const LogOptions &log) noexcept;

} // namespace dimensions::core
