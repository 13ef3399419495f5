#pragma once

#include <dimensions/core/Options.hpp>
#include <dimensions/handlers/HandlerRegistry.hpp>
#include <dimensions/routing/GlobalTracking.hpp>
#include <dimensions/routing/Registries.hpp>

#include <memory>

namespace dimensions
{

/// 모든 리스너가 공유하는 다섯 개의 핸들. 데이터는 orchestrator 가 만들고 리스너는 참조만 합니다.
///
/// 단일 이벤트 루프 스레드에서만 접근하므로 락이 없습니다.
struct SharedState
{
    std::shared_ptr<routing::DestinationRegistry> destinations;
    std::shared_ptr<routing::ServerDetailsRegistry> serverDetails;
    std::shared_ptr<routing::GlobalTracking> tracking;
    std::shared_ptr<handlers::HandlerRegistry> handlers;
    std::shared_ptr<core::Options> options;
};

} // namespace dimensions
