#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace dimensions::routing
{

struct TrackedPlayer
{
    std::uint64_t clientId{0};
    std::uint16_t listenPort{0};
    std::string destination;
};

/// 모든 리스너가 공유하는 "접속 중인 플레이어 이름" 표
///
/// 이름은 한 번에 한 클라이언트만 가질 수 있습니다. 같은 clientId 가 다시 claim 하면
/// 메타데이터만 갱신합니다.
class GlobalTracking
{
  public:
    enum class ClaimResult : std::uint8_t
    {
        Claimed,
        Refreshed, ///< 이미 같은 클라이언트가 가진 이름
        Taken,     ///< 다른 클라이언트가 가진 이름
    };

    ClaimResult claimName(const std::string &name, const TrackedPlayer &who);

    /// clientId 가 실제 소유자일 때만 지웁니다.
    bool releaseName(const std::string &name, std::uint64_t clientId) noexcept;

    /// 목적지가 바뀌었을 때 (전송/최초 연결) 호출합니다.
    void updateDestination(const std::string &name, std::uint64_t clientId,
                           std::string_view destination);

    [[nodiscard]] const std::map<std::string, TrackedPlayer> &names() const noexcept
    {
        return names_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

    /// 로그용 한 줄 요약: "name(port->destination) ..."
    [[nodiscard]] std::string describe() const;

  private:
    std::map<std::string, TrackedPlayer> names_;
};

} // namespace dimensions::routing
