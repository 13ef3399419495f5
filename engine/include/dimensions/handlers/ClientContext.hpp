#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::handlers
{

/// 핸들러/extension 이 보는 클라이언트 세션 하나의 모습
///
/// 리스너의 ClientSession 이 구현합니다. 테스트는 기록만 하는 fake 로 대체합니다.
class IClientContext
{
  public:
    virtual ~IClientContext() = default;

    [[nodiscard]] virtual std::uint64_t clientId() const noexcept = 0;
    [[nodiscard]] virtual std::uint16_t listenPort() const noexcept = 0;

    /// PlayerInfo 로 확정된 이름. 아직 모르면 빈 문자열.
    [[nodiscard]] virtual const std::string &playerName() const noexcept = 0;
    virtual void setPlayerName(std::string name) = 0;

    /// 현재 붙어 있는(또는 붙는 중인) 목적지 이름. 없으면 빈 문자열.
    [[nodiscard]] virtual std::string currentDestination() const = 0;

    /// 완성된 프레임을 보냅니다. 연결이 닫혀 있으면 false.
    virtual bool sendToClient(std::vector<std::uint8_t> frame) = 0;
    virtual bool sendToBackend(std::vector<std::uint8_t> frame) = 0;

    /// 다른 목적지로 옮깁니다. 모르는 이름이면 false.
    virtual bool requestTransfer(const std::string &destination) = 0;

    /// Disconnect 패킷을 보내고 세션을 정리합니다.
    virtual void disconnect(std::string_view reason) = 0;
};

} // namespace dimensions::handlers
