#include <dimensions/core/Logger.hpp>
#include <dimensions/extensions/Extension.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace
{

/// 클라이언트 → 백엔드 패킷을 type 별로 셉니다.
/// 제어 채널의 모르는 명령이 오면 지금까지의 통계를 남기고 0 으로 되돌립니다.
class PacketStatsExtension final : public dimensions::extensions::IExtension,
                                   public dimensions::extensions::IPacketHook
{
  public:
    [[nodiscard]] dimensions::extensions::ExtensionInfo info() const override
    {
        return {"PacketStats", "1.0.0", true, std::string("packetstats")};
    }

    void onLoad() override { counts_.fill(0); }

    void onUnload() override
    {
        SLOG_DEBUG("PacketStats", "Unload", "total={}", total_());
    }

    void reload(dimensions::extensions::IModuleLoader & /*loader*/,
                std::string_view command) override
    {
        std::string summary;
        for (std::size_t type = 0; type < counts_.size(); ++type)
        {
            if (counts_[type] != 0)
            {
                summary += std::to_string(type) + ":" + std::to_string(counts_[type]) + " ";
            }
        }
        SLOG_INFO("PacketStats", "Report", "cmd='{}' total={} by_type='{}'", command, total_(),
                  summary);
        counts_.fill(0);
    }

    [[nodiscard]] dimensions::extensions::IPacketHook *clientHook() noexcept override
    {
        return this;
    }

    dimensions::protocol::PacketVerdict onPacket(dimensions::handlers::IClientContext & /*ctx*/,
                                                 dimensions::protocol::Packet &packet) override
    {
        ++counts_[packet.type];
        return dimensions::protocol::PacketVerdict::Forward;
    }

  private:
    std::array<std::uint64_t, 256> counts_{};

    [[nodiscard]] std::uint64_t total_() const noexcept
    {
        std::uint64_t sum = 0;
        for (const auto c : counts_)
        {
            sum += c;
        }
        return sum;
    }
};

} // namespace

DIMENSIONS_DECLARE_EXTENSION(PacketStatsExtension)
