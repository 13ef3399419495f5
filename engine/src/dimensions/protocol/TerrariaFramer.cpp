#include <dimensions/protocol/TerrariaFramer.hpp>

#include <dimensions/protocol/Endian.hpp>
#include <dimensions/protocol/PacketTypes.hpp>

namespace dimensions::protocol
{

namespace
{
thread_local const char *t_lastError = "";
} // namespace

FrameResult TerrariaFramer::tryFrame(std::span<const std::uint8_t> in,
                                     std::size_t &outFrameLen) noexcept
{
    outFrameLen = 0;

    if (in.size() < 2)
    {
        return FrameResult::NeedMore;
    }

    const std::size_t declared = loadU16Le(in.data());
    if (declared < kFrameHeaderBytes)
    {
        t_lastError = "declared_length_below_header";
        return FrameResult::Invalid;
    }

    if (in.size() < declared)
    {
        return FrameResult::NeedMore;
    }

    outFrameLen = declared;
    return FrameResult::Framed;
}

const char *TerrariaFramer::lastErrorReason() noexcept
{
    return t_lastError;
}

} // namespace dimensions::protocol
