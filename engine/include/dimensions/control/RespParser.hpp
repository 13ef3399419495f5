#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dimensions::control
{

/// RESP2 값 하나. Null 은 "$-1" / "*-1" 둘 다 이 타입으로 옵니다.
struct RespValue
{
    enum class Type : std::uint8_t
    {
        SimpleString,
        Error,
        Integer,
        BulkString,
        Array,
        Null,
    };

    Type type{Type::Null};
    std::string str;
    std::int64_t integer{0};
    std::vector<RespValue> elements;

    [[nodiscard]] bool isArray() const noexcept { return type == Type::Array; }
    [[nodiscard]] bool isStringLike() const noexcept
    {
        return type == Type::SimpleString || type == Type::BulkString;
    }
};

enum class RespResult : std::uint8_t
{
    NeedMore = 0,
    Parsed,
    Invalid,
};

/// 스트림 앞부분에서 RESP 값 하나를 읽습니다. 상태가 없습니다.
///
/// - Parsed 일 때만 consumed 가 채워집니다. NeedMore 면 같은 입력에 더 붙여 다시 부르면 됩니다.
/// - 배열은 kMaxDepth 까지만 중첩을 허용합니다.
class RespParser
{
  public:
    static constexpr int kMaxDepth = 8;
    static constexpr std::int64_t kMaxBulkBytes = 512LL * 1024 * 1024;

    [[nodiscard]] static RespResult parse(std::span<const std::uint8_t> in, RespValue &out,
                                          std::size_t &consumed);
};

/// "*N\r\n$len\r\narg\r\n..." 형태의 명령 인코딩
[[nodiscard]] std::string encodeRespCommand(std::initializer_list<std::string_view> args);

} // namespace dimensions::control
