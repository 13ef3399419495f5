#include <dimensions/control/RespParser.hpp>

#include <charconv>

namespace dimensions::control
{

namespace
{

class Cursor
{
  public:
    explicit Cursor(std::span<const std::uint8_t> in) noexcept : in_(in) {}

    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }

    /// CRLF 까지의 한 줄. 아직 CRLF 가 없으면 NeedMore
    RespResult readLine(std::string_view &out) noexcept
    {
        for (std::size_t i = pos_; i + 1 < in_.size(); ++i)
        {
            if (in_[i] == '\r')
            {
                if (in_[i + 1] != '\n')
                {
                    return RespResult::Invalid;
                }
                out = std::string_view(reinterpret_cast<const char *>(in_.data() + pos_), i - pos_);
                pos_ = i + 2;
                return RespResult::Parsed;
            }
        }
        return RespResult::NeedMore;
    }

    RespResult readExact(std::size_t n, std::string &out)
    {
        if (in_.size() - pos_ < n + 2)
        {
            return RespResult::NeedMore;
        }
        if (in_[pos_ + n] != '\r' || in_[pos_ + n + 1] != '\n')
        {
            return RespResult::Invalid;
        }
        out.assign(reinterpret_cast<const char *>(in_.data() + pos_), n);
        pos_ += n + 2;
        return RespResult::Parsed;
    }

    bool readByte(std::uint8_t &b) noexcept
    {
        if (pos_ >= in_.size())
        {
            return false;
        }
        b = in_[pos_++];
        return true;
    }

  private:
    std::span<const std::uint8_t> in_;
    std::size_t pos_{0};
};

bool toInt(std::string_view s, std::int64_t &out) noexcept
{
    if (s.empty())
    {
        return false;
    }
    const auto *first = s.data();
    const auto *last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

RespResult parseValue(Cursor &c, RespValue &out, int depth)
{
    std::uint8_t prefix = 0;
    if (!c.readByte(prefix))
    {
        return RespResult::NeedMore;
    }

    std::string_view line;
    if (const auto r = c.readLine(line); r != RespResult::Parsed)
    {
        return r;
    }

    switch (prefix)
    {
    case '+':
        out.type = RespValue::Type::SimpleString;
        out.str.assign(line);
        return RespResult::Parsed;

    case '-':
        out.type = RespValue::Type::Error;
        out.str.assign(line);
        return RespResult::Parsed;

    case ':':
        out.type = RespValue::Type::Integer;
        return toInt(line, out.integer) ? RespResult::Parsed : RespResult::Invalid;

    case '$': {
        std::int64_t len = 0;
        if (!toInt(line, len) || len < -1 || len > RespParser::kMaxBulkBytes)
        {
            return RespResult::Invalid;
        }
        if (len == -1)
        {
            out.type = RespValue::Type::Null;
            return RespResult::Parsed;
        }
        out.type = RespValue::Type::BulkString;
        return c.readExact(static_cast<std::size_t>(len), out.str);
    }

    case '*': {
        std::int64_t count = 0;
        if (!toInt(line, count) || count < -1)
        {
            return RespResult::Invalid;
        }
        if (count == -1)
        {
            out.type = RespValue::Type::Null;
            return RespResult::Parsed;
        }
        if (depth >= RespParser::kMaxDepth)
        {
            return RespResult::Invalid;
        }

        out.type = RespValue::Type::Array;
        out.elements.clear();
        for (std::int64_t i = 0; i < count; ++i)
        {
            RespValue child{};
            if (const auto r = parseValue(c, child, depth + 1); r != RespResult::Parsed)
            {
                return r;
            }
            out.elements.push_back(std::move(child));
        }
        return RespResult::Parsed;
    }

    default:
        return RespResult::Invalid;
    }
}

} // namespace

RespResult RespParser::parse(std::span<const std::uint8_t> in, RespValue &out,
                             std::size_t &consumed)
{
    consumed = 0;
    Cursor c(in);
    RespValue value{};
    const auto r = parseValue(c, value, 0);
    if (r == RespResult::Parsed)
    {
        out = std::move(value);
        consumed = c.pos();
    }
    return r;
}

std::string encodeRespCommand(std::initializer_list<std::string_view> args)
{
    std::string out;
    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (auto a : args)
    {
        out += '$';
        out += std::to_string(a.size());
        out += "\r\n";
        out.append(a);
        out += "\r\n";
    }
    return out;
}

} // namespace dimensions::control
