#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#endif

namespace dimensions::core
{

/// 로그 prefix 에 찍히는 스레드 정보(tag, tid)를 thread_local 로 캐싱합니다.
///
/// 프록시는 이벤트 루프 스레드 하나("main")에서 모든 상태를 다루고,
/// Logger 의 writer 스레드만 별도로 존재합니다.
class ThreadContext
{
  public:
    /// 스레드 시작점에서 1회 호출합니다. 16바이트를 넘는 이름은 잘립니다.
    static void setCurrentThreadTag(std::string_view tag) noexcept
    {
        auto &buf = tagBuf_();
        const auto n = tag.size() < buf.size() - 1 ? tag.size() : buf.size() - 1;
        for (std::size_t i = 0; i < n; ++i)
        {
            buf[i] = tag[i];
        }
        buf[n] = '\0';
        (void)currentTid();
    }

    // syscall 매번 호출하지 않도록 thread_local 캐시
    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
        {
            std::snprintf(buf.data(), buf.size(), "main");
        }
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_();
        return tid;
    }

    static std::array<char, 16> &tagBuf_() noexcept
    {
        thread_local std::array<char, 16> buf{};
        return buf;
    }
};

} // namespace dimensions::core
