#pragma once

namespace dimensions::util {

/// 복사를 막는 베이스. 세션/레지스트리처럼 공유 상태를 쥔 타입이 private 상속합니다.
/// 이동은 파생 클래스가 정합니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/// this 나 raw 핸들이 커널/전역 상태에 등록되는 타입용. 복사도 이동도 안 됩니다.
class Pinned {
  protected:
    Pinned() = default;
    ~Pinned() = default;

    Pinned(const Pinned &) = delete;
    Pinned &operator=(const Pinned &) = delete;
    Pinned(Pinned &&) = delete;
    Pinned &operator=(Pinned &&) = delete;
};

} // namespace dimensions::util
