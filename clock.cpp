#include "clock.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>

namespace snowflake {

auto SystemClock::nowMillis() -> ext::expected<std::int64_t, std::error_code>
{
  auto ts = timespec{};
  if (auto r = ::clock_gettime(CLOCK_REALTIME, &ts); r == -1) {
    spdlog::error("clock_gettime(CLOCK_REALTIME) failed: {}", std::strerror(errno));
    return ext::make_unexpected(make_error_code(SnowflakeErr::ClockError));
  }
  return static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1'000'000;
}

auto systemClock() -> Clock&
{
  static SystemClock clock;
  return clock;
}

} // namespace snowflake
