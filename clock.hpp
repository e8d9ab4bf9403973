#pragma once

#include "preclude.hpp"

namespace snowflake {

class Clock {
public:
  virtual ~Clock() = default;
  // milliseconds since the Unix epoch
  virtual auto nowMillis() -> ext::expected<std::int64_t, std::error_code> = 0;
};

class SystemClock final : public Clock {
public:
  auto nowMillis() -> ext::expected<std::int64_t, std::error_code> override;
};

auto systemClock() -> Clock&;

} // namespace snowflake
