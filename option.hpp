#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace snowflake {

// 2021-01-01T00:00:00Z in Unix milliseconds
constexpr std::int64_t kDefaultEpoch = 1609459200000;

struct GeneratorOption {
  std::int32_t nodeId = 0;
  std::optional<std::int64_t> epoch = std::nullopt;
  // regressions up to this much are waited out instead of failing
  std::chrono::milliseconds backwardTolerance = std::chrono::milliseconds(0);
  std::chrono::milliseconds maxWait = std::chrono::milliseconds(5000);
};

} // namespace snowflake
