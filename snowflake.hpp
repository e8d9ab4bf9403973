#pragma once

#include "clock.hpp"
#include "errors.hpp"
#include "option.hpp"

#include <compare>
#include <memory>
#include <mutex>

namespace snowflake {

constexpr std::uint32_t kNodeBits = 10;
constexpr std::uint32_t kSequenceBits = 12;
constexpr std::uint32_t kTimestampBits = 41;

constexpr std::uint32_t kNodeShift = kSequenceBits;
constexpr std::uint32_t kTimestampShift = kNodeBits + kSequenceBits;

constexpr std::int32_t kMaxNodeId = (1 << kNodeBits) - 1;
constexpr std::uint32_t kMaxSequence = (1u << kSequenceBits) - 1;
constexpr std::int64_t kMaxTimestamp = (std::int64_t(1) << kTimestampBits) - 1;

// | 63: unused | 62..22: timestamp | 21..12: node | 11..0: sequence |
struct ID {
  std::uint64_t id = 0;

  static constexpr auto compose(std::uint64_t timestamp, std::uint32_t node, std::uint32_t sequence) noexcept -> ID
  {
    return {
        .id = ((timestamp & std::uint64_t(kMaxTimestamp)) << kTimestampShift) |
              (std::uint64_t(node & std::uint32_t(kMaxNodeId)) << kNodeShift) | (sequence & kMaxSequence),
    };
  }
  static constexpr auto parse(std::uint64_t id) noexcept -> ID { return {.id = id}; }

  [[nodiscard]] constexpr auto timestamp() const noexcept -> std::uint64_t
  {
    return (id >> kTimestampShift) & std::uint64_t(kMaxTimestamp);
  }
  [[nodiscard]] constexpr auto node() const noexcept -> std::uint32_t
  {
    return static_cast<std::uint32_t>((id >> kNodeShift) & std::uint64_t(kMaxNodeId));
  }
  [[nodiscard]] constexpr auto sequence() const noexcept -> std::uint32_t
  {
    return static_cast<std::uint32_t>(id & kMaxSequence);
  }
  [[nodiscard]] constexpr auto unixMillis(std::int64_t epoch) const noexcept -> std::int64_t
  {
    return static_cast<std::int64_t>(timestamp()) + epoch;
  }

  auto operator<=>(ID const&) const = default;
};

class Generator {
public:
  Generator(GeneratorOption const& option, std::int64_t epoch, Clock& clock) noexcept;
  Generator(Generator const&) = delete;
  auto operator=(Generator const&) -> Generator& = delete;

  static auto create(GeneratorOption const& option, Clock& clock)
      -> ext::expected<std::unique_ptr<Generator>, std::error_code>;
  static auto create(GeneratorOption const& option) -> ext::expected<std::unique_ptr<Generator>, std::error_code>;

  // Safe to call from any number of threads. May spin for up to maxWait when
  // the sequence is exhausted or a tolerated clock regression is waited out.
  auto generate() -> ext::expected<ID, std::error_code>;

  auto nodeId() const -> std::uint32_t { return mNodeId; }
  auto epoch() const -> std::int64_t { return mEpoch; }

private:
  auto elapsedMillis() -> ext::expected<std::int64_t, std::error_code>;
  auto waitUntil(std::int64_t target, SnowflakeErr onTimeout) -> ext::expected<std::int64_t, std::error_code>;

private:
  GeneratorOption mOption;
  std::uint32_t mNodeId;
  std::int64_t mEpoch;
  Clock& mClock;

  std::mutex mMt;
  std::optional<std::int64_t> mLastTimestamp;
  std::uint32_t mSequence = 0;
};

} // namespace snowflake
