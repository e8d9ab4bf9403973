#include "snowflake.hpp"

#include <thread>

namespace snowflake {

Generator::Generator(GeneratorOption const& option, std::int64_t epoch, Clock& clock) noexcept
    : mOption(option), mNodeId(static_cast<std::uint32_t>(option.nodeId)), mEpoch(epoch), mClock(clock)
{
}

auto Generator::create(GeneratorOption const& option, Clock& clock)
    -> ext::expected<std::unique_ptr<Generator>, std::error_code>
{
  if (option.nodeId < 0 || option.nodeId > kMaxNodeId) {
    spdlog::warn("snowflake: node id {} out of range [0, {}]", option.nodeId, kMaxNodeId);
    return ext::make_unexpected(SnowflakeErr::InvalidNodeId);
  }
  if (option.backwardTolerance.count() < 0 || option.maxWait.count() < 0) {
    spdlog::warn("snowflake: negative wait bound (backwardTolerance={}ms, maxWait={}ms)",
                 option.backwardTolerance.count(), option.maxWait.count());
    return ext::make_unexpected(SnowflakeErr::InvalidOption);
  }
  auto epoch = option.epoch.value_or(kDefaultEpoch);
  if (epoch < 0) {
    spdlog::warn("snowflake: negative epoch {}", epoch);
    return ext::make_unexpected(SnowflakeErr::InvalidEpoch);
  }
  auto now = clock.nowMillis();
  if (!now) {
    return ext::make_unexpected(now.error());
  }
  if (epoch > *now || *now - epoch > kMaxTimestamp) {
    spdlog::warn("snowflake: epoch {} not usable at {}", epoch, *now);
    return ext::make_unexpected(SnowflakeErr::InvalidEpoch);
  }
  return std::make_unique<Generator>(option, epoch, clock);
}

auto Generator::create(GeneratorOption const& option) -> ext::expected<std::unique_ptr<Generator>, std::error_code>
{
  return create(option, systemClock());
}

auto Generator::generate() -> ext::expected<ID, std::error_code>
{
  auto lk = std::scoped_lock(mMt);
  auto elapsed = elapsedMillis();
  if (!elapsed) {
    return ext::make_unexpected(elapsed.error());
  }
  auto now = *elapsed;
  auto sequence = std::uint32_t(0);

  if (mLastTimestamp && now < *mLastTimestamp) {
    auto drift = *mLastTimestamp - now;
    spdlog::warn("snowflake node {}: clock moved backwards by {}ms", mNodeId, drift);
    if (drift > mOption.backwardTolerance.count()) {
      return ext::make_unexpected(SnowflakeErr::ClockMovedBackwards);
    }
    auto caughtUp = waitUntil(*mLastTimestamp, SnowflakeErr::ClockMovedBackwards);
    if (!caughtUp) {
      return ext::make_unexpected(caughtUp.error());
    }
    now = *caughtUp;
  }

  if (mLastTimestamp && now == *mLastTimestamp) {
    sequence = mSequence + 1;
    if (sequence > kMaxSequence) {
      spdlog::debug("snowflake node {}: sequence exhausted at {}, waiting for next millisecond", mNodeId, now);
      auto next = waitUntil(now + 1, SnowflakeErr::SequenceOverflow);
      if (!next) {
        return ext::make_unexpected(next.error());
      }
      now = *next;
      sequence = 0;
    }
  }

  if (now > kMaxTimestamp) {
    spdlog::error("snowflake node {}: {}ms since epoch {} exceeds {} bits", mNodeId, now, mEpoch, kTimestampBits);
    return ext::make_unexpected(SnowflakeErr::TimestampOverflow);
  }
  mLastTimestamp = now;
  mSequence = sequence;
  return ID::compose(static_cast<std::uint64_t>(now), mNodeId, sequence);
}

auto Generator::elapsedMillis() -> ext::expected<std::int64_t, std::error_code>
{
  auto now = mClock.nowMillis();
  if (!now) {
    return now;
  }
  if (*now < mEpoch) {
    return ext::make_unexpected(SnowflakeErr::ClockBeforeEpoch);
  }
  return *now - mEpoch;
}

// Spins until elapsedMillis() reaches target. Runs under mMt.
auto Generator::waitUntil(std::int64_t target, SnowflakeErr onTimeout) -> ext::expected<std::int64_t, std::error_code>
{
  auto deadline = std::chrono::steady_clock::now() + mOption.maxWait;
  while (true) {
    auto elapsed = elapsedMillis();
    if (!elapsed || *elapsed >= target) {
      return elapsed;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return ext::make_unexpected(onTimeout);
    }
    std::this_thread::yield();
  }
}

} // namespace snowflake
