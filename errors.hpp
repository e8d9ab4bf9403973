#pragma once
#include <string>
#include <system_error>

namespace snowflake {

enum class SnowflakeErr {
  Ok = 0,
  InvalidNodeId,
  InvalidEpoch,
  InvalidOption,
  ClockError,
  ClockMovedBackwards,
  ClockBeforeEpoch,
  TimestampOverflow,
  SequenceOverflow,
};
struct SnowflakeErrCatagory : std::error_category {
  auto name() const noexcept -> char const* override;
  auto message(int ev) const -> std::string override;
};
auto snowflakeErrCatagory() -> SnowflakeErrCatagory const&;
auto make_error_code(SnowflakeErr e) -> std::error_code;
auto make_error_condition(SnowflakeErr e) -> std::error_condition;

} // namespace snowflake

namespace std {
template <>
struct is_error_code_enum<snowflake::SnowflakeErr> : true_type {};
} // namespace std
