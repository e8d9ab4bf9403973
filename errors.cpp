#include "errors.hpp"

namespace snowflake {

auto SnowflakeErrCatagory::name() const noexcept -> char const* { return "SnowflakeError"; }
auto SnowflakeErrCatagory::message(int ev) const -> std::string
{
  switch (static_cast<SnowflakeErr>(ev)) {
  case SnowflakeErr::Ok:
    return "Ok";
  case SnowflakeErr::InvalidNodeId:
    return "InvalidNodeId";
  case SnowflakeErr::InvalidEpoch:
    return "InvalidEpoch";
  case SnowflakeErr::InvalidOption:
    return "InvalidOption";
  case SnowflakeErr::ClockError:
    return "ClockError";
  case SnowflakeErr::ClockMovedBackwards:
    return "ClockMovedBackwards";
  case SnowflakeErr::ClockBeforeEpoch:
    return "ClockBeforeEpoch";
  case SnowflakeErr::TimestampOverflow:
    return "TimestampOverflow";
  case SnowflakeErr::SequenceOverflow:
    return "SequenceOverflow";
  default:
    return "Unknown";
  }
}
auto snowflakeErrCatagory() -> SnowflakeErrCatagory const&
{
  static SnowflakeErrCatagory catagory;
  return catagory;
}
auto make_error_code(SnowflakeErr e) -> std::error_code { return {static_cast<int>(e), snowflakeErrCatagory()}; }
auto make_error_condition(SnowflakeErr e) -> std::error_condition
{
  return {static_cast<int>(e), snowflakeErrCatagory()};
}

} // namespace snowflake
