#pragma once

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <system_error>

namespace ext {
using namespace tl;
}
