#pragma once

#include <spdlog/common.h>

namespace fstx {

constexpr char kLogLevelEnv[] = "FSTX_LOG_LEVEL";

// Reads FSTX_LOG_LEVEL. Unset, empty or unknown values give `warn`.
spdlog::level::level_enum ResolveLogLevel();

}  // namespace fstx
