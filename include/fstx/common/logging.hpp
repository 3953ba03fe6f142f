#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace fstx {

// Library-wide logger named "fstx", writing to stderr at the level given by
// FSTX_LOG_LEVEL.
const std::shared_ptr<spdlog::logger>& Logger();

}  // namespace fstx
