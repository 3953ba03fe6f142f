#include "fstx/common/config.hpp"

#include <cstdlib>
#include <string_view>

namespace fstx {

spdlog::level::level_enum ResolveLogLevel() {
  const char* env = std::getenv(kLogLevelEnv);
  if (env == nullptr || env[0] == '\0') {
    return spdlog::level::warn;
  }

  const std::string_view value(env);
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "info") {
    return spdlog::level::info;
  }
  if (value == "warn") {
    return spdlog::level::warn;
  }
  if (value == "error") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return spdlog::level::warn;
}

}  // namespace fstx
