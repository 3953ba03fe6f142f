#include "fstx/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "fstx/common/config.hpp"

namespace fstx {

const std::shared_ptr<spdlog::logger>& Logger() {
  static const std::shared_ptr<spdlog::logger> logger = []() {
    std::shared_ptr<spdlog::logger> existing = spdlog::get("fstx");
    if (existing != nullptr) {
      return existing;
    }
    std::shared_ptr<spdlog::logger> created = spdlog::stderr_color_mt("fstx");
    created->set_level(ResolveLogLevel());
    return created;
  }();
  return logger;
}

}  // namespace fstx
