#include "claire/claire.hpp"

#include <spdlog/spdlog.h>

#include "claire/core/version.hpp"
#include "claire/log/log.h"

namespace claire {

void init(const Config& config, std::shared_ptr<net::HttpClient> http) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);

  tools::register_builtins(ToolRegistry::instance(), std::move(http));

  spdlog::info("[Claire] v{} ready, provider={}, model={}", version(), config.backend.provider, config.backend.default_model);
}

std::string version() {
  return CLAIRE_VERSION_STRING;
}

}  // namespace claire
