#ifndef CLAIRE_LOG_H
#define CLAIRE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace claire {

/**
 * Initialize logging.
 *
 * Rotation happens once per startup:
 * - the current claire.log becomes claire.0.log
 * - older logs shift claire.0.log -> claire.1.log -> ... -> claire.{max_files-1}.log
 * - the oldest one is removed
 *
 * @param log_path log file path (default ~/.config/claire/log/claire.log)
 * @param max_files number of rotated logs to keep
 * @param level trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger.
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace claire

#endif  // CLAIRE_LOG_H
