#ifndef CONVO_LOG_H
#define CONVO_LOG_H

#include <string>

namespace convo {

/**
 * Initialize the file logger and make it the spdlog default.
 *
 * Logs rotate per start, not per size:
 * - the previous convo.log becomes convo.0.log
 * - older files shift up: convo.0.log -> convo.1.log -> ... -> convo.{max_files-1}.log
 * - the oldest file is removed
 *
 * @param log_path log file (default ~/.config/convo/log/convo.log)
 * @param max_files number of rotated files kept
 * @param level trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

}  // namespace convo

#endif  // CONVO_LOG_H
