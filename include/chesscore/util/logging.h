// include/chesscore/util/logging.h
#ifndef CHESSCORE_LOGGING_H
#define CHESSCORE_LOGGING_H

#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace chesscore {
namespace util {

/**
 * @brief Parse a level name: off, critical, error, warn, info, debug, trace
 *
 * Case-insensitive; "warning" is accepted for warn.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * @brief Configure the default spdlog logger
 *
 * At level "off" logging is disabled and no file is created. Otherwise
 * messages go to a timestamped file under @p logDirectory, or to the
 * console when the directory is empty.
 *
 * @param level Level name
 * @param logDirectory Directory for log files, created if missing
 * @return Path of the log file, empty when logging to the console or disabled
 * @throws core::ConfigException for an unknown level or an unusable directory
 */
std::string setupLogging(const std::string& level, const std::string& logDirectory = "");

} // namespace util
} // namespace chesscore

#endif // CHESSCORE_LOGGING_H
