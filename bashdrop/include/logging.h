#ifndef BASHDROP_LOGGING_H
#define BASHDROP_LOGGING_H

#include <string>

namespace bashdrop {
namespace logging {

enum class Level {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/*
 * Redirects log output to the given file (append mode) and sets the
 * minimum level written. An empty path disables the log file.
 * Safe to call again; the previous file is closed.
 */
void configure(const std::string& path, Level min_level);

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace logging
}  // namespace bashdrop

#endif  // BASHDROP_LOGGING_H
