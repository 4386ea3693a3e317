/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * Application logging - timestamped, level-tagged log lines
 *
 * Writes to stderr by default, or to a file opened with init_logging().
 * stdout is reserved for command output (the JSON envelope).
 *
 * Thread Safety: log_message() and the min-level accessors are thread-safe.
 * init_logging() and close_logging() must be called before/after any other
 * threads run.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
   LOG_LEVEL_INFO = 0,
   LOG_LEVEL_WARNING = 1,
   LOG_LEVEL_ERROR = 2,
} log_level_t;

/**
 * @brief Open the log destination
 *
 * @param filename Log file path (appended to), or NULL/empty for stderr
 * @return 0 on success, 1 if the file could not be opened (stderr is used)
 */
int init_logging(const char *filename);

/**
 * @brief Close the log file, if any, and revert to stderr
 */
void close_logging(void);

/**
 * @brief Drop messages below the given level
 */
void logging_set_min_level(log_level_t level);

log_level_t logging_get_min_level(void);

/**
 * @brief Parse "info", "warning" or "error"
 *
 * @return 0 on success, 1 if the name is unknown (level_out unchanged)
 */
int logging_level_from_name(const char *name, log_level_t *level_out);

void log_message(log_level_t level,
                 const char *file,
                 int line,
                 const char *func,
                 const char *fmt,
                 ...);

void log_message_v(log_level_t level,
                   const char *file,
                   int line,
                   const char *func,
                   const char *fmt,
                   va_list args);

#define LOG_INFO(fmt, ...) \
   log_message(LOG_LEVEL_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define LOG_WARNING(fmt, ...) \
   log_message(LOG_LEVEL_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(fmt, ...) \
   log_message(LOG_LEVEL_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* LOGGING_H */
