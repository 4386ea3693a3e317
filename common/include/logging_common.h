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
 * Common Logging Interface - Callback-based logging for shared library code
 *
 * The text core (chunker, language detector, UTF-8 helpers) logs through this
 * interface so it carries no dependency on the application's logger. The
 * application registers its callback once at startup (see logging_bridge.h).
 */

#ifndef VAANI_COMMON_LOGGING_COMMON_H
#define VAANI_COMMON_LOGGING_COMMON_H

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log level enumeration (matches the application's log_level_t)
 */
typedef enum {
   VAANI_LOG_INFO = 0,
   VAANI_LOG_WARNING = 1,
   VAANI_LOG_ERROR = 2,
} vaani_log_level_t;

/**
 * @brief Callback function type for logging
 *
 * @param level Log level (VAANI_LOG_INFO, VAANI_LOG_WARNING, VAANI_LOG_ERROR)
 * @param file Source file name (from __FILE__)
 * @param line Line number (from __LINE__)
 * @param func Function name (from __func__)
 * @param fmt Printf-style format string
 * @param args Variable arguments list
 */
typedef void (*vaani_log_callback_t)(vaani_log_level_t level,
                                     const char *file,
                                     int line,
                                     const char *func,
                                     const char *fmt,
                                     va_list args);

/**
 * @brief Set the logging callback for common library code
 *
 * If not set, log messages are discarded.
 *
 * Thread Safety: NOT thread-safe. Call once at initialization before any
 * other threads are started.
 *
 * @param callback The logging callback function, or NULL to disable logging
 */
void vaani_common_set_logger(vaani_log_callback_t callback);

/**
 * @brief Internal logging function - do not call directly
 *
 * Use the VAANI_LOG_* macros instead.
 */
void vaani_common_log(vaani_log_level_t level,
                      const char *file,
                      int line,
                      const char *func,
                      const char *fmt,
                      ...);

#define VAANI_LOG_INFO(fmt, ...) \
   vaani_common_log(VAANI_LOG_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define VAANI_LOG_WARNING(fmt, ...) \
   vaani_common_log(VAANI_LOG_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define VAANI_LOG_ERROR(fmt, ...) \
   vaani_common_log(VAANI_LOG_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* VAANI_COMMON_LOGGING_COMMON_H */
