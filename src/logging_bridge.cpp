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
 */

/**
 * @file logging_bridge.cpp
 * @brief Forwards VAANI_LOG_* calls to log_message_v()
 */

#include "logging_bridge.h"

#include "logging.h"
#include "logging_common.h"

static void common_log_callback(vaani_log_level_t level,
                                const char *file,
                                int line,
                                const char *func,
                                const char *fmt,
                                va_list args) {
   log_level_t app_level;
   switch (level) {
      case VAANI_LOG_WARNING:
         app_level = LOG_LEVEL_WARNING;
         break;
      case VAANI_LOG_ERROR:
         app_level = LOG_LEVEL_ERROR;
         break;
      case VAANI_LOG_INFO:
      default:
         app_level = LOG_LEVEL_INFO;
         break;
   }
   log_message_v(app_level, file, line, func, fmt, args);
}

extern "C" {

void logging_bridge_init(void) {
   vaani_common_set_logger(common_log_callback);
}

} /* extern "C" */
