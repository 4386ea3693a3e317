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
 * @file logging.cpp
 * @brief Mutex-guarded log writer
 */

#include "logging.h"

#include <pthread.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include <atomic>

static pthread_mutex_t g_log_mutex = PTHREAD_MUTEX_INITIALIZER;
static FILE *g_log_file = NULL;
/* Written at startup, read by every logging thread */
static std::atomic<int> g_min_level(LOG_LEVEL_INFO);

static const char *level_name(log_level_t level) {
   switch (level) {
      case LOG_LEVEL_WARNING:
         return "WARN";
      case LOG_LEVEL_ERROR:
         return "ERROR";
      case LOG_LEVEL_INFO:
      default:
         return "INFO";
   }
}

/* Basename of __FILE__ so log lines stay short */
static const char *short_file(const char *file) {
   if (!file)
      return "?";
   const char *slash = strrchr(file, '/');
   return slash ? slash + 1 : file;
}

extern "C" {

int init_logging(const char *filename) {
   pthread_mutex_lock(&g_log_mutex);
   if (g_log_file) {
      fclose(g_log_file);
      g_log_file = NULL;
   }

   int rc = 0;
   if (filename && filename[0] != '\0') {
      g_log_file = fopen(filename, "a");
      if (!g_log_file) {
         rc = 1;
      }
   }
   pthread_mutex_unlock(&g_log_mutex);

   if (rc != 0) {
      LOG_WARNING("Could not open log file %s, logging to stderr", filename);
   }
   return rc;
}

void close_logging(void) {
   pthread_mutex_lock(&g_log_mutex);
   if (g_log_file) {
      fclose(g_log_file);
      g_log_file = NULL;
   }
   pthread_mutex_unlock(&g_log_mutex);
}

void logging_set_min_level(log_level_t level) {
   g_min_level.store(level, std::memory_order_relaxed);
}

log_level_t logging_get_min_level(void) {
   return static_cast<log_level_t>(g_min_level.load(std::memory_order_relaxed));
}

int logging_level_from_name(const char *name, log_level_t *level_out) {
   if (!name || !level_out)
      return 1;

   if (strcmp(name, "info") == 0) {
      *level_out = LOG_LEVEL_INFO;
   } else if (strcmp(name, "warning") == 0 || strcmp(name, "warn") == 0) {
      *level_out = LOG_LEVEL_WARNING;
   } else if (strcmp(name, "error") == 0) {
      *level_out = LOG_LEVEL_ERROR;
   } else {
      return 1;
   }
   return 0;
}

void log_message_v(log_level_t level,
                   const char *file,
                   int line,
                   const char *func,
                   const char *fmt,
                   va_list args) {
   if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed) || !fmt)
      return;

   struct timeval tv;
   gettimeofday(&tv, NULL);
   struct tm tm_info;
   localtime_r(&tv.tv_sec, &tm_info);
   char stamp[32];
   strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_info);

   pthread_mutex_lock(&g_log_mutex);
   FILE *out = g_log_file ? g_log_file : stderr;
   fprintf(out, "[%s.%03ld] [%s] %s:%d %s: ", stamp, (long)(tv.tv_usec / 1000), level_name(level),
           short_file(file), line, func ? func : "?");
   vfprintf(out, fmt, args);
   fputc('\n', out);
   fflush(out);
   pthread_mutex_unlock(&g_log_mutex);
}

void log_message(log_level_t level,
                 const char *file,
                 int line,
                 const char *func,
                 const char *fmt,
                 ...) {
   va_list args;
   va_start(args, fmt);
   log_message_v(level, file, line, func, fmt, args);
   va_end(args);
}

} /* extern "C" */
