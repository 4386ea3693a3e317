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
 * @file config_validate.cpp
 * @brief Range and format checks for vaani_config_t
 */

#include "config/config_validate.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "utils/utf8_utils.h"

typedef struct {
   config_error_t *errors;
   size_t max_errors;
   int count;
} error_sink_t;

static void add_error(error_sink_t *sink, const char *field, const char *fmt, ...) {
   if (sink->errors && (size_t)sink->count < sink->max_errors) {
      config_error_t *err = &sink->errors[sink->count];
      safe_strncpy(err->field, field, sizeof(err->field));
      va_list args;
      va_start(args, fmt);
      vsnprintf(err->message, sizeof(err->message), fmt, args);
      va_end(args);
   }
   sink->count++;
}

static void check_range(error_sink_t *sink, const char *field, int value, int min, int max) {
   if (value < min || value > max) {
      add_error(sink, field, "must be between %d and %d (got %d)", min, max, value);
   }
}

extern "C" {

int config_validate(const vaani_config_t *config, config_error_t *errors, size_t max_errors) {
   error_sink_t sink = { errors, max_errors, 0 };
   if (!config) {
      add_error(&sink, "config", "configuration is NULL");
      return sink.count;
   }

   const char *level = config->general.log_level;
   if (strcmp(level, "info") != 0 && strcmp(level, "warning") != 0 &&
       strcmp(level, "warn") != 0 && strcmp(level, "error") != 0) {
      add_error(&sink, "general.log_level", "must be info, warning or error (got \"%s\")", level);
   }

   check_range(&sink, "limits.max_input_chars", config->limits.max_input_chars, 1, 1000000);
   check_range(&sink, "limits.max_input_bytes", config->limits.max_input_bytes, 1, 4000000);

   check_range(&sink, "chunking.max_segment_chars", config->chunking.max_segment_chars, 1,
               100000);
   if (!utf8_is_valid(config->chunking.boundaries, strlen(config->chunking.boundaries))) {
      add_error(&sink, "chunking.boundaries", "must be valid UTF-8");
   }

   check_range(&sink, "retry.max_attempts", config->retry.max_attempts, 1, 20);
   check_range(&sink, "retry.request_timeout_sec", config->retry.request_timeout_sec, 1, 600);
   check_range(&sink, "retry.retry_delay_ms", config->retry.retry_delay_ms, 0, 60000);
   check_range(&sink, "retry.rate_limit_backoff_ms", config->retry.rate_limit_backoff_ms, 0,
               60000);

   check_range(&sink, "dispatch.pacing_delay_ms", config->dispatch.pacing_delay_ms, 0, 60000);
   check_range(&sink, "dispatch.excerpt_chars", config->dispatch.excerpt_chars, 1, 120);

   check_range(&sink, "payload.min_audio_bytes", config->payload.min_audio_bytes, 0, 1000000);

   const char *endpoint = config->backend.endpoint;
   if (strncmp(endpoint, "http://", 7) != 0 && strncmp(endpoint, "https://", 8) != 0) {
      add_error(&sink, "backend.endpoint", "must start with http:// or https:// (got \"%s\")",
                endpoint);
   }
   check_range(&sink, "backend.max_response_bytes", config->backend.max_response_bytes, 1024,
               256 * 1024 * 1024);
   if (config->backend.max_response_bytes < config->payload.min_audio_bytes) {
      add_error(&sink, "backend.max_response_bytes", "must not be below payload.min_audio_bytes");
   }

   if (config->voices.count < 0 || config->voices.count > CONFIG_MAX_VOICES) {
      add_error(&sink, "voices", "count out of range (%d)", config->voices.count);
   } else {
      for (int i = 0; i < config->voices.count; i++) {
         if (config->voices.names[i][0] == '\0') {
            add_error(&sink, "voices", "entry %d is empty", i);
         }
      }
   }

   return sink.count;
}

void config_print_errors(const config_error_t *errors, int count) {
   if (!errors)
      return;

   for (int i = 0; i < count; i++) {
      fprintf(stderr, "Config error: %s: %s\n", errors[i].field, errors[i].message);
   }
}

} /* extern "C" */
