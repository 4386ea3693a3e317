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
 * @file vaani_config.cpp
 * @brief Built-in defaults, the field table and voice list helpers
 */

#include "config/vaani_config.h"

#include <ctype.h>
#include <string.h>

#include "config/config_fields.h"
#include "tts/text_chunker.h"
#include "utils/utf8_utils.h"

#define INT_FIELD(sec, name) \
   { #sec, #name, CONFIG_FIELD_INT, offsetof(vaani_config_t, sec.name), 0 }
#define STR_FIELD(sec, name)                                               \
   { #sec, #name, CONFIG_FIELD_STRING, offsetof(vaani_config_t, sec.name), \
     sizeof(((vaani_config_t *)0)->sec.name) }

extern "C" {

const config_field_t g_config_fields[] = {
   STR_FIELD(general, log_file),
   STR_FIELD(general, log_level),
   INT_FIELD(limits, max_input_chars),
   INT_FIELD(limits, max_input_bytes),
   INT_FIELD(chunking, max_segment_chars),
   STR_FIELD(chunking, boundaries),
   INT_FIELD(retry, max_attempts),
   INT_FIELD(retry, request_timeout_sec),
   INT_FIELD(retry, retry_delay_ms),
   INT_FIELD(retry, rate_limit_backoff_ms),
   INT_FIELD(dispatch, pacing_delay_ms),
   INT_FIELD(dispatch, excerpt_chars),
   INT_FIELD(payload, min_audio_bytes),
   STR_FIELD(backend, endpoint),
   STR_FIELD(backend, client),
   STR_FIELD(backend, user_agent),
   INT_FIELD(backend, max_response_bytes),
};

const size_t g_config_field_count = sizeof(g_config_fields) / sizeof(g_config_fields[0]);

void config_set_defaults(vaani_config_t *config) {
   if (!config)
      return;

   memset(config, 0, sizeof(*config));

   safe_strncpy(config->general.log_level, "info", sizeof(config->general.log_level));

   config->limits.max_input_chars = DEFAULT_MAX_INPUT_CHARS;
   config->limits.max_input_bytes = DEFAULT_MAX_INPUT_BYTES;

   config->chunking.max_segment_chars = DEFAULT_MAX_SEGMENT_CHARS;
   safe_strncpy(config->chunking.boundaries, TEXT_CHUNKER_DEFAULT_BOUNDARIES,
                sizeof(config->chunking.boundaries));

   config->retry.max_attempts = DEFAULT_MAX_ATTEMPTS;
   config->retry.request_timeout_sec = DEFAULT_REQUEST_TIMEOUT_SEC;
   config->retry.retry_delay_ms = DEFAULT_RETRY_DELAY_MS;
   config->retry.rate_limit_backoff_ms = DEFAULT_RATE_LIMIT_BACKOFF_MS;

   config->dispatch.pacing_delay_ms = DEFAULT_PACING_DELAY_MS;
   config->dispatch.excerpt_chars = DEFAULT_EXCERPT_CHARS;

   config->payload.min_audio_bytes = DEFAULT_MIN_AUDIO_BYTES;

   safe_strncpy(config->backend.endpoint, DEFAULT_BACKEND_ENDPOINT,
                sizeof(config->backend.endpoint));
   safe_strncpy(config->backend.client, DEFAULT_BACKEND_CLIENT, sizeof(config->backend.client));
   safe_strncpy(config->backend.user_agent, DEFAULT_USER_AGENT,
                sizeof(config->backend.user_agent));
   config->backend.max_response_bytes = DEFAULT_MAX_RESPONSE_BYTES;

   safe_strncpy(config->voices.names[0], "en", CONFIG_VOICE_MAX);
   safe_strncpy(config->voices.names[1], "hi", CONFIG_VOICE_MAX);
   config->voices.count = 2;
}

bool config_voice_allowed(const vaani_config_t *config, const char *voice) {
   if (!config || !voice)
      return false;

   for (int i = 0; i < config->voices.count; i++) {
      if (strcmp(config->voices.names[i], voice) == 0) {
         return true;
      }
   }
   return false;
}

int config_set_voices_csv(vaani_config_t *config, const char *csv) {
   if (!config || !csv)
      return 1;

   voices_config_t parsed;
   memset(&parsed, 0, sizeof(parsed));

   const char *p = csv;
   while (*p) {
      while (*p == ',' || isspace((unsigned char)*p))
         p++;
      const char *start = p;
      while (*p && *p != ',')
         p++;
      const char *end = p;
      while (end > start && isspace((unsigned char)end[-1]))
         end--;

      size_t len = (size_t)(end - start);
      if (len == 0)
         continue;
      if (len >= CONFIG_VOICE_MAX || parsed.count >= CONFIG_MAX_VOICES)
         return 1;

      memcpy(parsed.names[parsed.count], start, len);
      parsed.names[parsed.count][len] = '\0';
      parsed.count++;
   }

   config->voices = parsed;
   return 0;
}

} /* extern "C" */
