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
 * @file segment_executor.cpp
 * @brief Attempt loop, response classification and payload sniffing
 */

#include "tts/segment_executor.h"

#include <stdlib.h>
#include <string.h>

#include "config/vaani_config.h"
#include "logging.h"
#include "utils/utf8_utils.h"

/* Bytes inspected by the text heuristic */
#define PAYLOAD_SNIFF_BYTES 4096

/* Percentage of printable code points above which a payload counts as text */
#define PAYLOAD_TEXT_PRINTABLE_PCT 95

extern "C" {

synth_executor_config_t synth_executor_default_config(void) {
   synth_executor_config_t config;
   config.max_attempts = DEFAULT_MAX_ATTEMPTS;
   config.request_timeout_sec = DEFAULT_REQUEST_TIMEOUT_SEC;
   config.retry_delay_ms = DEFAULT_RETRY_DELAY_MS;
   config.rate_limit_backoff_ms = DEFAULT_RATE_LIMIT_BACKOFF_MS;
   config.min_payload_bytes = DEFAULT_MIN_AUDIO_BYTES;
   return config;
}

void synth_segment_outcome_init(synth_segment_outcome_t *outcome) {
   if (!outcome)
      return;
   outcome->audio = NULL;
   outcome->audio_size = 0;
   outcome->attempts = 0;
   outcome->error = SYNTH_OK;
   outcome->last_http_status = 0;
}

void synth_segment_outcome_free(synth_segment_outcome_t *outcome) {
   if (!outcome)
      return;
   free(outcome->audio);
   outcome->audio = NULL;
   outcome->audio_size = 0;
}

bool synth_payload_has_audio_signature(const uint8_t *data, size_t size) {
   if (!data || size < 4)
      return false;

   if (memcmp(data, "ID3", 3) == 0)
      return true;  // MP3 with ID3v2 tag
   if (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0)
      return true;  // MPEG audio frame sync / ADTS AAC
   if (memcmp(data, "OggS", 4) == 0 || memcmp(data, "fLaC", 4) == 0)
      return true;
   if (data[0] == 0x1A && data[1] == 0x45 && data[2] == 0xDF && data[3] == 0xA3)
      return true;  // EBML: WebM / Matroska
   if (size >= 12) {
      if (memcmp(data, "RIFF", 4) == 0 && memcmp(data + 8, "WAVE", 4) == 0)
         return true;
      if (memcmp(data, "FORM", 4) == 0 &&
          (memcmp(data + 8, "AIFF", 4) == 0 || memcmp(data + 8, "AIFC", 4) == 0))
         return true;
      if (memcmp(data + 4, "ftyp", 4) == 0)
         return true;  // MP4 / M4A
   }
   return false;
}

bool synth_payload_looks_like_text(const uint8_t *data, size_t size) {
   if (!data || size == 0)
      return false;

   size_t limit = size < PAYLOAD_SNIFF_BYTES ? size : PAYLOAD_SNIFF_BYTES;
   const char *s = reinterpret_cast<const char *>(data);
   size_t pos = 0;
   size_t total = 0;
   size_t printable = 0;

   while (pos < limit) {
      if (data[pos] == 0)
         return false;

      unsigned int cp;
      size_t used = utf8_decode(s + pos, size - pos, &cp);
      if (cp == UTF8_REPLACEMENT_CHAR && used == 1) {
         return false;  // Malformed UTF-8: binary data
      }
      total++;
      if (cp >= 0x20 || cp == '\t' || cp == '\n' || cp == '\r') {
         if (cp != 0x7F)
            printable++;
      }
      pos += used;
   }

   return total > 0 && printable * 100 >= total * PAYLOAD_TEXT_PRINTABLE_PCT;
}

bool synth_payload_is_plausible(const uint8_t *data, size_t size, size_t min_bytes) {
   if (!data || size < min_bytes || size == 0)
      return false;
   if (synth_payload_has_audio_signature(data, size))
      return true;
   return !synth_payload_looks_like_text(data, size);
}

synth_error_t synth_classify_response(const synth_response_t *response, size_t min_payload_bytes) {
   if (!response)
      return SYNTH_ERR_NETWORK;

   switch (response->transport) {
      case SYNTH_TRANSPORT_TIMEOUT:
         return SYNTH_ERR_TIMEOUT;
      case SYNTH_TRANSPORT_CANCELLED:
         return SYNTH_ERR_CANCELLED;
      case SYNTH_TRANSPORT_NETWORK:
         return SYNTH_ERR_NETWORK;
      case SYNTH_TRANSPORT_OK:
         break;
   }

   long status = response->http_status;
   if (status == 429)
      return SYNTH_ERR_RATE_LIMITED;
   if (status >= 500 && status <= 599)
      return SYNTH_ERR_SERVER_ERROR;
   if (status < 200 || status > 299)
      return SYNTH_ERR_NETWORK;

   if (!synth_payload_is_plausible(response->body, response->body_size, min_payload_bytes))
      return SYNTH_ERR_INVALID_PAYLOAD;
   return SYNTH_OK;
}

int synth_retry_delay_ms(const synth_executor_config_t *config, synth_error_t error, int attempt) {
   if (!config)
      return 0;
   if (error == SYNTH_ERR_RATE_LIMITED)
      return attempt * config->rate_limit_backoff_ms;
   return config->retry_delay_ms;
}

synth_error_t synth_executor_execute(const synth_backend_t *backend,
                                     const synth_executor_config_t *config,
                                     const char *segment,
                                     const char *lang,
                                     synth_cancel_t *cancel,
                                     synth_segment_outcome_t *outcome) {
   if (!backend || !backend->fetch || !config || !segment || !lang || !outcome ||
       config->max_attempts < 1) {
      LOG_ERROR("synth_executor_execute: invalid parameters");
      return SYNTH_ERR_INVALID_PARAM;
   }

   synth_segment_outcome_init(outcome);
   synth_error_t last_error = SYNTH_ERR_NETWORK;

   synth_request_t request;
   request.text = segment;
   request.lang = lang;
   request.timeout_sec = config->request_timeout_sec;
   request.cancel = cancel;

   for (int attempt = 1; attempt <= config->max_attempts; attempt++) {
      if (synth_cancel_is_requested(cancel)) {
         outcome->error = SYNTH_ERR_CANCELLED;
         return SYNTH_ERR_CANCELLED;
      }

      synth_response_t response;
      synth_response_init(&response);
      outcome->attempts = attempt;

      synth_error_t err;
      if (backend->fetch(backend->userdata, &request, &response) != 0) {
         err = SYNTH_ERR_NETWORK;
         safe_strncpy(response.detail, "backend failure", sizeof(response.detail));
      } else {
         err = synth_classify_response(&response, config->min_payload_bytes);
      }
      if (response.transport == SYNTH_TRANSPORT_OK) {
         outcome->last_http_status = response.http_status;
      }

      if (err == SYNTH_OK) {
         outcome->audio = synth_response_take_body(&response, &outcome->audio_size);
         outcome->error = SYNTH_OK;
         synth_response_free(&response);
         if (attempt > 1) {
            LOG_INFO("Segment succeeded on attempt %d/%d (%zu bytes)", attempt,
                     config->max_attempts, outcome->audio_size);
         }
         return SYNTH_OK;
      }

      if (!synth_error_is_retryable(err)) {
         synth_response_free(&response);
         outcome->error = err;
         return err;
      }

      last_error = err;
      if (response.transport == SYNTH_TRANSPORT_OK) {
         LOG_WARNING("Attempt %d/%d failed: %s (HTTP %ld, %zu bytes)", attempt,
                     config->max_attempts, synth_error_name(err), response.http_status,
                     response.body_size);
      } else {
         LOG_WARNING("Attempt %d/%d failed: %s (%s)", attempt, config->max_attempts,
                     synth_error_name(err), response.detail[0] ? response.detail : "no detail");
      }
      synth_response_free(&response);

      if (attempt == config->max_attempts)
         break;

      int delay = synth_retry_delay_ms(config, err, attempt);
      if (delay > 0) {
         LOG_INFO("Retrying in %d ms", delay);
      }
      if (synth_cancel_sleep_ms(cancel, delay)) {
         outcome->error = SYNTH_ERR_CANCELLED;
         return SYNTH_ERR_CANCELLED;
      }
   }

   LOG_ERROR("Segment failed after %d attempt(s): %s", outcome->attempts,
             synth_error_name(last_error));
   outcome->error = last_error;
   return last_error;
}

} /* extern "C" */
