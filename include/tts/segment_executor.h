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
 * @file segment_executor.h
 * @brief Per-segment synthesis with classified retry and backoff
 *
 * Sends one segment to a backend and retries until a plausible audio
 * payload arrives or the attempts run out. All failure kinds share a
 * single attempt counter.
 *
 * | Outcome                         | Error                    | Delay before retry     |
 * |---------------------------------|--------------------------|------------------------|
 * | Transport timeout               | SYNTH_ERR_TIMEOUT        | retry_delay_ms         |
 * | HTTP 429                        | SYNTH_ERR_RATE_LIMITED   | attempt * backoff_ms   |
 * | HTTP 5xx                        | SYNTH_ERR_SERVER_ERROR   | retry_delay_ms         |
 * | Other transport / HTTP failure  | SYNTH_ERR_NETWORK        | retry_delay_ms         |
 * | 2xx but not plausible audio     | SYNTH_ERR_INVALID_PAYLOAD| retry_delay_ms         |
 *
 * Cancellation (during the transfer or a delay) ends the loop at once with
 * SYNTH_ERR_CANCELLED. No delay follows the final attempt.
 */

#ifndef SEGMENT_EXECUTOR_H
#define SEGMENT_EXECUTOR_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "core/cancel_token.h"
#include "tts/synth_backend.h"
#include "tts/synth_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Executor settings
 */
typedef struct {
   int max_attempts;         /**< Total attempts per segment (>= 1) */
   int request_timeout_sec;  /**< Per-attempt timeout passed to the backend */
   int retry_delay_ms;       /**< Delay after timeout/server/network/payload failures */
   int rate_limit_backoff_ms;/**< Multiplied by the 1-based attempt number after a 429 */
   size_t min_payload_bytes; /**< Smaller bodies are rejected as implausible */
} synth_executor_config_t;

/**
 * @brief Result of executing one segment
 *
 * Initialize with synth_segment_outcome_init(); release with
 * synth_segment_outcome_free().
 */
typedef struct {
   uint8_t *audio;    /**< Audio bytes on success (malloc'd), else NULL */
   size_t audio_size;
   int attempts;      /**< Attempts performed */
   synth_error_t error;   /**< SYNTH_OK or the last classified failure */
   long last_http_status; /**< Status of the last completed exchange, 0 if none */
} synth_segment_outcome_t;

/**
 * @brief Default settings (3 attempts, 30s timeout, 1s retry, 2s backoff unit, 100 bytes)
 */
synth_executor_config_t synth_executor_default_config(void);

void synth_segment_outcome_init(synth_segment_outcome_t *outcome);

void synth_segment_outcome_free(synth_segment_outcome_t *outcome);

/**
 * @brief Synthesize one segment, retrying classified failures
 *
 * @param backend Backend to call
 * @param config Executor settings
 * @param segment Segment text (borrowed, never modified)
 * @param lang Language code for the backend
 * @param cancel Cancellation token (may be NULL)
 * @param outcome Initialized outcome to fill
 * @return SYNTH_OK, a per-segment error, SYNTH_ERR_CANCELLED or SYNTH_ERR_INVALID_PARAM
 */
synth_error_t synth_executor_execute(const synth_backend_t *backend,
                                     const synth_executor_config_t *config,
                                     const char *segment,
                                     const char *lang,
                                     synth_cancel_t *cancel,
                                     synth_segment_outcome_t *outcome);

/**
 * @brief Classify one backend response
 *
 * @return SYNTH_OK when the body is plausible audio, else the error kind
 */
synth_error_t synth_classify_response(const synth_response_t *response, size_t min_payload_bytes);

/**
 * @brief Delay in milliseconds before the attempt following a failure
 *
 * @param config Executor settings
 * @param error Classified failure of the attempt just made
 * @param attempt 1-based number of that attempt
 */
int synth_retry_delay_ms(const synth_executor_config_t *config, synth_error_t error, int attempt);

/**
 * @brief Check leading bytes against known audio container signatures
 *
 * Recognizes MP3 (ID3 tag or MPEG frame sync, which also covers ADTS AAC),
 * WAV/RIFF, AIFF, Ogg, FLAC, MP4/M4A (ftyp) and WebM/Matroska.
 */
bool synth_payload_has_audio_signature(const uint8_t *data, size_t size);

/**
 * @brief Heuristic: the bytes are an inline text message (HTML, JSON, plain error)
 *
 * True when the leading bytes are well-formed UTF-8 without NULs and
 * nearly all code points are printable or whitespace.
 */
bool synth_payload_looks_like_text(const uint8_t *data, size_t size);

/**
 * @brief Plausible audio: at least min_bytes, and either a known signature or not text
 */
bool synth_payload_is_plausible(const uint8_t *data, size_t size, size_t min_bytes);

#ifdef __cplusplus
}
#endif

#endif /* SEGMENT_EXECUTOR_H */
