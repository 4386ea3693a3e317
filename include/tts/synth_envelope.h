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
 * @file synth_envelope.h
 * @brief JSON request parsing and result envelopes for vaani-tts
 *
 * Request:  {"text": "...", "voice": "en"}
 *
 * Success:  {"success": true, "audio": "<base64>", "language": "en",
 *            "segments": 2, "warnings": [{"segment": 2, "excerpt": "...",
 *            "reason": "Timeout", "attempts": 3}]}
 *
 * Failure:  {"success": false, "error": "...", "error_code": "InvalidInput",
 *            "failures": [...]}
 */

#ifndef SYNTH_ENVELOPE_H
#define SYNTH_ENVELOPE_H

#include <json-c/json.h>

#include "tts/synth_orchestrator.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Process exit status */
#define VAANI_EXIT_OK 0
#define VAANI_EXIT_SYNTH_FAILED 1
#define VAANI_EXIT_USAGE 2

/**
 * @brief Fields taken from a JSON request argument
 *
 * Absent or non-string fields are left as empty strings, so a request
 * without text is rejected by validation rather than by the parser.
 */
typedef struct {
   char *text;  /**< Allocated, never NULL after a successful parse */
   char *voice; /**< Allocated, empty when no hint was given */
} synth_envelope_request_t;

/**
 * @brief Parse a {"text": ..., "voice": ...} argument
 *
 * @param json Argument text
 * @param request Receives allocated fields; release with
 *                synth_envelope_request_free()
 * @return 0 on success, 1 if the argument is not a JSON object,
 *         2 on allocation failure
 */
int synth_envelope_parse_request(const char *json, synth_envelope_request_t *request);

void synth_envelope_request_free(synth_envelope_request_t *request);

/**
 * @brief Failure envelope for errors outside a synthesis run
 *
 * @param code Stable error name, or NULL to omit "error_code"
 * @return New reference (caller puts), or NULL on allocation failure
 */
json_object *synth_envelope_error(const char *message, const char *code);

/**
 * @brief Envelope for a finished run
 *
 * On success the audio is embedded as base64 unless output_path is given,
 * in which case "output" and "audio_bytes" describe the file the caller
 * wrote instead. Segment failures are listed as "warnings" on success and
 * as "failures" on error.
 *
 * @return New reference (caller puts), or NULL on allocation failure
 */
json_object *synth_envelope_from_result(const synth_result_t *result, const char *output_path);

/**
 * @brief Exit status for a finished run: VAANI_EXIT_OK or VAANI_EXIT_SYNTH_FAILED
 */
int synth_envelope_exit_code(const synth_result_t *result);

#ifdef __cplusplus
}
#endif

#endif /* SYNTH_ENVELOPE_H */
