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
 * Synthesis error taxonomy shared by the executor, orchestrator and callers
 */

#ifndef SYNTH_ERROR_H
#define SYNTH_ERROR_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Outcome codes for every synthesis operation
 *
 * Per-segment codes (TIMEOUT .. INVALID_PAYLOAD) are retryable inside the
 * executor and recorded as warnings by the orchestrator. The remaining codes
 * terminate a run.
 */
typedef enum {
   SYNTH_OK = 0,
   SYNTH_ERR_INVALID_INPUT,           /**< Empty, too long, or unknown voice hint */
   SYNTH_ERR_CHUNKING_FAILED,         /**< Chunker produced no segments */
   SYNTH_ERR_TIMEOUT,                 /**< Attempt exceeded the per-request timeout */
   SYNTH_ERR_RATE_LIMITED,            /**< Backend answered "too many requests" */
   SYNTH_ERR_SERVER_ERROR,            /**< Backend internal/upstream fault (5xx) */
   SYNTH_ERR_NETWORK,                 /**< Any other transport or HTTP failure */
   SYNTH_ERR_INVALID_PAYLOAD,         /**< Response is not plausible audio */
   SYNTH_ERR_TOO_MANY_FAILURES,       /**< More than half the segments failed */
   SYNTH_ERR_NO_AUDIO,                /**< No segment produced audio */
   SYNTH_ERR_INVALID_COMBINED_AUDIO,  /**< Combined audio below the minimum size */
   SYNTH_ERR_CANCELLED,               /**< Run cancelled by the caller */
   SYNTH_ERR_INVALID_PARAM,           /**< API misuse (NULL pointers, bad config) */
   SYNTH_ERR_OUT_OF_MEMORY,           /**< Allocation failure */
} synth_error_t;

/**
 * @brief Stable identifier for an error code ("RateLimited", "InvalidInput", ...)
 *
 * @return Static string, never NULL
 */
const char *synth_error_name(synth_error_t err);

/**
 * @brief Human-readable description of an error code
 *
 * @return Static string, never NULL
 */
const char *synth_error_string(synth_error_t err);

/**
 * @brief Whether the executor may retry after this error
 */
int synth_error_is_retryable(synth_error_t err);

#ifdef __cplusplus
}
#endif

#endif /* SYNTH_ERROR_H */
