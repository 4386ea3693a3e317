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
 * @file synth_orchestrator.h
 * @brief Top-level synthesis run: validate, detect, chunk, dispatch, assemble
 *
 * One run walks VALIDATING -> DETECTING -> CHUNKING -> DISPATCHING ->
 * ASSEMBLING and ends in DONE or ABORTED. Segments are dispatched strictly
 * in order, one at a time, with a pacing delay between them. A failed
 * segment is recorded and the run continues until more than half of all
 * segments have failed, at which point it aborts without audio.
 *
 * An orchestrator holds only immutable settings, so separate threads may
 * run synthesize() on separate orchestrators (or the same one) concurrently.
 */

#ifndef SYNTH_ORCHESTRATOR_H
#define SYNTH_ORCHESTRATOR_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "config/vaani_config.h"
#include "core/cancel_token.h"
#include "tts/synth_backend.h"
#include "tts/synth_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Buffer for a segment excerpt (UTF-8, truncated on a code point boundary) */
#define SYNTH_EXCERPT_MAX 512

#define SYNTH_ERROR_MESSAGE_MAX 256

/**
 * @enum synth_state_t
 * Phases of one synthesis run.
 *
 * @var SYNTH_STATE_IDLE
 * No run started yet.
 *
 * @var SYNTH_STATE_DONE
 * Terminal: the run finished, successfully or with a fatal validation,
 * chunking or assembly error.
 *
 * @var SYNTH_STATE_ABORTED
 * Terminal: dispatch stopped early (failure threshold or cancellation).
 */
typedef enum {
   SYNTH_STATE_IDLE,
   SYNTH_STATE_VALIDATING,
   SYNTH_STATE_DETECTING,
   SYNTH_STATE_CHUNKING,
   SYNTH_STATE_DISPATCHING,
   SYNTH_STATE_ASSEMBLING,
   SYNTH_STATE_DONE,
   SYNTH_STATE_ABORTED
} synth_state_t;

static inline const char *synth_state_name(synth_state_t state) {
   switch (state) {
      case SYNTH_STATE_IDLE:
         return "IDLE";
      case SYNTH_STATE_VALIDATING:
         return "VALIDATING";
      case SYNTH_STATE_DETECTING:
         return "DETECTING";
      case SYNTH_STATE_CHUNKING:
         return "CHUNKING";
      case SYNTH_STATE_DISPATCHING:
         return "DISPATCHING";
      case SYNTH_STATE_ASSEMBLING:
         return "ASSEMBLING";
      case SYNTH_STATE_DONE:
         return "DONE";
      case SYNTH_STATE_ABORTED:
         return "ABORTED";
      default:
         return "UNKNOWN";
   }
}

/**
 * @brief One segment that could not be synthesized
 */
typedef struct {
   int segment_index;                /**< 1-based position of the segment */
   char excerpt[SYNTH_EXCERPT_MAX];  /**< Leading characters of the segment text */
   synth_error_t reason;             /**< Last classified failure */
   int attempts;                     /**< Attempts spent on the segment */
} synth_failure_t;

/**
 * @brief Outcome of a run
 *
 * On success, failures lists the non-fatal segment failures (warnings).
 * On a threshold abort it lists every failure recorded before the abort.
 * audio is only set on success. Release with synth_result_free().
 */
typedef struct {
   bool success;
   uint8_t *audio; /**< Concatenated audio (malloc'd) or NULL */
   size_t audio_size;
   synth_failure_t *failures; /**< Array of failure_count entries (malloc'd) or NULL */
   size_t failure_count;
   synth_error_t error;                         /**< SYNTH_OK on success */
   char error_message[SYNTH_ERROR_MESSAGE_MAX]; /**< Empty on success */
   char language[CONFIG_VOICE_MAX];             /**< Language code used for the segments */
   int segment_count;                           /**< Segments produced by chunking */
   int succeeded_count;                         /**< Segments that returned audio */
   synth_state_t final_state;                   /**< SYNTH_STATE_DONE or SYNTH_STATE_ABORTED */
} synth_result_t;

/**
 * @brief Progress notification
 *
 * Called on every phase change and before each segment is dispatched
 * (segment_index is 1-based, 0 outside DISPATCHING).
 */
typedef void (*synth_progress_callback_t)(void *userdata,
                                          synth_state_t state,
                                          int segment_index,
                                          int segment_count);

typedef struct synth_orchestrator synth_orchestrator_t;

/**
 * @brief Create an orchestrator
 *
 * @param config Settings (copied; the caller keeps ownership)
 * @param backend Backend (copied; its userdata must outlive the orchestrator)
 * @return Orchestrator, or NULL on invalid parameters or allocation failure
 */
synth_orchestrator_t *synth_orchestrator_create(const vaani_config_t *config,
                                                const synth_backend_t *backend);

void synth_orchestrator_free(synth_orchestrator_t *orch);

/**
 * @brief Register a progress callback (NULL to clear)
 *
 * Not synchronized with running synthesize() calls; set it before use.
 */
void synth_orchestrator_set_progress_callback(synth_orchestrator_t *orch,
                                              synth_progress_callback_t callback,
                                              void *userdata);

/**
 * @brief Run one synthesis
 *
 * Blocks the calling thread for the whole run. result is always filled,
 * even on failure.
 *
 * @param orch Orchestrator
 * @param text Raw input text (UTF-8)
 * @param voice_hint Requested voice, or NULL / "" to use the detected language
 * @param cancel Cancellation token (may be NULL)
 * @param result Receives the outcome (caller frees with synth_result_free)
 * @return result->error
 */
synth_error_t synth_orchestrator_synthesize(synth_orchestrator_t *orch,
                                            const char *text,
                                            const char *voice_hint,
                                            synth_cancel_t *cancel,
                                            synth_result_t *result);

/**
 * @brief Fill a result as a failure that never reached the orchestrator
 *
 * @param message Error text, or NULL for synth_error_string(err)
 */
void synth_result_set_error(synth_result_t *result, synth_error_t err, const char *message);

/**
 * @brief Free buffers owned by a result and reset it
 */
void synth_result_free(synth_result_t *result);

#ifdef __cplusplus
}
#endif

#endif /* SYNTH_ORCHESTRATOR_H */
