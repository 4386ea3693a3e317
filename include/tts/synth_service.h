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
 * @file synth_service.h
 * @brief FIFO gate that runs one synthesis at a time
 *
 * Callers on any thread submit runs; each submit() blocks until every run
 * submitted before it has finished, then runs on the caller's thread. A
 * caller whose cancellation token fires while still queued leaves the queue
 * and receives SYNTH_ERR_CANCELLED without touching the backend.
 */

#ifndef SYNTH_SERVICE_H
#define SYNTH_SERVICE_H

#include <stdbool.h>

#include "core/cancel_token.h"
#include "tts/synth_orchestrator.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
   bool is_processing; /**< A run is in progress */
   int queue_length;   /**< Runs waiting behind it */
} synth_service_status_t;

typedef struct synth_service synth_service_t;

/**
 * @brief Create a service around an orchestrator
 *
 * @param orch Orchestrator (borrowed; must outlive the service)
 * @return Service, or NULL on failure
 */
synth_service_t *synth_service_create(synth_orchestrator_t *orch);

/**
 * @brief Free a service
 *
 * No submit() may be in progress.
 */
void synth_service_free(synth_service_t *svc);

/**
 * @brief Queue a run and wait for its result
 *
 * Same contract as synth_orchestrator_synthesize().
 */
synth_error_t synth_service_submit(synth_service_t *svc,
                                   const char *text,
                                   const char *voice_hint,
                                   synth_cancel_t *cancel,
                                   synth_result_t *result);

void synth_service_get_status(synth_service_t *svc, synth_service_status_t *status);

#ifdef __cplusplus
}
#endif

#endif /* SYNTH_SERVICE_H */
