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
 * @file synth_backend.h
 * @brief Outbound interface to a remote speech-synthesis backend
 *
 * The executor never talks HTTP directly. It calls a backend through this
 * function-pointer table, which lets the CLI plug in the libcurl backend
 * (http_backend.h) and tests plug in a scripted fake.
 *
 * A backend reports what happened on the wire; classification into
 * retryable error kinds is the executor's job (see segment_executor.h).
 */

#ifndef SYNTH_BACKEND_H
#define SYNTH_BACKEND_H

#include <stddef.h>
#include <stdint.h>

#include "core/cancel_token.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Transport-level outcome of one request */
typedef enum {
   SYNTH_TRANSPORT_OK = 0,    /**< Exchange completed; see http_status */
   SYNTH_TRANSPORT_TIMEOUT,   /**< Per-request timeout elapsed */
   SYNTH_TRANSPORT_NETWORK,   /**< Connection, DNS, TLS or read failure */
   SYNTH_TRANSPORT_CANCELLED, /**< Aborted through the cancellation token */
} synth_transport_t;

#define SYNTH_RESPONSE_DETAIL_MAX 128

/**
 * @brief One synthesis request (all pointers borrowed for the call)
 */
typedef struct {
   const char *text;       /**< Segment text (UTF-8) */
   const char *lang;       /**< Language/voice code, e.g. "en" */
   int timeout_sec;        /**< Per-attempt timeout */
   synth_cancel_t *cancel; /**< Token to watch during the transfer (may be NULL) */
} synth_request_t;

/**
 * @brief Backend response
 *
 * Initialize with synth_response_init(); release with synth_response_free().
 */
typedef struct {
   synth_transport_t transport;
   long http_status; /**< HTTP status when transport is OK, else 0 */
   uint8_t *body;    /**< Response body (malloc'd, may be NULL) */
   size_t body_size;
   char detail[SYNTH_RESPONSE_DETAIL_MAX]; /**< Transport error text, if any */
} synth_response_t;

/**
 * @brief Perform one request
 *
 * Must fill response for every transport outcome. A non-zero return means
 * the backend itself failed (e.g. allocation) and is treated as a network
 * error by the executor.
 *
 * @param userdata Backend context
 * @param request Request to send
 * @param response Initialized response to fill
 * @return 0 if response describes the outcome, non-zero on internal failure
 */
typedef int (*synth_backend_fetch_fn)(void *userdata,
                                      const synth_request_t *request,
                                      synth_response_t *response);

/**
 * @brief Backend handle: a fetch function plus its context
 */
typedef struct {
   synth_backend_fetch_fn fetch;
   void *userdata;
   const char *name; /**< For logging */
} synth_backend_t;

void synth_response_init(synth_response_t *response);

void synth_response_free(synth_response_t *response);

/**
 * @brief Copy bytes into the response body (replacing any previous body)
 *
 * @return 0 on success, 1 on allocation failure
 */
int synth_response_set_body(synth_response_t *response, const void *data, size_t size);

/**
 * @brief Transfer ownership of the body to the caller
 *
 * @param response Response to take from (body reset to NULL)
 * @param size_out Receives the body size
 * @return Body pointer (caller frees), or NULL if empty
 */
uint8_t *synth_response_take_body(synth_response_t *response, size_t *size_out);

#ifdef __cplusplus
}
#endif

#endif /* SYNTH_BACKEND_H */
