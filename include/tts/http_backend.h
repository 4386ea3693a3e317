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
 * HTTP synthesis backend - libcurl implementation of synth_backend_t
 *
 * Sends each segment as a GET request:
 *   <endpoint>?ie=UTF-8&client=<client>&tl=<lang>&q=<url-escaped text>
 *
 * Thread Safety: Each fetch creates its own CURL handle and uses only
 * stack-local state, so one backend may serve concurrent runs. The caller
 * must call curl_global_init() before creating any backend.
 */

#ifndef HTTP_BACKEND_H
#define HTTP_BACKEND_H

#include <curl/curl.h>

#include "config/vaani_config.h"
#include "tts/synth_backend.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief HTTP backend (opaque type)
 */
typedef struct http_backend http_backend_t;

/**
 * @brief Create an HTTP backend from the backend config section
 *
 * The settings are copied; config need not outlive the backend.
 *
 * @param config Backend settings
 * @return Backend, or NULL on invalid config / allocation failure
 */
http_backend_t *http_backend_create(const backend_config_t *config);

/**
 * @brief Free an HTTP backend (can be NULL)
 */
void http_backend_free(http_backend_t *backend);

/**
 * @brief Expose the backend through the generic synth_backend_t interface
 *
 * The returned handle borrows backend; it is valid until http_backend_free().
 */
synth_backend_t http_backend_as_synth_backend(http_backend_t *backend);

/**
 * @brief Build the request URL for a segment
 *
 * @param curl Handle used for URL escaping
 * @param config Backend settings
 * @param text Segment text
 * @param lang Language code
 * @return Allocated URL (caller frees with free()), or NULL on failure
 */
char *http_backend_build_url(CURL *curl,
                             const backend_config_t *config,
                             const char *text,
                             const char *lang);

#ifdef __cplusplus
}
#endif

#endif /* HTTP_BACKEND_H */
