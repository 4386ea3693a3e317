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
 * @file http_backend.cpp
 * @brief libcurl GET transport for segment synthesis
 */

#include "tts/http_backend.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <new>

#include "logging.h"
#include "tools/curl_buffer.h"
#include "utils/utf8_utils.h"

/* Connection setup gets at most this long, within the overall request timeout */
#define HTTP_CONNECT_TIMEOUT_SEC 10

struct http_backend {
   backend_config_t config;
};

typedef struct {
   synth_cancel_t *cancel;
} progress_ctx_t;

/**
 * CURL progress callback: abort the transfer once cancellation is requested
 */
static int http_progress_callback(void *clientp,
                                  curl_off_t dltotal,
                                  curl_off_t dlnow,
                                  curl_off_t ultotal,
                                  curl_off_t ulnow) {
   (void)dltotal;
   (void)dlnow;
   (void)ultotal;
   (void)ulnow;
   const progress_ctx_t *ctx = (const progress_ctx_t *)clientp;
   return synth_cancel_is_requested(ctx->cancel) ? 1 : 0;
}

static int http_backend_fetch(void *userdata,
                              const synth_request_t *request,
                              synth_response_t *response) {
   http_backend_t *backend = (http_backend_t *)userdata;
   if (!backend || !request || !request->text || !request->lang || !response) {
      return 1;
   }

   CURL *curl = curl_easy_init();
   if (!curl) {
      LOG_ERROR("http_backend: curl_easy_init failed");
      return 1;
   }

   char *url = http_backend_build_url(curl, &backend->config, request->text, request->lang);
   if (!url) {
      curl_easy_cleanup(curl);
      return 1;
   }

   curl_buffer_t buffer;
   curl_buffer_init(&buffer, (size_t)backend->config.max_response_bytes);
   progress_ctx_t progress = { request->cancel };
   char errbuf[CURL_ERROR_SIZE] = "";

   long timeout = request->timeout_sec > 0 ? request->timeout_sec : 30;
   curl_easy_setopt(curl, CURLOPT_URL, url);
   curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
   curl_easy_setopt(curl, CURLOPT_USERAGENT, backend->config.user_agent);
   curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
   curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
   curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
   curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                    timeout < HTTP_CONNECT_TIMEOUT_SEC ? timeout : (long)HTTP_CONNECT_TIMEOUT_SEC);
   curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
   curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_buffer_write_callback);
   curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
   curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
   curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, http_progress_callback);
   curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress);
   curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

   CURLcode res = curl_easy_perform(curl);

   int rc = 0;
   switch (res) {
      case CURLE_OK:
         response->transport = SYNTH_TRANSPORT_OK;
         curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response->http_status);
         if (synth_response_set_body(response, buffer.data, buffer.size) != 0) {
            LOG_ERROR("http_backend: failed to copy %zu-byte response", buffer.size);
            rc = 1;
         }
         break;
      case CURLE_OPERATION_TIMEDOUT:
         response->transport = SYNTH_TRANSPORT_TIMEOUT;
         snprintf(response->detail, sizeof(response->detail), "timed out after %lds", timeout);
         break;
      case CURLE_ABORTED_BY_CALLBACK:
         response->transport = SYNTH_TRANSPORT_CANCELLED;
         safe_strncpy(response->detail, "cancelled", sizeof(response->detail));
         break;
      default:
         response->transport = SYNTH_TRANSPORT_NETWORK;
         if (buffer.overflow) {
            snprintf(response->detail, sizeof(response->detail),
                     "response exceeds %d bytes", backend->config.max_response_bytes);
         } else {
            safe_strncpy(response->detail, errbuf[0] ? errbuf : curl_easy_strerror(res),
                         sizeof(response->detail));
         }
         break;
   }

   curl_buffer_free(&buffer);
   free(url);
   curl_easy_cleanup(curl);
   return rc;
}

extern "C" {

char *http_backend_build_url(CURL *curl,
                             const backend_config_t *config,
                             const char *text,
                             const char *lang) {
   if (!curl || !config || !text || !lang)
      return NULL;

   char *q = curl_easy_escape(curl, text, 0);
   char *tl = curl_easy_escape(curl, lang, 0);
   char *client = curl_easy_escape(curl, config->client, 0);
   if (!q || !tl || !client) {
      curl_free(q);
      curl_free(tl);
      curl_free(client);
      return NULL;
   }

   const char *sep = strchr(config->endpoint, '?') ? "&" : "?";
   size_t len = strlen(config->endpoint) + strlen(q) + strlen(tl) + strlen(client) + 64;
   char *url = (char *)malloc(len);
   if (url) {
      snprintf(url, len, "%s%sie=UTF-8&client=%s&tl=%s&q=%s", config->endpoint, sep, client, tl,
               q);
   }

   curl_free(q);
   curl_free(tl);
   curl_free(client);
   return url;
}

http_backend_t *http_backend_create(const backend_config_t *config) {
   if (!config || config->endpoint[0] == '\0' || config->max_response_bytes <= 0) {
      LOG_ERROR("http_backend_create: invalid backend configuration");
      return NULL;
   }

   http_backend_t *backend = new (std::nothrow) http_backend_t();
   if (!backend) {
      LOG_ERROR("http_backend_create: failed to allocate backend");
      return NULL;
   }
   backend->config = *config;

   LOG_INFO("HTTP backend: %s (client=%s)", backend->config.endpoint, backend->config.client);
   return backend;
}

void http_backend_free(http_backend_t *backend) {
   delete backend;
}

synth_backend_t http_backend_as_synth_backend(http_backend_t *backend) {
   synth_backend_t handle;
   handle.fetch = http_backend_fetch;
   handle.userdata = backend;
   handle.name = "http";
   return handle;
}

} /* extern "C" */
