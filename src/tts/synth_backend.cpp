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
 * @file synth_backend.cpp
 * @brief synth_response_t lifecycle helpers
 */

#include "tts/synth_backend.h"

#include <stdlib.h>
#include <string.h>

extern "C" {

void synth_response_init(synth_response_t *response) {
   if (!response)
      return;
   response->transport = SYNTH_TRANSPORT_OK;
   response->http_status = 0;
   response->body = NULL;
   response->body_size = 0;
   response->detail[0] = '\0';
}

void synth_response_free(synth_response_t *response) {
   if (!response)
      return;
   free(response->body);
   response->body = NULL;
   response->body_size = 0;
}

int synth_response_set_body(synth_response_t *response, const void *data, size_t size) {
   if (!response)
      return 1;

   free(response->body);
   response->body = NULL;
   response->body_size = 0;
   if (size == 0)
      return 0;

   response->body = (uint8_t *)malloc(size);
   if (!response->body)
      return 1;
   memcpy(response->body, data, size);
   response->body_size = size;
   return 0;
}

uint8_t *synth_response_take_body(synth_response_t *response, size_t *size_out) {
   if (!response) {
      if (size_out)
         *size_out = 0;
      return NULL;
   }

   uint8_t *body = response->body;
   if (size_out)
      *size_out = response->body_size;
   response->body = NULL;
   response->body_size = 0;
   return body;
}

} /* extern "C" */
