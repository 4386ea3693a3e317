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
 * Shared CURL buffer utilities for binary HTTP response bodies
 */

#ifndef CURL_BUFFER_H
#define CURL_BUFFER_H

#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// Buffer capacity constants
#define CURL_BUFFER_INITIAL_CAPACITY 16384

/**
 * Buffer structure for accumulating CURL response data
 * Initialize with curl_buffer_init(&buf, max_size);
 */
typedef struct {
   uint8_t *data;   // Response bytes (not null-terminated; may contain NULs)
   size_t size;     // Bytes received so far
   size_t capacity; // Allocated capacity
   size_t max_size; // Hard cap on size; exceeding it aborts the transfer
   int overflow;    // Set when the cap was hit
} curl_buffer_t;

/**
 * CURL write callback with exponential buffer growth
 *
 * Usage:
 *   curl_buffer_t buffer;
 *   curl_buffer_init(&buffer, 4 * 1024 * 1024);
 *   curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_buffer_write_callback);
 *   curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
 *   // ... perform request ...
 *   curl_buffer_free(&buffer);
 *
 * @param contents Data received from CURL
 * @param size Size of each element
 * @param nmemb Number of elements
 * @param userp Pointer to curl_buffer_t
 * @return Number of bytes handled, or 0 to abort (cap exceeded or allocation failure)
 */
static inline size_t curl_buffer_write_callback(void *contents,
                                                size_t size,
                                                size_t nmemb,
                                                void *userp) {
   size_t total_size = size * nmemb;
   curl_buffer_t *buf = (curl_buffer_t *)userp;

   size_t required = buf->size + total_size;
   if (required > buf->max_size) {
      buf->overflow = 1;
      return 0;  // Signal error to CURL
   }

   if (required > buf->capacity) {
      // Exponential growth to reduce reallocations
      size_t new_capacity = buf->capacity ? buf->capacity : CURL_BUFFER_INITIAL_CAPACITY;
      while (new_capacity < required && new_capacity <= buf->max_size / 2) {
         new_capacity *= 2;
      }
      if (new_capacity < required) {
         new_capacity = buf->max_size;
      }

      uint8_t *new_data = (uint8_t *)realloc(buf->data, new_capacity);
      if (!new_data) {
         return 0;
      }
      buf->data = new_data;
      buf->capacity = new_capacity;
   }

   memcpy(buf->data + buf->size, contents, total_size);
   buf->size += total_size;

   return total_size;
}

/**
 * Initialize a curl buffer
 * @param buf Buffer to initialize
 * @param max_size Largest body accepted
 */
static inline void curl_buffer_init(curl_buffer_t *buf, size_t max_size) {
   buf->data = NULL;
   buf->size = 0;
   buf->capacity = 0;
   buf->max_size = max_size;
   buf->overflow = 0;
}

/**
 * Free a curl buffer's data
 * @param buf Buffer to free
 */
static inline void curl_buffer_free(curl_buffer_t *buf) {
   if (buf->data) {
      free(buf->data);
      buf->data = NULL;
   }
   buf->size = 0;
   buf->capacity = 0;
}

#endif  // CURL_BUFFER_H
