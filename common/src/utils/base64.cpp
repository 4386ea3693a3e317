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
 * @file base64.cpp
 * @brief Standard padded base64 encoder
 */

#include "utils/base64.h"

#include <stdlib.h>

static const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

extern "C" {

size_t base64_encoded_size(size_t len) {
   return ((len + 2) / 3) * 4;
}

char *base64_encode(const uint8_t *data, size_t len, size_t *out_len) {
   size_t encoded = base64_encoded_size(len);
   char *out = (char *)malloc(encoded + 1);
   if (!out) {
      return NULL;
   }

   size_t i = 0;
   size_t o = 0;
   while (i + 2 < len) {
      uint32_t triple = ((uint32_t)data[i] << 16) | ((uint32_t)data[i + 1] << 8) | data[i + 2];
      out[o++] = BASE64_ALPHABET[(triple >> 18) & 0x3F];
      out[o++] = BASE64_ALPHABET[(triple >> 12) & 0x3F];
      out[o++] = BASE64_ALPHABET[(triple >> 6) & 0x3F];
      out[o++] = BASE64_ALPHABET[triple & 0x3F];
      i += 3;
   }

   size_t rest = len - i;
   if (rest == 1) {
      uint32_t triple = (uint32_t)data[i] << 16;
      out[o++] = BASE64_ALPHABET[(triple >> 18) & 0x3F];
      out[o++] = BASE64_ALPHABET[(triple >> 12) & 0x3F];
      out[o++] = '=';
      out[o++] = '=';
   } else if (rest == 2) {
      uint32_t triple = ((uint32_t)data[i] << 16) | ((uint32_t)data[i + 1] << 8);
      out[o++] = BASE64_ALPHABET[(triple >> 18) & 0x3F];
      out[o++] = BASE64_ALPHABET[(triple >> 12) & 0x3F];
      out[o++] = BASE64_ALPHABET[(triple >> 6) & 0x3F];
      out[o++] = '=';
   }

   out[o] = '\0';
   if (out_len) {
      *out_len = o;
   }
   return out;
}

} /* extern "C" */
