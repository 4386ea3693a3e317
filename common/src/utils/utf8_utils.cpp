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
 * @file utf8_utils.cpp
 * @brief UTF-8 decoding, counting and whitespace normalization
 */

#include "utils/utf8_utils.h"

#include <cstdint>

// ============================================================================
// Internal helpers
// ============================================================================

/**
 * @brief Check if a byte is a valid UTF-8 continuation byte (10xxxxxx)
 */
static inline bool is_utf8_continuation(unsigned char byte) {
   return (byte & 0xC0) == 0x80;
}

/**
 * @brief Expected sequence length from the lead byte, 0 if the byte cannot lead
 */
static inline size_t utf8_lead_length(unsigned char lead) {
   if (lead < 0x80)
      return 1;
   if (lead < 0xC2)
      return 0;  // Continuation byte or overlong 2-byte lead
   if (lead < 0xE0)
      return 2;
   if (lead < 0xF0)
      return 3;
   if (lead < 0xF5)
      return 4;
   return 0;
}

// ============================================================================
// C-compatible API
// ============================================================================

extern "C" {

void safe_strncpy(char *dest, const char *src, size_t size) {
   if (!dest || size == 0) {
      return;
   }
   if (!src) {
      dest[0] = '\0';
      return;
   }
   size_t len = strlen(src);
   if (len >= size) {
      len = size - 1;
      // Back off to a code point boundary
      while (len > 0 && is_utf8_continuation((unsigned char)src[len])) {
         len--;
      }
   }
   memcpy(dest, src, len);
   dest[len] = '\0';
}

size_t utf8_decode(const char *s, size_t len, unsigned int *cp_out) {
   const unsigned char *p = reinterpret_cast<const unsigned char *>(s);
   size_t need = utf8_lead_length(p[0]);

   if (need == 0 || need > len) {
      *cp_out = UTF8_REPLACEMENT_CHAR;
      return 1;
   }
   if (need == 1) {
      *cp_out = p[0];
      return 1;
   }

   for (size_t i = 1; i < need; i++) {
      if (!is_utf8_continuation(p[i])) {
         *cp_out = UTF8_REPLACEMENT_CHAR;
         return 1;
      }
   }

   unsigned int cp;
   if (need == 2) {
      cp = ((p[0] & 0x1F) << 6) | (p[1] & 0x3F);
   } else if (need == 3) {
      cp = ((p[0] & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
      if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) {
         *cp_out = UTF8_REPLACEMENT_CHAR;
         return 1;
      }
   } else {
      cp = ((p[0] & 0x07) << 18) | ((p[1] & 0x3F) << 12) | ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
      if (cp < 0x10000 || cp > 0x10FFFF) {
         *cp_out = UTF8_REPLACEMENT_CHAR;
         return 1;
      }
   }

   *cp_out = cp;
   return need;
}

size_t utf8_codepoint_count(const char *str) {
   if (!str)
      return 0;

   size_t len = strlen(str);
   size_t pos = 0;
   size_t count = 0;
   unsigned int cp;
   while (pos < len) {
      pos += utf8_decode(str + pos, len - pos, &cp);
      count++;
   }
   return count;
}

size_t utf8_prefix_bytes(const char *str, size_t max_codepoints) {
   if (!str)
      return 0;

   size_t len = strlen(str);
   size_t pos = 0;
   size_t count = 0;
   unsigned int cp;
   while (pos < len && count < max_codepoints) {
      pos += utf8_decode(str + pos, len - pos, &cp);
      count++;
   }
   return pos;
}

bool utf8_is_whitespace(unsigned int cp) {
   return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) ||  // \t \n \v \f \r
          cp == 0x85 || cp == 0xA0 ||                  // NEL, no-break space
          cp == 0x1680 ||                              // Ogham space mark
          (cp >= 0x2000 && cp <= 0x200A) ||            // En quad .. hair space
          cp == 0x2028 || cp == 0x2029 ||              // Line/paragraph separator
          cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool utf8_is_valid(const char *s, size_t len) {
   if (!s)
      return false;

   size_t pos = 0;
   unsigned int cp;
   while (pos < len) {
      size_t used = utf8_decode(s + pos, len - pos, &cp);
      // A genuine U+FFFD is three bytes; a one-byte replacement means malformed input
      if (cp == UTF8_REPLACEMENT_CHAR && used == 1) {
         return false;
      }
      pos += used;
   }
   return true;
}

} /* extern "C" */

// ============================================================================
// C++ API
// ============================================================================

size_t utf8_length(const std::string &s) {
   size_t pos = 0;
   size_t count = 0;
   unsigned int cp;
   while (pos < s.size()) {
      pos += utf8_decode(s.data() + pos, s.size() - pos, &cp);
      count++;
   }
   return count;
}

std::string utf8_trim(const std::string &s) {
   size_t pos = 0;
   size_t first = std::string::npos;
   size_t last_end = 0;
   unsigned int cp;

   while (pos < s.size()) {
      size_t used = utf8_decode(s.data() + pos, s.size() - pos, &cp);
      if (!utf8_is_whitespace(cp)) {
         if (first == std::string::npos)
            first = pos;
         last_end = pos + used;
      }
      pos += used;
   }

   if (first == std::string::npos)
      return std::string();
   return s.substr(first, last_end - first);
}

std::string utf8_normalize_whitespace(const std::string &s) {
   std::string out;
   out.reserve(s.size());

   size_t pos = 0;
   bool pending_space = false;
   unsigned int cp;
   while (pos < s.size()) {
      size_t used = utf8_decode(s.data() + pos, s.size() - pos, &cp);
      if (utf8_is_whitespace(cp)) {
         pending_space = !out.empty();
      } else {
         if (pending_space) {
            out.push_back(' ');
            pending_space = false;
         }
         out.append(s, pos, used);
      }
      pos += used;
   }
   return out;
}

std::string utf8_truncate(const std::string &s, size_t max_codepoints) {
   size_t pos = 0;
   size_t count = 0;
   unsigned int cp;
   while (pos < s.size() && count < max_codepoints) {
      pos += utf8_decode(s.data() + pos, s.size() - pos, &cp);
      count++;
   }
   return s.substr(0, pos);
}
