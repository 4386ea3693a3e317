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
 * @file lang_detect.cpp
 * @brief Devanagari/Latin script scan
 */

#include "tts/lang_detect.h"

#include <string.h>

#include "logging_common.h"
#include "utils/utf8_utils.h"

extern "C" {

lang_tag_t lang_detect_n(const char *text, size_t len) {
   if (!text || len == 0) {
      return LANG_TAG_EN;
   }

   bool has_latin = false;
   size_t pos = 0;
   unsigned int cp;
   while (pos < len) {
      pos += utf8_decode(text + pos, len - pos, &cp);
      if (cp >= LANG_DEVANAGARI_FIRST && cp <= LANG_DEVANAGARI_LAST) {
         return LANG_TAG_HI;
      }
      if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z')) {
         has_latin = true;
      }
   }

   // No Devanagari: Latin text and letterless text both default to English
   if (!has_latin) {
      VAANI_LOG_INFO("lang_detect: no letters found, defaulting to %s",
                     lang_tag_code(LANG_TAG_EN));
   }
   return LANG_TAG_EN;
}

lang_tag_t lang_detect(const char *text) {
   return text ? lang_detect_n(text, strlen(text)) : LANG_TAG_EN;
}

const char *lang_tag_code(lang_tag_t tag) {
   switch (tag) {
      case LANG_TAG_HI:
         return "hi";
      case LANG_TAG_EN:
      default:
         return "en";
   }
}

bool lang_tag_from_code(const char *code, lang_tag_t *tag_out) {
   if (!code || !tag_out)
      return false;

   if (strcmp(code, "en") == 0) {
      *tag_out = LANG_TAG_EN;
      return true;
   }
   if (strcmp(code, "hi") == 0) {
      *tag_out = LANG_TAG_HI;
      return true;
   }
   return false;
}

} /* extern "C" */
