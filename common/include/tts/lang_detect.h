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
 * @file lang_detect.h
 * @brief Script-based language tagging for synthesis locale selection
 *
 * Classifies text into the coarse language tag used to pick the remote
 * voice. Devanagari script (U+0900-U+097F) maps to Hindi, which is also the
 * closest supported locale for Nepali and Marathi text. Everything else,
 * including text with no letters at all, maps to English.
 *
 * Detection is total: any byte sequence yields a tag.
 */

#ifndef VAANI_COMMON_LANG_DETECT_H
#define VAANI_COMMON_LANG_DETECT_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Supported language tags */
typedef enum {
   LANG_TAG_EN = 0, /**< English (default) */
   LANG_TAG_HI = 1, /**< Hindi, used for all Devanagari-script text */
} lang_tag_t;

#define LANG_DEVANAGARI_FIRST 0x0900
#define LANG_DEVANAGARI_LAST 0x097F

/**
 * @brief Detect the language tag of a UTF-8 string
 *
 * @param text Null-terminated text (NULL yields LANG_TAG_EN)
 * @return LANG_TAG_HI if any Devanagari code point is present, else LANG_TAG_EN
 */
lang_tag_t lang_detect(const char *text);

/**
 * @brief Detect the language tag of a byte range (may contain NUL bytes)
 */
lang_tag_t lang_detect_n(const char *text, size_t len);

/**
 * @brief Short code sent to the synthesis backend ("en", "hi")
 */
const char *lang_tag_code(lang_tag_t tag);

/**
 * @brief Parse a short code back into a tag
 *
 * @return true if code names a supported tag
 */
bool lang_tag_from_code(const char *code, lang_tag_t *tag_out);

#ifdef __cplusplus
}
#endif

#endif /* VAANI_COMMON_LANG_DETECT_H */
