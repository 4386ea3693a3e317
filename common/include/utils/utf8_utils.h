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
 * UTF-8 Utilities - code point decoding, counting and whitespace handling
 *
 * Lengths throughout vaani are measured in Unicode code points, never bytes,
 * so that Devanagari text is capped the same way as Latin text. Malformed
 * sequences are never rejected: each invalid byte counts as one code point
 * (decoded as U+FFFD) so every function here is total over arbitrary bytes.
 */

#ifndef VAANI_COMMON_UTF8_UTILS_H
#define VAANI_COMMON_UTF8_UTILS_H

#include <stdbool.h>
#include <stddef.h>
#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Replacement code point returned for malformed sequences */
#define UTF8_REPLACEMENT_CHAR 0xFFFD

/**
 * @brief Safe string copy with guaranteed null-termination
 *
 * Never splits a multi-byte UTF-8 sequence when truncating.
 *
 * @param dest Destination buffer
 * @param src Source string (must be null-terminated)
 * @param size Size of destination buffer
 */
void safe_strncpy(char *dest, const char *src, size_t size);

/**
 * @brief Decode one code point from a UTF-8 byte sequence
 *
 * @param s Pointer to the sequence
 * @param len Bytes available at s (must be > 0)
 * @param cp_out Receives the code point (UTF8_REPLACEMENT_CHAR if malformed)
 * @return Number of bytes consumed (1-4, always at least 1)
 */
size_t utf8_decode(const char *s, size_t len, unsigned int *cp_out);

/**
 * @brief Count code points in a null-terminated UTF-8 string
 */
size_t utf8_codepoint_count(const char *str);

/**
 * @brief Byte length of the first max_codepoints code points of str
 *
 * @param str Null-terminated UTF-8 string
 * @param max_codepoints Number of code points to keep
 * @return Byte offset of the cut (never inside a multi-byte sequence)
 */
size_t utf8_prefix_bytes(const char *str, size_t max_codepoints);

/**
 * @brief Check whether a code point is whitespace (ASCII and common Unicode spaces)
 */
bool utf8_is_whitespace(unsigned int cp);

/**
 * @brief Check whether the bytes form well-formed UTF-8 (no overlongs or surrogates)
 */
bool utf8_is_valid(const char *s, size_t len);

#ifdef __cplusplus
}

// C++ only: std::string helpers used by the chunker and orchestrator
#include <string>

/** @brief Number of code points in s */
size_t utf8_length(const std::string &s);

/** @brief Strip leading and trailing whitespace */
std::string utf8_trim(const std::string &s);

/** @brief Trim and collapse every internal whitespace run to a single ASCII space */
std::string utf8_normalize_whitespace(const std::string &s);

/** @brief First max_codepoints code points of s */
std::string utf8_truncate(const std::string &s, size_t max_codepoints);

#endif  // __cplusplus

#endif /* VAANI_COMMON_UTF8_UTILS_H */
