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
 * @file text_chunker.h
 * @brief Boundary-respecting text segmentation for request-sized synthesis
 *
 * Splits normalized text into ordered segments of at most max_chars code
 * points each, for backends that cap the length of a single request.
 *
 * **Algorithm (greedy cascade):**
 * 1. Short text (<= max_chars) is returned unchanged as one segment.
 * 2. Text is split into sentences on the boundary characters, which are
 *    dropped; sentences are trimmed and empty ones discarded.
 * 3. Sentences are packed into segments joined by single spaces.
 * 4. A sentence that cannot fit on its own is packed word by word.
 * 5. A single word longer than max_chars is hard-truncated.
 * 6. If nothing survives, the first max_chars code points are used.
 *
 * Every returned segment is non-empty and at most max_chars code points.
 *
 * @note C code should use text_chunker_split_c() and segment_list_free().
 * @note C++ code can use text_chunker_split() directly.
 */

#ifndef VAANI_COMMON_TEXT_CHUNKER_H
#define VAANI_COMMON_TEXT_CHUNKER_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Default segment cap in code points */
#define TEXT_CHUNKER_DEFAULT_MAX_CHARS 190

/** @brief Default sentence boundaries: . ! ? and the Devanagari danda (U+0964) */
#define TEXT_CHUNKER_DEFAULT_BOUNDARIES ".!?\xE0\xA5\xA4"

/** @brief Return codes for chunker operations */
#define CHUNKER_SUCCESS 0
#define CHUNKER_ERR_INVALID_PARAM 1
#define CHUNKER_ERR_OUT_OF_MEMORY 2

/**
 * @brief Ordered list of segments (each a null-terminated UTF-8 string)
 *
 * Initialize with: segment_list_t list = {NULL, 0};
 */
typedef struct {
   char **items;
   size_t count;
} segment_list_t;

/**
 * @brief Split text into segments (C-compatible wrapper)
 *
 * @param text Normalized input text (trimmed, single-spaced)
 * @param max_chars Maximum segment length in code points (must be > 0)
 * @param boundaries UTF-8 string of sentence boundary characters, or NULL
 *                   for TEXT_CHUNKER_DEFAULT_BOUNDARIES
 * @param out Receives the allocated segment list (caller frees with segment_list_free)
 * @return CHUNKER_SUCCESS, CHUNKER_ERR_INVALID_PARAM or CHUNKER_ERR_OUT_OF_MEMORY
 */
int text_chunker_split_c(const char *text,
                         size_t max_chars,
                         const char *boundaries,
                         segment_list_t *out);

/**
 * @brief Free a segment list produced by text_chunker_split_c()
 *
 * @param list List to free (can be NULL); reset to empty afterwards
 */
void segment_list_free(segment_list_t *list);

#ifdef __cplusplus
}

// C++ only: std::string-based segmentation
#include <string>
#include <vector>

/**
 * @brief Split text into segments of at most max_chars code points
 *
 * @param text Normalized input text
 * @param max_chars Maximum segment length in code points (0 yields no segments)
 * @param boundaries UTF-8 string of sentence boundary characters
 * @return Ordered segments; empty for empty input
 */
std::vector<std::string> text_chunker_split(
    const std::string &text,
    size_t max_chars,
    const std::string &boundaries = TEXT_CHUNKER_DEFAULT_BOUNDARIES);

#endif  // __cplusplus

#endif /* VAANI_COMMON_TEXT_CHUNKER_H */
