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
 * @file text_chunker.cpp
 * @brief Greedy sentence/word/character segmentation
 *
 * Lengths are tracked incrementally in code points so packing is linear in
 * the input size. The separator between two packed units is a single space
 * and is only counted when the buffer already holds text.
 *
 * @see text_chunker.h for the public API
 */

#include "tts/text_chunker.h"

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <new>

#include "logging_common.h"
#include "utils/utf8_utils.h"

namespace {

/**
 * @brief Running segment buffer with its length in code points
 */
struct SegmentBuffer {
   std::string text;
   size_t chars = 0;

   bool empty() const { return chars == 0; }

   /* Length after appending a unit of unit_chars code points */
   size_t length_with(size_t unit_chars) const {
      return chars + (chars ? 1 : 0) + unit_chars;
   }

   void append(const std::string &unit, size_t unit_chars) {
      if (chars) {
         text.push_back(' ');
         chars++;
      }
      text += unit;
      chars += unit_chars;
   }

   void flush_into(std::vector<std::string> &segments) {
      if (chars) {
         segments.push_back(text);
      }
      text.clear();
      chars = 0;
   }
};

std::vector<unsigned int> parse_boundaries(const std::string &boundaries) {
   std::vector<unsigned int> set;
   size_t pos = 0;
   unsigned int cp;
   while (pos < boundaries.size()) {
      pos += utf8_decode(boundaries.data() + pos, boundaries.size() - pos, &cp);
      set.push_back(cp);
   }
   return set;
}

/* Sentence candidates with the boundary characters removed, trimmed, non-empty */
std::vector<std::string> split_sentences(const std::string &text,
                                         const std::vector<unsigned int> &boundaries) {
   std::vector<std::string> sentences;
   size_t start = 0;
   size_t pos = 0;
   unsigned int cp;

   while (pos < text.size()) {
      size_t used = utf8_decode(text.data() + pos, text.size() - pos, &cp);
      if (std::find(boundaries.begin(), boundaries.end(), cp) != boundaries.end()) {
         std::string sentence = utf8_trim(text.substr(start, pos - start));
         if (!sentence.empty()) {
            sentences.push_back(sentence);
         }
         start = pos + used;
      }
      pos += used;
   }

   std::string tail = utf8_trim(text.substr(start));
   if (!tail.empty()) {
      sentences.push_back(tail);
   }
   return sentences;
}

/* Whitespace-separated words */
std::vector<std::string> split_words(const std::string &sentence) {
   std::vector<std::string> words;
   std::string current;
   size_t pos = 0;
   unsigned int cp;

   while (pos < sentence.size()) {
      size_t used = utf8_decode(sentence.data() + pos, sentence.size() - pos, &cp);
      if (utf8_is_whitespace(cp)) {
         if (!current.empty()) {
            words.push_back(current);
            current.clear();
         }
      } else {
         current.append(sentence, pos, used);
      }
      pos += used;
   }
   if (!current.empty()) {
      words.push_back(current);
   }
   return words;
}

/**
 * @brief Pack an oversized sentence word by word
 *
 * Completed segments go to segments; the partially filled word buffer is
 * handed back through buffer so following sentences can continue it.
 */
void pack_words(const std::string &sentence,
                size_t max_chars,
                SegmentBuffer &buffer,
                std::vector<std::string> &segments) {
   for (const std::string &word : split_words(sentence)) {
      size_t word_chars = utf8_length(word);

      if (word_chars > max_chars) {
         buffer.flush_into(segments);
         VAANI_LOG_WARNING("text_chunker: truncating %zu-char word to %zu chars", word_chars,
                           max_chars);
         segments.push_back(utf8_truncate(word, max_chars));
         continue;
      }

      if (buffer.length_with(word_chars) > max_chars) {
         buffer.flush_into(segments);
      }
      buffer.append(word, word_chars);
   }
}

}  // namespace

std::vector<std::string> text_chunker_split(const std::string &text,
                                            size_t max_chars,
                                            const std::string &boundaries) {
   std::vector<std::string> segments;
   if (max_chars == 0 || utf8_trim(text).empty()) {
      return segments;
   }

   if (utf8_length(text) <= max_chars) {
      segments.push_back(text);
      return segments;
   }

   std::vector<unsigned int> boundary_set = parse_boundaries(boundaries);
   SegmentBuffer buffer;

   for (const std::string &sentence : split_sentences(text, boundary_set)) {
      size_t sentence_chars = utf8_length(sentence);

      if (buffer.length_with(sentence_chars) <= max_chars) {
         buffer.append(sentence, sentence_chars);
         continue;
      }

      buffer.flush_into(segments);
      if (sentence_chars <= max_chars) {
         buffer.append(sentence, sentence_chars);
      } else {
         pack_words(sentence, max_chars, buffer, segments);
      }
   }
   buffer.flush_into(segments);

   segments.erase(std::remove_if(segments.begin(), segments.end(),
                                 [](const std::string &s) { return utf8_trim(s).empty(); }),
                  segments.end());

   if (segments.empty()) {
      std::string fallback = utf8_trim(utf8_truncate(utf8_trim(text), max_chars));
      VAANI_LOG_WARNING("text_chunker: no segments produced, using %zu-char prefix",
                        utf8_length(fallback));
      if (!fallback.empty()) {
         segments.push_back(fallback);
      }
   }

   return segments;
}

extern "C" {

int text_chunker_split_c(const char *text,
                         size_t max_chars,
                         const char *boundaries,
                         segment_list_t *out) {
   if (!text || !out || max_chars == 0) {
      VAANI_LOG_ERROR("text_chunker_split_c: invalid parameters");
      return CHUNKER_ERR_INVALID_PARAM;
   }

   out->items = NULL;
   out->count = 0;

   try {
      std::vector<std::string> segments = text_chunker_split(
          std::string(text), max_chars,
          std::string(boundaries ? boundaries : TEXT_CHUNKER_DEFAULT_BOUNDARIES));
      if (segments.empty()) {
         return CHUNKER_SUCCESS;
      }

      out->items = (char **)calloc(segments.size(), sizeof(char *));
      if (!out->items) {
         return CHUNKER_ERR_OUT_OF_MEMORY;
      }
      for (size_t i = 0; i < segments.size(); i++) {
         out->items[i] = strdup(segments[i].c_str());
         if (!out->items[i]) {
            out->count = i;
            segment_list_free(out);
            return CHUNKER_ERR_OUT_OF_MEMORY;
         }
      }
      out->count = segments.size();
      return CHUNKER_SUCCESS;

   } catch (const std::bad_alloc &) {
      VAANI_LOG_ERROR("text_chunker_split_c: out of memory");
      segment_list_free(out);
      return CHUNKER_ERR_OUT_OF_MEMORY;
   }
}

void segment_list_free(segment_list_t *list) {
   if (!list)
      return;

   for (size_t i = 0; i < list->count; i++) {
      free(list->items[i]);
   }
   free(list->items);
   list->items = NULL;
   list->count = 0;
}

} /* extern "C" */
