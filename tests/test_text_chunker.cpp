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

#include <gtest/gtest.h>

#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "tts/text_chunker.h"
#include "utils/utf8_utils.h"

namespace {

std::vector<std::string> words_of(const std::string &text) {
   std::vector<std::string> words;
   std::istringstream in(text);
   std::string word;
   while (in >> word) {
      words.push_back(word);
   }
   return words;
}

/* Words with ASCII sentence punctuation treated as whitespace */
std::vector<std::string> words_without_boundaries(std::string text) {
   for (char &c : text) {
      if (c == '.' || c == '!' || c == '?')
         c = ' ';
   }
   return words_of(text);
}

std::string random_prose(std::mt19937 &rng, size_t words) {
   static const char *vocab[] = { "the", "quick", "brown", "fox", "jumps", "over", "a",
                                  "lazy", "dog", "synthesis", "segment", "of", "speech",
                                  "मैं", "घर", "जा", "रहा", "हूँ" };
   static const char *ends[] = { ".", "!", "?", "\xE0\xA5\xA4", "", "", "" };
   std::uniform_int_distribution<size_t> pick(0, sizeof(vocab) / sizeof(vocab[0]) - 1);
   std::uniform_int_distribution<size_t> end(0, sizeof(ends) / sizeof(ends[0]) - 1);

   std::string out;
   for (size_t i = 0; i < words; i++) {
      if (!out.empty())
         out += ' ';
      out += vocab[pick(rng)];
      out += ends[end(rng)];
   }
   return out;
}

}  // namespace

TEST(TextChunkerTest, EmptyInputYieldsNoSegments) {
   EXPECT_TRUE(text_chunker_split("", 190).empty());
   EXPECT_TRUE(text_chunker_split("   \t ", 190).empty());
}

TEST(TextChunkerTest, ZeroCapYieldsNoSegments) {
   EXPECT_TRUE(text_chunker_split("Hello world.", 0).empty());
}

TEST(TextChunkerTest, ShortTextIsSingleUnchangedSegment) {
   std::vector<std::string> segments = text_chunker_split("Hello world.", 190);
   ASSERT_EQ(segments.size(), 1u);
   EXPECT_EQ(segments[0], "Hello world.");
}

TEST(TextChunkerTest, TextExactlyAtCapIsSingleSegment) {
   std::string text(20, 'a');
   std::vector<std::string> segments = text_chunker_split(text, 20);
   ASSERT_EQ(segments.size(), 1u);
   EXPECT_EQ(segments[0], text);
}

TEST(TextChunkerTest, PacksSentencesGreedily) {
   std::vector<std::string> segments =
       text_chunker_split("One two. Three four. Five six. Seven.", 20);
   ASSERT_EQ(segments.size(), 2u);
   EXPECT_EQ(segments[0], "One two Three four");
   EXPECT_EQ(segments[1], "Five six Seven");
}

TEST(TextChunkerTest, SplitsOnDevanagariDanda) {
   std::string text = "मैं घर जा रहा हूँ। तुम कहाँ जा रहे हो। हम सब साथ चलेंगे।";
   std::vector<std::string> segments = text_chunker_split(text, 20);
   ASSERT_GE(segments.size(), 2u);
   for (const std::string &s : segments) {
      EXPECT_LE(utf8_length(s), 20u) << s;
      EXPECT_EQ(s.find("\xE0\xA5\xA4"), std::string::npos) << s;
   }
   EXPECT_EQ(segments[0], "मैं घर जा रहा हूँ");
}

TEST(TextChunkerTest, LongSentenceFallsBackToWords) {
   std::string text = "alpha beta gamma delta epsilon zeta eta theta iota kappa";
   std::vector<std::string> segments = text_chunker_split(text, 16);
   ASSERT_GE(segments.size(), 2u);
   for (const std::string &s : segments) {
      EXPECT_LE(utf8_length(s), 16u) << s;
   }
   std::string joined;
   for (const std::string &s : segments)
      joined += s + " ";
   EXPECT_EQ(words_of(text), words_of(joined));
}

TEST(TextChunkerTest, OverlongWordIsTruncatedIntoItsOwnSegment) {
   std::string word(50, 'x');
   std::vector<std::string> segments = text_chunker_split("short " + word + " tail", 10);
   ASSERT_EQ(segments.size(), 3u);
   EXPECT_EQ(segments[0], "short");
   EXPECT_EQ(segments[1], std::string(10, 'x'));
   EXPECT_EQ(segments[2], "tail");
}

TEST(TextChunkerTest, TruncationCountsCodePointsNotBytes) {
   std::string word;
   for (int i = 0; i < 30; i++)
      word += "क";
   std::vector<std::string> segments = text_chunker_split(word + " " + word, 12);
   ASSERT_EQ(segments.size(), 2u);
   for (const std::string &s : segments) {
      EXPECT_EQ(utf8_length(s), 12u);
      EXPECT_TRUE(utf8_is_valid(s.data(), s.size()));
   }
}

TEST(TextChunkerTest, OnlyBoundariesFallsBackToPrefix) {
   std::string text(30, '.');
   std::vector<std::string> segments = text_chunker_split(text, 10);
   ASSERT_EQ(segments.size(), 1u);
   EXPECT_EQ(segments[0], std::string(10, '.'));
}

TEST(TextChunkerTest, CustomBoundaries) {
   std::vector<std::string> segments = text_chunker_split("uno; dos; tres; cuatro", 10, ";");
   ASSERT_EQ(segments.size(), 3u);
   EXPECT_EQ(segments[0], "uno dos");
   EXPECT_EQ(segments[1], "tres");
   EXPECT_EQ(segments[2], "cuatro");
}

TEST(TextChunkerTest, RandomTextRespectsCapAndWordOrder) {
   std::mt19937 rng(1234);
   for (int round = 0; round < 200; round++) {
      std::string text = random_prose(rng, 5 + round % 120);
      size_t cap = 10 + static_cast<size_t>(round % 60);

      std::vector<std::string> segments = text_chunker_split(text, cap);
      ASSERT_FALSE(segments.empty()) << text;

      std::string joined;
      for (const std::string &s : segments) {
         ASSERT_LE(utf8_length(s), cap) << "cap " << cap << " in: " << text;
         ASSERT_FALSE(utf8_trim(s).empty());
         joined += s + " ";
      }

      if (utf8_length(text) > cap) {
         std::string stripped = text;
         std::string danda = "\xE0\xA5\xA4";
         for (size_t p = stripped.find(danda); p != std::string::npos; p = stripped.find(danda))
            stripped.replace(p, danda.size(), " ");
         EXPECT_EQ(words_without_boundaries(stripped), words_of(joined)) << text;
      }
   }
}

TEST(TextChunkerCApiTest, ReturnsOwnedList) {
   segment_list_t list = { NULL, 0 };
   ASSERT_EQ(text_chunker_split_c("First. Second. Third.", 8, NULL, &list), CHUNKER_SUCCESS);
   ASSERT_EQ(list.count, 3u);
   EXPECT_STREQ(list.items[0], "First");
   EXPECT_STREQ(list.items[2], "Third");
   segment_list_free(&list);
   EXPECT_EQ(list.items, nullptr);
   EXPECT_EQ(list.count, 0u);
}

TEST(TextChunkerCApiTest, RejectsInvalidParameters) {
   segment_list_t list = { NULL, 0 };
   EXPECT_EQ(text_chunker_split_c(NULL, 10, NULL, &list), CHUNKER_ERR_INVALID_PARAM);
   EXPECT_EQ(text_chunker_split_c("text", 0, NULL, &list), CHUNKER_ERR_INVALID_PARAM);
   EXPECT_EQ(text_chunker_split_c("text", 10, NULL, NULL), CHUNKER_ERR_INVALID_PARAM);
}
