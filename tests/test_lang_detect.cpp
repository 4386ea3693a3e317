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
#include <string>

#include "tts/lang_detect.h"

TEST(LangDetectTest, LatinTextIsEnglish) {
   EXPECT_EQ(lang_detect("Hello world."), LANG_TAG_EN);
}

TEST(LangDetectTest, DevanagariTextIsHindi) {
   EXPECT_EQ(lang_detect("नमस्ते दुनिया"), LANG_TAG_HI);
}

TEST(LangDetectTest, AnyDevanagariWins) {
   EXPECT_EQ(lang_detect("Order number 42 for राम"), LANG_TAG_HI);
}

TEST(LangDetectTest, LetterlessTextDefaultsToEnglish) {
   EXPECT_EQ(lang_detect("12345 !!! ..."), LANG_TAG_EN);
   EXPECT_EQ(lang_detect(""), LANG_TAG_EN);
   EXPECT_EQ(lang_detect(NULL), LANG_TAG_EN);
}

TEST(LangDetectTest, OtherScriptsDefaultToEnglish) {
   EXPECT_EQ(lang_detect("Привет мир"), LANG_TAG_EN);
   EXPECT_EQ(lang_detect("こんにちは"), LANG_TAG_EN);
}

TEST(LangDetectTest, RandomBytesAlwaysYieldSupportedTag) {
   std::mt19937 rng(42);
   std::uniform_int_distribution<int> byte(0, 255);
   std::uniform_int_distribution<int> length(0, 64);

   for (int i = 0; i < 2000; i++) {
      std::string data;
      int n = length(rng);
      for (int j = 0; j < n; j++) {
         data.push_back(static_cast<char>(byte(rng)));
      }
      lang_tag_t tag = lang_detect_n(data.data(), data.size());
      EXPECT_TRUE(tag == LANG_TAG_EN || tag == LANG_TAG_HI);
   }
}

TEST(LangDetectTest, TruncatedDevanagariSequenceIsNotHindi) {
   /* First two bytes of U+0915 only */
   EXPECT_EQ(lang_detect_n("\xE0\xA4", 2), LANG_TAG_EN);
}

TEST(LangDetectTest, TagCodes) {
   EXPECT_STREQ(lang_tag_code(LANG_TAG_EN), "en");
   EXPECT_STREQ(lang_tag_code(LANG_TAG_HI), "hi");

   lang_tag_t tag;
   ASSERT_TRUE(lang_tag_from_code("hi", &tag));
   EXPECT_EQ(tag, LANG_TAG_HI);
   EXPECT_FALSE(lang_tag_from_code("fr", &tag));
}
