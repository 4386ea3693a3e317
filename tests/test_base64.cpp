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

#include <stdlib.h>

#include <string>

#include "utils/base64.h"

namespace {

std::string encode(const std::string &in) {
   size_t len = 0;
   char *out = base64_encode(reinterpret_cast<const uint8_t *>(in.data()), in.size(), &len);
   EXPECT_NE(out, nullptr);
   std::string result(out, len);
   free(out);
   return result;
}

}  // namespace

TEST(Base64Test, Rfc4648Vectors) {
   EXPECT_EQ(encode(""), "");
   EXPECT_EQ(encode("f"), "Zg==");
   EXPECT_EQ(encode("fo"), "Zm8=");
   EXPECT_EQ(encode("foo"), "Zm9v");
   EXPECT_EQ(encode("foob"), "Zm9vYg==");
   EXPECT_EQ(encode("fooba"), "Zm9vYmE=");
   EXPECT_EQ(encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, BinaryInput) {
   EXPECT_EQ(encode(std::string("\xFF\x00\xFB", 3)), "/wD7");
}

TEST(Base64Test, EncodedSize) {
   EXPECT_EQ(base64_encoded_size(0), 0u);
   EXPECT_EQ(base64_encoded_size(1), 4u);
   EXPECT_EQ(base64_encoded_size(3), 4u);
   EXPECT_EQ(base64_encoded_size(4), 8u);
}
