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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/vaani_config.h"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
   void SetUp() override { config_set_defaults(&config_); }

   void TearDown() override {
      unsetenv("VAANI_RETRY_MAX_ATTEMPTS");
      unsetenv("VAANI_BACKEND_ENDPOINT");
      unsetenv("VAANI_DISPATCH_PACING_DELAY_MS");
      unsetenv("VAANI_VOICES");
      if (!temp_path_.empty())
         unlink(temp_path_.c_str());
   }

   /* Write contents to a temporary file and return its path */
   std::string write_temp(const std::string &contents) {
      char path[] = "/tmp/vaani_config_XXXXXX";
      int fd = mkstemp(path);
      EXPECT_GE(fd, 0);
      EXPECT_EQ(write(fd, contents.data(), contents.size()),
                static_cast<ssize_t>(contents.size()));
      close(fd);
      temp_path_ = path;
      return temp_path_;
   }

   int validate() { return config_validate(&config_, errors_, 16); }

   vaani_config_t config_;
   config_error_t errors_[16];
   std::string temp_path_;
};

}  // namespace

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
   EXPECT_EQ(config_.limits.max_input_chars, 2000);
   EXPECT_EQ(config_.limits.max_input_bytes, 3000);
   EXPECT_EQ(config_.chunking.max_segment_chars, 190);
   EXPECT_STREQ(config_.chunking.boundaries, ".!?\xE0\xA5\xA4");
   EXPECT_EQ(config_.retry.max_attempts, 3);
   EXPECT_EQ(config_.retry.request_timeout_sec, 30);
   EXPECT_EQ(config_.retry.retry_delay_ms, 1000);
   EXPECT_EQ(config_.retry.rate_limit_backoff_ms, 2000);
   EXPECT_EQ(config_.dispatch.pacing_delay_ms, 500);
   EXPECT_EQ(config_.dispatch.excerpt_chars, 50);
   EXPECT_EQ(config_.payload.min_audio_bytes, 100);
   ASSERT_EQ(config_.voices.count, 2);
   EXPECT_TRUE(config_voice_allowed(&config_, "en"));
   EXPECT_TRUE(config_voice_allowed(&config_, "hi"));
   EXPECT_FALSE(config_voice_allowed(&config_, "fr"));
   EXPECT_EQ(validate(), 0);
}

TEST_F(ConfigTest, ParsesSectionsAndVoices) {
   const char *json = "{"
                      "  \"retry\": { \"max_attempts\": 5, \"retry_delay_ms\": 250 },"
                      "  \"chunking\": { \"max_segment_chars\": 120 },"
                      "  \"backend\": { \"client\": \"gtx\" },"
                      "  \"voices\": [\"en\", \"hi\", \"ne\"]"
                      "}";
   ASSERT_EQ(config_parse_string(json, &config_), 0);
   EXPECT_EQ(config_.retry.max_attempts, 5);
   EXPECT_EQ(config_.retry.retry_delay_ms, 250);
   EXPECT_EQ(config_.retry.request_timeout_sec, 30);
   EXPECT_EQ(config_.chunking.max_segment_chars, 120);
   EXPECT_STREQ(config_.backend.client, "gtx");
   EXPECT_EQ(config_.voices.count, 3);
   EXPECT_TRUE(config_voice_allowed(&config_, "ne"));
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
   EXPECT_EQ(config_parse_string("{\"retry\": {\"jitter\": 1}, \"extra\": {}}", &config_), 0);
   EXPECT_EQ(config_.retry.max_attempts, 3);
}

TEST_F(ConfigTest, RejectsWrongTypesAndBadJson) {
   EXPECT_NE(config_parse_string("{\"retry\": {\"max_attempts\": \"five\"}}", &config_), 0);
   EXPECT_NE(config_parse_string("{\"voices\": \"en\"}", &config_), 0);
   EXPECT_NE(config_parse_string("{\"retry\": ", &config_), 0);
   EXPECT_NE(config_parse_string("[1, 2]", &config_), 0);
}

TEST_F(ConfigTest, ParsesFileAndRecordsPath) {
   std::string path = write_temp("{\"dispatch\": {\"pacing_delay_ms\": 0}}");
   ASSERT_EQ(config_load_from_search(path.c_str(), &config_), 0);
   EXPECT_EQ(config_.dispatch.pacing_delay_ms, 0);
   EXPECT_EQ(std::string(config_get_loaded_path()), path);
}

TEST_F(ConfigTest, MissingExplicitFileIsAnError) {
   EXPECT_NE(config_load_from_search("/nonexistent/vaani.json", &config_), 0);
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
   ASSERT_EQ(config_parse_string("{\"retry\": {\"max_attempts\": 5}}", &config_), 0);
   setenv("VAANI_RETRY_MAX_ATTEMPTS", "7", 1);
   setenv("VAANI_BACKEND_ENDPOINT", "http://localhost:8080/tts", 1);
   setenv("VAANI_VOICES", " en , ta ", 1);

   EXPECT_EQ(config_apply_env(&config_), 3);
   EXPECT_EQ(config_.retry.max_attempts, 7);
   EXPECT_STREQ(config_.backend.endpoint, "http://localhost:8080/tts");
   ASSERT_EQ(config_.voices.count, 2);
   EXPECT_STREQ(config_.voices.names[1], "ta");
   EXPECT_FALSE(config_voice_allowed(&config_, "hi"));
}

TEST_F(ConfigTest, NonNumericEnvironmentValueIsIgnored) {
   setenv("VAANI_DISPATCH_PACING_DELAY_MS", "soon", 1);
   EXPECT_EQ(config_apply_env(&config_), 0);
   EXPECT_EQ(config_.dispatch.pacing_delay_ms, 500);
}

TEST_F(ConfigTest, EnvironmentNames) {
   char name[64];
   config_env_name("retry", "max_attempts", name, sizeof(name));
   EXPECT_STREQ(name, "VAANI_RETRY_MAX_ATTEMPTS");
}

TEST_F(ConfigTest, ValidationReportsEachBadField) {
   config_.retry.max_attempts = 0;
   config_.chunking.max_segment_chars = 0;
   strcpy(config_.backend.endpoint, "ftp://example.com");
   strcpy(config_.general.log_level, "verbose");

   ASSERT_EQ(validate(), 4);
   EXPECT_STREQ(errors_[0].field, "general.log_level");
   EXPECT_STREQ(errors_[1].field, "chunking.max_segment_chars");
   EXPECT_STREQ(errors_[2].field, "retry.max_attempts");
   EXPECT_STREQ(errors_[3].field, "backend.endpoint");
}

TEST_F(ConfigTest, ValidationRejectsMalformedBoundaries) {
   strcpy(config_.chunking.boundaries, ".\xC3");
   EXPECT_EQ(validate(), 1);
   EXPECT_STREQ(errors_[0].field, "chunking.boundaries");
}

TEST_F(ConfigTest, VoicesCsvLimits) {
   EXPECT_EQ(config_set_voices_csv(&config_, "a,b,c,d,e,f,g,h,i"), 1);
   EXPECT_EQ(config_.voices.count, 2); /* unchanged on failure */
   EXPECT_EQ(config_set_voices_csv(&config_, "en,,hi,"), 0);
   EXPECT_EQ(config_.voices.count, 2);
}
