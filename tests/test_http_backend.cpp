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
#include <string.h>

#include <string>

#include "config/vaani_config.h"
#include "tts/http_backend.h"

namespace {

class HttpBackendTest : public ::testing::Test {
 protected:
   static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
   static void TearDownTestSuite() { curl_global_cleanup(); }

   void SetUp() override {
      vaani_config_t config;
      config_set_defaults(&config);
      backend_config_ = config.backend;
      curl_ = curl_easy_init();
      ASSERT_NE(curl_, nullptr);
   }

   void TearDown() override { curl_easy_cleanup(curl_); }

   std::string build(const char *text, const char *lang) {
      char *url = http_backend_build_url(curl_, &backend_config_, text, lang);
      EXPECT_NE(url, nullptr);
      std::string result = url ? url : "";
      free(url);
      return result;
   }

   backend_config_t backend_config_;
   CURL *curl_ = NULL;
};

}  // namespace

TEST_F(HttpBackendTest, BuildsQueryWithLanguageAndText) {
   EXPECT_EQ(build("Hello world.", "en"),
             "https://translate.google.com/translate_tts?ie=UTF-8&client=tw-ob&tl=en&q=Hello%20world.");
}

TEST_F(HttpBackendTest, EscapesUtf8Text) {
   EXPECT_EQ(build("\xE0\xA4\x95&x", "hi"),
             "https://translate.google.com/translate_tts?ie=UTF-8&client=tw-ob&tl=hi&q=%E0%A4%95%26x");
}

TEST_F(HttpBackendTest, AppendsToExistingQuery) {
   strcpy(backend_config_.endpoint, "http://localhost:8080/tts?key=abc");
   EXPECT_EQ(build("hi", "en"), "http://localhost:8080/tts?key=abc&ie=UTF-8&client=tw-ob&tl=en&q=hi");
}

TEST_F(HttpBackendTest, CreateRejectsBadConfig) {
   EXPECT_EQ(http_backend_create(NULL), nullptr);
   backend_config_.max_response_bytes = 0;
   EXPECT_EQ(http_backend_create(&backend_config_), nullptr);
}

TEST_F(HttpBackendTest, RefusedConnectionIsNetworkFailure) {
   strcpy(backend_config_.endpoint, "http://127.0.0.1:1/tts");
   http_backend_t *http = http_backend_create(&backend_config_);
   ASSERT_NE(http, nullptr);
   synth_backend_t backend = http_backend_as_synth_backend(http);
   ASSERT_NE(backend.fetch, nullptr);

   synth_request_t request = { "Hello", "en", 2, NULL };
   synth_response_t response;
   synth_response_init(&response);
   EXPECT_EQ(backend.fetch(backend.userdata, &request, &response), 0);
   EXPECT_EQ(response.transport, SYNTH_TRANSPORT_NETWORK);
   EXPECT_NE(response.detail[0], '\0');
   synth_response_free(&response);
   http_backend_free(http);
}
