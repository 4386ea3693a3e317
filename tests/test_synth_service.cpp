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

#include <chrono>
#include <functional>
#include <thread>

#include "core/cancel_token.h"
#include "fake_backend.h"
#include "tts/synth_service.h"

using vaani_test::FakeBackend;
using vaani_test::fast_config;

namespace {

bool wait_until(const std::function<bool()> &pred, int timeout_ms = 5000) {
   auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
   while (std::chrono::steady_clock::now() < deadline) {
      if (pred())
         return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
   }
   return pred();
}

class SynthServiceTest : public ::testing::Test {
 protected:
   void SetUp() override {
      vaani_config_t config = fast_config();
      synth_backend_t backend = fake_.backend();
      orch_ = synth_orchestrator_create(&config, &backend);
      ASSERT_NE(orch_, nullptr);
      svc_ = synth_service_create(orch_);
      ASSERT_NE(svc_, nullptr);
   }

   void TearDown() override {
      synth_service_free(svc_);
      synth_orchestrator_free(orch_);
   }

   synth_service_status_t status() {
      synth_service_status_t s;
      synth_service_get_status(svc_, &s);
      return s;
   }

   FakeBackend fake_;
   synth_orchestrator_t *orch_ = NULL;
   synth_service_t *svc_ = NULL;
};

struct Submission {
   synth_error_t error = SYNTH_OK;
   bool success = false;
};

}  // namespace

TEST_F(SynthServiceTest, IdleStatus) {
   synth_service_status_t s = status();
   EXPECT_FALSE(s.is_processing);
   EXPECT_EQ(s.queue_length, 0);
}

TEST_F(SynthServiceTest, SingleSubmitRunsImmediately) {
   synth_result_t result;
   EXPECT_EQ(synth_service_submit(svc_, "Hello world.", NULL, NULL, &result), SYNTH_OK);
   EXPECT_TRUE(result.success);
   synth_result_free(&result);
   EXPECT_FALSE(status().is_processing);
}

TEST_F(SynthServiceTest, RunsInArrivalOrder) {
   fake_.set_fetch_delay_ms(300);
   Submission subs[3];
   const char *texts[3] = { "First request.", "Second request.", "Third request." };
   std::thread threads[3];

   for (int i = 0; i < 3; i++) {
      threads[i] = std::thread([this, &subs, texts, i] {
         synth_result_t result;
         subs[i].error = synth_service_submit(svc_, texts[i], NULL, NULL, &result);
         subs[i].success = result.success;
         synth_result_free(&result);
      });
      /* Let each submitter take its place before the next one arrives */
      ASSERT_TRUE(wait_until([this, i] {
         synth_service_status_t s = status();
         return s.is_processing && s.queue_length == i;
      }));
   }
   for (std::thread &t : threads)
      t.join();

   for (const Submission &s : subs) {
      EXPECT_EQ(s.error, SYNTH_OK);
      EXPECT_TRUE(s.success);
   }
   std::vector<std::string> seen = fake_.texts();
   ASSERT_EQ(seen.size(), 3u);
   EXPECT_EQ(seen[0], texts[0]);
   EXPECT_EQ(seen[1], texts[1]);
   EXPECT_EQ(seen[2], texts[2]);
   EXPECT_FALSE(status().is_processing);
   EXPECT_EQ(status().queue_length, 0);
}

TEST_F(SynthServiceTest, CancelledWhileQueuedNeverReachesBackend) {
   fake_.set_fetch_delay_ms(300);
   synth_cancel_t *cancel = synth_cancel_create();
   ASSERT_NE(cancel, nullptr);

   Submission first;
   Submission queued;
   std::thread a([this, &first] {
      synth_result_t result;
      first.error = synth_service_submit(svc_, "Running request.", NULL, NULL, &result);
      synth_result_free(&result);
   });
   ASSERT_TRUE(wait_until([this] { return status().is_processing; }));

   std::thread b([this, &queued, cancel] {
      synth_result_t result;
      queued.error = synth_service_submit(svc_, "Queued request.", NULL, cancel, &result);
      queued.success = result.success;
      synth_result_free(&result);
   });
   ASSERT_TRUE(wait_until([this] { return status().queue_length == 1; }));

   synth_cancel_request(cancel);
   b.join();
   EXPECT_EQ(queued.error, SYNTH_ERR_CANCELLED);
   EXPECT_FALSE(queued.success);
   EXPECT_EQ(status().queue_length, 0);

   a.join();
   EXPECT_EQ(first.error, SYNTH_OK);
   std::vector<std::string> seen = fake_.texts();
   ASSERT_EQ(seen.size(), 1u);
   EXPECT_EQ(seen[0], "Running request.");
   synth_cancel_free(cancel);
}

TEST(SynthServiceApiTest, NullArguments) {
   EXPECT_EQ(synth_service_create(NULL), nullptr);

   synth_result_t result;
   EXPECT_EQ(synth_service_submit(NULL, "text", NULL, NULL, &result), SYNTH_ERR_INVALID_PARAM);
   EXPECT_EQ(result.error, SYNTH_ERR_INVALID_PARAM);

   synth_service_status_t s;
   synth_service_get_status(NULL, &s);
   EXPECT_FALSE(s.is_processing);
}
