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
#include <thread>

#include "core/cancel_token.h"

TEST(CancelTokenTest, StartsClear) {
   synth_cancel_t *token = synth_cancel_create();
   ASSERT_NE(token, nullptr);
   EXPECT_EQ(synth_cancel_is_requested(token), 0);
   synth_cancel_request(token);
   EXPECT_EQ(synth_cancel_is_requested(token), 1);
   synth_cancel_free(token);
}

TEST(CancelTokenTest, NullTokenIsNeverCancelled) {
   EXPECT_EQ(synth_cancel_is_requested(NULL), 0);
   EXPECT_EQ(synth_cancel_sleep_ms(NULL, 5), 0);
   synth_cancel_request(NULL);
   synth_cancel_free(NULL);
}

TEST(CancelTokenTest, SleepRunsFullDurationWhenNotCancelled) {
   synth_cancel_t *token = synth_cancel_create();
   ASSERT_NE(token, nullptr);

   auto start = std::chrono::steady_clock::now();
   EXPECT_EQ(synth_cancel_sleep_ms(token, 60), 0);
   auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
       std::chrono::steady_clock::now() - start);
   EXPECT_GE(elapsed.count(), 55);
   synth_cancel_free(token);
}

TEST(CancelTokenTest, RequestWakesSleeper) {
   synth_cancel_t *token = synth_cancel_create();
   ASSERT_NE(token, nullptr);

   std::thread waker([token] {
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      synth_cancel_request(token);
   });
   auto start = std::chrono::steady_clock::now();
   EXPECT_EQ(synth_cancel_sleep_ms(token, 10000), 1);
   auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
       std::chrono::steady_clock::now() - start);
   waker.join();
   EXPECT_LT(elapsed.count(), 2000);
   synth_cancel_free(token);
}

TEST(CancelTokenTest, AsyncRequestIsSeenByPollingSleeper) {
   synth_cancel_t *token = synth_cancel_create();
   ASSERT_NE(token, nullptr);

   std::thread waker([token] {
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      synth_cancel_request_async(token);
   });
   auto start = std::chrono::steady_clock::now();
   EXPECT_EQ(synth_cancel_sleep_ms(token, 10000), 1);
   auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
       std::chrono::steady_clock::now() - start);
   waker.join();
   /* Picked up by the next poll rather than a wakeup */
   EXPECT_LT(elapsed.count(), 30 + 5 * CANCEL_POLL_INTERVAL_MS);
   synth_cancel_free(token);
}

TEST(CancelTokenTest, CancelledTokenSleepsNotAtAll) {
   synth_cancel_t *token = synth_cancel_create();
   ASSERT_NE(token, nullptr);
   synth_cancel_request(token);
   EXPECT_EQ(synth_cancel_sleep_ms(token, 10000), 1);
   EXPECT_EQ(synth_cancel_sleep_ms(token, 0), 1);
   synth_cancel_free(token);
}
