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
 * @file cancel_token.cpp
 * @brief Interruptible sleeps on a monotonic condition variable
 */

#include "core/cancel_token.h"

#include <errno.h>
#include <pthread.h>
#include <time.h>

#include <atomic>
#include <new>

#include "logging.h"

struct synth_cancel {
   std::atomic<bool> cancelled;
   pthread_mutex_t mutex;
   pthread_cond_t cond;
};

static void timespec_add_ms(struct timespec *ts, long ms) {
   ts->tv_sec += ms / 1000;
   ts->tv_nsec += (ms % 1000) * 1000000L;
   if (ts->tv_nsec >= 1000000000L) {
      ts->tv_sec += 1;
      ts->tv_nsec -= 1000000000L;
   }
}

static long timespec_diff_ms(const struct timespec *end, const struct timespec *start) {
   return (end->tv_sec - start->tv_sec) * 1000L + (end->tv_nsec - start->tv_nsec) / 1000000L;
}

extern "C" {

synth_cancel_t *synth_cancel_create(void) {
   synth_cancel_t *token = new (std::nothrow) synth_cancel_t();
   if (!token) {
      LOG_ERROR("Failed to allocate cancellation token");
      return NULL;
   }
   token->cancelled.store(false);

   pthread_condattr_t attr;
   pthread_condattr_init(&attr);
   pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
   if (pthread_cond_init(&token->cond, &attr) != 0) {
      pthread_condattr_destroy(&attr);
      delete token;
      LOG_ERROR("Failed to initialize cancellation condition");
      return NULL;
   }
   pthread_condattr_destroy(&attr);

   if (pthread_mutex_init(&token->mutex, NULL) != 0) {
      pthread_cond_destroy(&token->cond);
      delete token;
      LOG_ERROR("Failed to initialize cancellation mutex");
      return NULL;
   }
   return token;
}

void synth_cancel_free(synth_cancel_t *token) {
   if (!token)
      return;
   pthread_cond_destroy(&token->cond);
   pthread_mutex_destroy(&token->mutex);
   delete token;
}

void synth_cancel_request(synth_cancel_t *token) {
   if (!token)
      return;
   pthread_mutex_lock(&token->mutex);
   token->cancelled.store(true);
   pthread_cond_broadcast(&token->cond);
   pthread_mutex_unlock(&token->mutex);
}

void synth_cancel_request_async(synth_cancel_t *token) {
   if (token)
      token->cancelled.store(true);
}

int synth_cancel_is_requested(const synth_cancel_t *token) {
   return (token && token->cancelled.load()) ? 1 : 0;
}

int synth_cancel_sleep_ms(synth_cancel_t *token, int ms) {
   if (!token) {
      if (ms > 0) {
         struct timespec ts = { ms / 1000, (ms % 1000) * 1000000L };
         while (nanosleep(&ts, &ts) == -1 && errno == EINTR) {
         }
      }
      return 0;
   }

   if (token->cancelled.load())
      return 1;
   if (ms <= 0)
      return 0;

   struct timespec start;
   struct timespec now;
   clock_gettime(CLOCK_MONOTONIC, &start);

   pthread_mutex_lock(&token->mutex);
   while (!token->cancelled.load()) {
      clock_gettime(CLOCK_MONOTONIC, &now);
      long remaining = ms - timespec_diff_ms(&now, &start);
      if (remaining <= 0)
         break;

      struct timespec deadline = now;
      timespec_add_ms(&deadline,
                      remaining < CANCEL_POLL_INTERVAL_MS ? remaining : CANCEL_POLL_INTERVAL_MS);
      pthread_cond_timedwait(&token->cond, &token->mutex, &deadline);
   }
   pthread_mutex_unlock(&token->mutex);

   return token->cancelled.load() ? 1 : 0;
}

} /* extern "C" */
