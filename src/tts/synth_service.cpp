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
 * @file synth_service.cpp
 * @brief Ticketed FIFO around the orchestrator
 */

#include "tts/synth_service.h"

#include <pthread.h>
#include <time.h>

#include <algorithm>
#include <deque>
#include <new>

#include "logging.h"

struct synth_service {
   synth_orchestrator_t *orch;
   pthread_mutex_t mutex;
   pthread_cond_t cond;
   std::deque<unsigned long> waiting; /* Tickets in arrival order */
   unsigned long next_ticket;
   bool busy;
};

static void deadline_after_ms(struct timespec *ts, long ms) {
   clock_gettime(CLOCK_MONOTONIC, ts);
   ts->tv_sec += ms / 1000;
   ts->tv_nsec += (ms % 1000) * 1000000L;
   if (ts->tv_nsec >= 1000000000L) {
      ts->tv_sec += 1;
      ts->tv_nsec -= 1000000000L;
   }
}

/* Wait for our turn. Returns false if cancelled while queued. Mutex held. */
static bool wait_for_turn(synth_service_t *svc, unsigned long ticket, synth_cancel_t *cancel) {
   while (svc->busy || svc->waiting.front() != ticket) {
      if (synth_cancel_is_requested(cancel)) {
         svc->waiting.erase(std::find(svc->waiting.begin(), svc->waiting.end(), ticket));
         pthread_cond_broadcast(&svc->cond);
         return false;
      }
      /* Timed so a token cancelled from a signal handler is noticed */
      struct timespec deadline;
      deadline_after_ms(&deadline, CANCEL_POLL_INTERVAL_MS);
      pthread_cond_timedwait(&svc->cond, &svc->mutex, &deadline);
   }
   svc->waiting.pop_front();
   svc->busy = true;
   return true;
}

extern "C" {

synth_service_t *synth_service_create(synth_orchestrator_t *orch) {
   if (!orch) {
      LOG_ERROR("synth_service_create: orchestrator is NULL");
      return NULL;
   }

   synth_service_t *svc = new (std::nothrow) synth_service_t();
   if (!svc) {
      LOG_ERROR("Failed to allocate synthesis service");
      return NULL;
   }
   svc->orch = orch;
   svc->next_ticket = 0;
   svc->busy = false;

   pthread_condattr_t attr;
   pthread_condattr_init(&attr);
   pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
   int rc = pthread_cond_init(&svc->cond, &attr);
   pthread_condattr_destroy(&attr);
   if (rc != 0) {
      delete svc;
      LOG_ERROR("Failed to initialize service condition");
      return NULL;
   }
   if (pthread_mutex_init(&svc->mutex, NULL) != 0) {
      pthread_cond_destroy(&svc->cond);
      delete svc;
      LOG_ERROR("Failed to initialize service mutex");
      return NULL;
   }
   return svc;
}

void synth_service_free(synth_service_t *svc) {
   if (!svc)
      return;
   if (svc->busy || !svc->waiting.empty()) {
      LOG_WARNING("Freeing synthesis service with %zu queued run(s)", svc->waiting.size());
   }
   pthread_cond_destroy(&svc->cond);
   pthread_mutex_destroy(&svc->mutex);
   delete svc;
}

synth_error_t synth_service_submit(synth_service_t *svc,
                                   const char *text,
                                   const char *voice_hint,
                                   synth_cancel_t *cancel,
                                   synth_result_t *result) {
   if (!svc || !result) {
      synth_result_set_error(result, SYNTH_ERR_INVALID_PARAM, NULL);
      return SYNTH_ERR_INVALID_PARAM;
   }

   pthread_mutex_lock(&svc->mutex);
   unsigned long ticket = svc->next_ticket++;
   try {
      svc->waiting.push_back(ticket);
   } catch (const std::bad_alloc &) {
      pthread_mutex_unlock(&svc->mutex);
      LOG_ERROR("Failed to queue synthesis run");
      synth_result_set_error(result, SYNTH_ERR_OUT_OF_MEMORY, NULL);
      return SYNTH_ERR_OUT_OF_MEMORY;
   }
   if (svc->busy || svc->waiting.size() > 1) {
      LOG_INFO("Synthesis queued behind %zu run(s)",
               svc->waiting.size() - 1 + (svc->busy ? 1 : 0));
   }

   bool admitted = wait_for_turn(svc, ticket, cancel);
   pthread_mutex_unlock(&svc->mutex);

   if (!admitted) {
      LOG_INFO("Queued synthesis cancelled before it started");
      synth_result_set_error(result, SYNTH_ERR_CANCELLED, NULL);
      return SYNTH_ERR_CANCELLED;
   }

   synth_error_t err = synth_orchestrator_synthesize(svc->orch, text, voice_hint, cancel, result);

   pthread_mutex_lock(&svc->mutex);
   svc->busy = false;
   pthread_cond_broadcast(&svc->cond);
   pthread_mutex_unlock(&svc->mutex);
   return err;
}

void synth_service_get_status(synth_service_t *svc, synth_service_status_t *status) {
   if (!status)
      return;
   status->is_processing = false;
   status->queue_length = 0;
   if (!svc)
      return;

   pthread_mutex_lock(&svc->mutex);
   status->is_processing = svc->busy;
   status->queue_length = static_cast<int>(svc->waiting.size());
   pthread_mutex_unlock(&svc->mutex);
}

}  // extern "C"
