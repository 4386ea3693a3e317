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
 * @file synth_orchestrator.cpp
 * @brief Synthesis run state machine
 */

#include "tts/synth_orchestrator.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging.h"
#include "tts/lang_detect.h"
#include "tts/segment_executor.h"
#include "tts/text_chunker.h"
#include "utils/utf8_utils.h"

struct synth_orchestrator {
   vaani_config_t config;
   synth_backend_t backend;
   synth_executor_config_t executor;
   synth_progress_callback_t progress_cb;
   void *progress_userdata;
};

namespace {

/* Per-run working state; everything here dies with the run */
struct SynthRun {
   synth_orchestrator_t *orch;
   synth_cancel_t *cancel;
   synth_result_t *result;
   synth_state_t state = SYNTH_STATE_IDLE;
   std::vector<std::string> segments;
   std::vector<uint8_t> audio;
   std::vector<synth_failure_t> failures;
};

void enter_state(SynthRun &run, synth_state_t state, int segment_index = 0) {
   if (state != run.state) {
      LOG_INFO("Synthesis: %s -> %s", synth_state_name(run.state), synth_state_name(state));
      run.state = state;
   }
   if (run.orch->progress_cb) {
      run.orch->progress_cb(run.orch->progress_userdata, state, segment_index,
                            static_cast<int>(run.segments.size()));
   }
}

/* Record a terminal failure; terminal state depends on how far the run got */
synth_error_t fail_run(SynthRun &run, synth_error_t err, const char *message) {
   synth_result_t *result = run.result;
   result->success = false;
   result->error = err;
   safe_strncpy(result->error_message, message ? message : synth_error_string(err),
                sizeof(result->error_message));

   bool aborted = (err == SYNTH_ERR_TOO_MANY_FAILURES || err == SYNTH_ERR_CANCELLED) &&
                  run.state == SYNTH_STATE_DISPATCHING;
   enter_state(run, aborted ? SYNTH_STATE_ABORTED : SYNTH_STATE_DONE);
   result->final_state = run.state;

   LOG_ERROR("Synthesis failed: %s (%s)", synth_error_name(err), result->error_message);
   return err;
}

std::string make_excerpt(const std::string &segment, int excerpt_chars) {
   size_t limit = excerpt_chars > 0 ? static_cast<size_t>(excerpt_chars) : 0;
   if (utf8_length(segment) <= limit)
      return segment;
   return utf8_truncate(segment, limit) + "...";
}

/* Copy the collected failures into the C result */
void publish_failures(SynthRun &run) {
   if (run.failures.empty())
      return;
   size_t bytes = run.failures.size() * sizeof(synth_failure_t);
   run.result->failures = static_cast<synth_failure_t *>(malloc(bytes));
   if (!run.result->failures)
      throw std::bad_alloc();
   memcpy(run.result->failures, run.failures.data(), bytes);
   run.result->failure_count = run.failures.size();
}

synth_error_t validate_input(SynthRun &run, const char *text, const char *voice_hint) {
   const vaani_config_t *config = &run.orch->config;
   std::string raw(text);

   if (utf8_trim(raw).empty()) {
      return fail_run(run, SYNTH_ERR_INVALID_INPUT, "Text is required");
   }

   size_t chars = utf8_length(raw);
   if (chars > static_cast<size_t>(config->limits.max_input_chars)) {
      char msg[SYNTH_ERROR_MESSAGE_MAX];
      snprintf(msg, sizeof(msg), "Text must be at most %d characters (got %zu)",
               config->limits.max_input_chars, chars);
      return fail_run(run, SYNTH_ERR_INVALID_INPUT, msg);
   }
   if (raw.size() > static_cast<size_t>(config->limits.max_input_bytes)) {
      char msg[SYNTH_ERROR_MESSAGE_MAX];
      snprintf(msg, sizeof(msg), "Text must be at most %d bytes of UTF-8 (got %zu)",
               config->limits.max_input_bytes, raw.size());
      return fail_run(run, SYNTH_ERR_INVALID_INPUT, msg);
   }

   if (voice_hint && voice_hint[0] != '\0' && !config_voice_allowed(config, voice_hint)) {
      std::string allowed;
      for (int i = 0; i < config->voices.count; i++) {
         if (i > 0)
            allowed += ", ";
         allowed += config->voices.names[i];
      }
      char msg[SYNTH_ERROR_MESSAGE_MAX];
      snprintf(msg, sizeof(msg), "Invalid voice option. Must be one of: %s", allowed.c_str());
      return fail_run(run, SYNTH_ERR_INVALID_INPUT, msg);
   }

   return SYNTH_OK;
}

synth_error_t dispatch_segments(SynthRun &run, const char *lang) {
   synth_orchestrator_t *orch = run.orch;
   const int total = static_cast<int>(run.segments.size());
   int failed = 0;
   int succeeded = 0;

   for (int i = 0; i < total; i++) {
      enter_state(run, SYNTH_STATE_DISPATCHING, i + 1);
      if (i > 0 && synth_cancel_sleep_ms(run.cancel, orch->config.dispatch.pacing_delay_ms)) {
         return fail_run(run, SYNTH_ERR_CANCELLED, NULL);
      }
      if (synth_cancel_is_requested(run.cancel)) {
         return fail_run(run, SYNTH_ERR_CANCELLED, NULL);
      }

      const std::string &segment = run.segments[i];

      synth_segment_outcome_t outcome;
      synth_segment_outcome_init(&outcome);
      synth_error_t err = synth_executor_execute(&orch->backend, &orch->executor, segment.c_str(),
                                                 lang, run.cancel, &outcome);

      if (err == SYNTH_OK) {
         try {
            run.audio.insert(run.audio.end(), outcome.audio, outcome.audio + outcome.audio_size);
         } catch (const std::exception &) {
            synth_segment_outcome_free(&outcome);
            throw;
         }
         synth_segment_outcome_free(&outcome);
         succeeded++;
         run.result->succeeded_count = succeeded;
         continue;
      }
      synth_segment_outcome_free(&outcome);

      if (err == SYNTH_ERR_CANCELLED) {
         return fail_run(run, SYNTH_ERR_CANCELLED, NULL);
      }
      if (err == SYNTH_ERR_INVALID_PARAM) {
         return fail_run(run, err, "Segment executor rejected its parameters");
      }

      synth_failure_t failure;
      memset(&failure, 0, sizeof(failure));
      failure.segment_index = i + 1;
      safe_strncpy(failure.excerpt, make_excerpt(segment, orch->config.dispatch.excerpt_chars).c_str(),
                   sizeof(failure.excerpt));
      failure.reason = err;
      failure.attempts = outcome.attempts;
      run.failures.push_back(failure);
      failed++;

      LOG_WARNING("Segment %d/%d failed after %d attempt(s): %s \"%s\"", i + 1, total,
                  failure.attempts, synth_error_name(err), failure.excerpt);

      if (failed * 2 > total) {
         LOG_ERROR("Aborting: %d of %d segments failed", failed, total);
         publish_failures(run);
         char msg[SYNTH_ERROR_MESSAGE_MAX];
         snprintf(msg, sizeof(msg), "Too many segments failed (%d of %d)", failed, total);
         return fail_run(run, SYNTH_ERR_TOO_MANY_FAILURES, msg);
      }
   }

   return SYNTH_OK;
}

synth_error_t assemble_audio(SynthRun &run) {
   enter_state(run, SYNTH_STATE_ASSEMBLING);
   synth_result_t *result = run.result;

   if (result->succeeded_count == 0) {
      publish_failures(run);
      return fail_run(run, SYNTH_ERR_NO_AUDIO, NULL);
   }

   size_t min_bytes = static_cast<size_t>(run.orch->config.payload.min_audio_bytes);
   if (run.audio.size() < min_bytes) {
      char msg[SYNTH_ERROR_MESSAGE_MAX];
      snprintf(msg, sizeof(msg), "Combined audio too small (%zu bytes, need %zu)",
               run.audio.size(), min_bytes);
      return fail_run(run, SYNTH_ERR_INVALID_COMBINED_AUDIO, msg);
   }

   result->audio = static_cast<uint8_t *>(malloc(run.audio.size()));
   if (!result->audio)
      throw std::bad_alloc();
   memcpy(result->audio, run.audio.data(), run.audio.size());
   result->audio_size = run.audio.size();
   publish_failures(run);

   result->success = true;
   result->error = SYNTH_OK;
   result->error_message[0] = '\0';
   enter_state(run, SYNTH_STATE_DONE);
   result->final_state = SYNTH_STATE_DONE;

   if (result->failure_count > 0) {
      LOG_WARNING("Synthesis finished with %zu of %d segment(s) missing (%zu bytes)",
                  result->failure_count, result->segment_count, result->audio_size);
   } else {
      LOG_INFO("Synthesis finished: %d segment(s), %zu bytes", result->segment_count,
               result->audio_size);
   }
   return SYNTH_OK;
}

synth_error_t run_synthesis(SynthRun &run, const char *text, const char *voice_hint) {
   synth_orchestrator_t *orch = run.orch;
   synth_result_t *result = run.result;

   enter_state(run, SYNTH_STATE_VALIDATING);
   synth_error_t err = validate_input(run, text, voice_hint);
   if (err != SYNTH_OK)
      return err;

   std::string normalized = utf8_normalize_whitespace(text);

   enter_state(run, SYNTH_STATE_DETECTING);
   lang_tag_t tag = lang_detect_n(normalized.data(), normalized.size());
   if (voice_hint && voice_hint[0] != '\0') {
      safe_strncpy(result->language, voice_hint, sizeof(result->language));
      LOG_INFO("Detected language '%s', voice hint '%s' takes precedence", lang_tag_code(tag),
               voice_hint);
   } else {
      safe_strncpy(result->language, lang_tag_code(tag), sizeof(result->language));
      LOG_INFO("Detected language '%s'", result->language);
   }

   enter_state(run, SYNTH_STATE_CHUNKING);
   run.segments = text_chunker_split(normalized,
                                     static_cast<size_t>(orch->config.chunking.max_segment_chars),
                                     orch->config.chunking.boundaries);
   if (run.segments.empty()) {
      return fail_run(run, SYNTH_ERR_CHUNKING_FAILED, NULL);
   }
   result->segment_count = static_cast<int>(run.segments.size());
   LOG_INFO("Split %zu characters into %d segment(s) of at most %d",
            utf8_length(normalized), result->segment_count,
            orch->config.chunking.max_segment_chars);

   err = dispatch_segments(run, result->language);
   if (err != SYNTH_OK)
      return err;

   return assemble_audio(run);
}

void reset_result(synth_result_t *result) {
   result->success = false;
   result->audio = NULL;
   result->audio_size = 0;
   result->failures = NULL;
   result->failure_count = 0;
   result->error = SYNTH_OK;
   result->error_message[0] = '\0';
   result->language[0] = '\0';
   result->segment_count = 0;
   result->succeeded_count = 0;
   result->final_state = SYNTH_STATE_IDLE;
}

}  // namespace

extern "C" {

synth_orchestrator_t *synth_orchestrator_create(const vaani_config_t *config,
                                                const synth_backend_t *backend) {
   if (!config || !backend || !backend->fetch) {
      LOG_ERROR("synth_orchestrator_create: invalid parameters");
      return NULL;
   }

   synth_orchestrator_t *orch = static_cast<synth_orchestrator_t *>(
       calloc(1, sizeof(synth_orchestrator_t)));
   if (!orch) {
      LOG_ERROR("Failed to allocate orchestrator");
      return NULL;
   }

   orch->config = *config;
   orch->backend = *backend;
   orch->executor.max_attempts = config->retry.max_attempts;
   orch->executor.request_timeout_sec = config->retry.request_timeout_sec;
   orch->executor.retry_delay_ms = config->retry.retry_delay_ms;
   orch->executor.rate_limit_backoff_ms = config->retry.rate_limit_backoff_ms;
   orch->executor.min_payload_bytes = static_cast<size_t>(config->payload.min_audio_bytes);

   LOG_INFO("Orchestrator ready (backend '%s', %d attempts, %d char segments)",
            backend->name ? backend->name : "unnamed", config->retry.max_attempts,
            config->chunking.max_segment_chars);
   return orch;
}

void synth_orchestrator_free(synth_orchestrator_t *orch) {
   free(orch);
}

void synth_orchestrator_set_progress_callback(synth_orchestrator_t *orch,
                                              synth_progress_callback_t callback,
                                              void *userdata) {
   if (!orch)
      return;
   orch->progress_cb = callback;
   orch->progress_userdata = userdata;
}

synth_error_t synth_orchestrator_synthesize(synth_orchestrator_t *orch,
                                            const char *text,
                                            const char *voice_hint,
                                            synth_cancel_t *cancel,
                                            synth_result_t *result) {
   if (!result)
      return SYNTH_ERR_INVALID_PARAM;
   reset_result(result);

   if (!orch || !text) {
      synth_result_set_error(result, SYNTH_ERR_INVALID_PARAM, NULL);
      return SYNTH_ERR_INVALID_PARAM;
   }

   SynthRun run;
   run.orch = orch;
   run.cancel = cancel;
   run.result = result;

   try {
      return run_synthesis(run, text, voice_hint);
   } catch (const std::bad_alloc &) {
      synth_result_free(result);
      return fail_run(run, SYNTH_ERR_OUT_OF_MEMORY, NULL);
   } catch (const std::exception &e) {
      synth_result_free(result);
      return fail_run(run, SYNTH_ERR_INVALID_PARAM, e.what());
   }
}

void synth_result_set_error(synth_result_t *result, synth_error_t err, const char *message) {
   if (!result)
      return;
   reset_result(result);
   result->error = err;
   result->final_state = SYNTH_STATE_DONE;
   safe_strncpy(result->error_message, message ? message : synth_error_string(err),
                sizeof(result->error_message));
}

void synth_result_free(synth_result_t *result) {
   if (!result)
      return;
   free(result->audio);
   result->audio = NULL;
   result->audio_size = 0;
   free(result->failures);
   result->failures = NULL;
   result->failure_count = 0;
}

}  // extern "C"
