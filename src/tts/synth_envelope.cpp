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
 * @file synth_envelope.cpp
 * @brief json-c request and envelope builders
 */

#include "tts/synth_envelope.h"

#include <stdlib.h>
#include <string.h>

#include "logging.h"
#include "utils/base64.h"

static json_object *failures_to_json(const synth_result_t *result) {
   json_object *array = json_object_new_array();
   if (!array)
      return NULL;
   for (size_t i = 0; i < result->failure_count; i++) {
      const synth_failure_t *f = &result->failures[i];
      json_object *entry = json_object_new_object();
      if (!entry) {
         json_object_put(array);
         return NULL;
      }
      json_object_object_add(entry, "segment", json_object_new_int(f->segment_index));
      json_object_object_add(entry, "excerpt", json_object_new_string(f->excerpt));
      json_object_object_add(entry, "reason", json_object_new_string(synth_error_name(f->reason)));
      json_object_object_add(entry, "attempts", json_object_new_int(f->attempts));
      json_object_array_add(array, entry);
   }
   return array;
}

/* Attach the failure list under key; false on allocation failure */
static bool add_failures(json_object *envelope, const char *key, const synth_result_t *result) {
   if (result->failure_count == 0)
      return true;
   json_object *array = failures_to_json(result);
   if (!array)
      return false;
   json_object_object_add(envelope, key, array);
   return true;
}

static char *dup_string_field(json_object *request, const char *key) {
   json_object *value = NULL;
   const char *str = "";
   if (json_object_object_get_ex(request, key, &value) &&
       json_object_is_type(value, json_type_string)) {
      str = json_object_get_string(value);
   }
   return strdup(str);
}

extern "C" {

int synth_envelope_parse_request(const char *json, synth_envelope_request_t *request) {
   if (!request)
      return 1;
   request->text = NULL;
   request->voice = NULL;
   if (!json)
      return 1;

   json_object *parsed = json_tokener_parse(json);
   if (!parsed || !json_object_is_type(parsed, json_type_object)) {
      if (parsed)
         json_object_put(parsed);
      LOG_WARNING("Request argument is not a JSON object");
      return 1;
   }

   request->text = dup_string_field(parsed, "text");
   request->voice = dup_string_field(parsed, "voice");
   json_object_put(parsed);

   if (!request->text || !request->voice) {
      synth_envelope_request_free(request);
      return 2;
   }
   return 0;
}

void synth_envelope_request_free(synth_envelope_request_t *request) {
   if (!request)
      return;
   free(request->text);
   free(request->voice);
   request->text = NULL;
   request->voice = NULL;
}

json_object *synth_envelope_error(const char *message, const char *code) {
   json_object *envelope = json_object_new_object();
   if (!envelope)
      return NULL;
   json_object_object_add(envelope, "success", json_object_new_boolean(0));
   json_object_object_add(envelope, "error", json_object_new_string(message ? message : ""));
   if (code) {
      json_object_object_add(envelope, "error_code", json_object_new_string(code));
   }
   return envelope;
}

json_object *synth_envelope_from_result(const synth_result_t *result, const char *output_path) {
   if (!result)
      return NULL;

   if (!result->success) {
      json_object *envelope =
          synth_envelope_error(result->error_message, synth_error_name(result->error));
      if (envelope && !add_failures(envelope, "failures", result)) {
         json_object_put(envelope);
         return NULL;
      }
      return envelope;
   }

   json_object *envelope = json_object_new_object();
   if (!envelope)
      return NULL;
   json_object_object_add(envelope, "success", json_object_new_boolean(1));

   if (output_path) {
      json_object_object_add(envelope, "output", json_object_new_string(output_path));
      json_object_object_add(envelope, "audio_bytes",
                             json_object_new_int64(static_cast<int64_t>(result->audio_size)));
   } else {
      size_t encoded_len = 0;
      char *encoded = base64_encode(result->audio, result->audio_size, &encoded_len);
      if (!encoded) {
         LOG_ERROR("Failed to encode %zu bytes of audio", result->audio_size);
         json_object_put(envelope);
         return NULL;
      }
      json_object_object_add(envelope, "audio",
                             json_object_new_string_len(encoded, static_cast<int>(encoded_len)));
      free(encoded);
   }

   json_object_object_add(envelope, "language", json_object_new_string(result->language));
   json_object_object_add(envelope, "segments", json_object_new_int(result->segment_count));
   if (!add_failures(envelope, "warnings", result)) {
      json_object_put(envelope);
      return NULL;
   }
   return envelope;
}

int synth_envelope_exit_code(const synth_result_t *result) {
   return (result && result->success) ? VAANI_EXIT_OK : VAANI_EXIT_SYNTH_FAILED;
}

}  // extern "C"
