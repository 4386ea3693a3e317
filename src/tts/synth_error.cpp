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
 * @file synth_error.cpp
 * @brief Names and descriptions for synth_error_t
 */

#include "tts/synth_error.h"

extern "C" {

const char *synth_error_name(synth_error_t err) {
   switch (err) {
      case SYNTH_OK:
         return "Ok";
      case SYNTH_ERR_INVALID_INPUT:
         return "InvalidInput";
      case SYNTH_ERR_CHUNKING_FAILED:
         return "ChunkingFailed";
      case SYNTH_ERR_TIMEOUT:
         return "Timeout";
      case SYNTH_ERR_RATE_LIMITED:
         return "RateLimited";
      case SYNTH_ERR_SERVER_ERROR:
         return "ServerError";
      case SYNTH_ERR_NETWORK:
         return "NetworkError";
      case SYNTH_ERR_INVALID_PAYLOAD:
         return "InvalidPayload";
      case SYNTH_ERR_TOO_MANY_FAILURES:
         return "TooManyFailures";
      case SYNTH_ERR_NO_AUDIO:
         return "NoAudioProduced";
      case SYNTH_ERR_INVALID_COMBINED_AUDIO:
         return "InvalidCombinedAudio";
      case SYNTH_ERR_CANCELLED:
         return "Cancelled";
      case SYNTH_ERR_INVALID_PARAM:
         return "InvalidParameter";
      case SYNTH_ERR_OUT_OF_MEMORY:
         return "OutOfMemory";
   }
   return "Unknown";
}

const char *synth_error_string(synth_error_t err) {
   switch (err) {
      case SYNTH_OK:
         return "Success";
      case SYNTH_ERR_INVALID_INPUT:
         return "Invalid input text";
      case SYNTH_ERR_CHUNKING_FAILED:
         return "Text could not be split into segments";
      case SYNTH_ERR_TIMEOUT:
         return "Speech service request timed out";
      case SYNTH_ERR_RATE_LIMITED:
         return "Rate limit exceeded. Please try again later.";
      case SYNTH_ERR_SERVER_ERROR:
         return "Speech service returned a server error";
      case SYNTH_ERR_NETWORK:
         return "Network error contacting speech service";
      case SYNTH_ERR_INVALID_PAYLOAD:
         return "Speech service returned invalid audio";
      case SYNTH_ERR_TOO_MANY_FAILURES:
         return "Too many segments failed to synthesize";
      case SYNTH_ERR_NO_AUDIO:
         return "No audio was produced";
      case SYNTH_ERR_INVALID_COMBINED_AUDIO:
         return "Combined audio is too small to be valid";
      case SYNTH_ERR_CANCELLED:
         return "Synthesis cancelled";
      case SYNTH_ERR_INVALID_PARAM:
         return "Invalid parameter";
      case SYNTH_ERR_OUT_OF_MEMORY:
         return "Out of memory";
   }
   return "Unknown error";
}

int synth_error_is_retryable(synth_error_t err) {
   return err == SYNTH_ERR_TIMEOUT || err == SYNTH_ERR_RATE_LIMITED ||
          err == SYNTH_ERR_SERVER_ERROR || err == SYNTH_ERR_NETWORK ||
          err == SYNTH_ERR_INVALID_PAYLOAD;
}

} /* extern "C" */
