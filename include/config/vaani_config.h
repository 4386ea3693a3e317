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
 *
 * vaani Configuration System - Main configuration struct definitions
 *
 * Thread Safety: Configuration is loaded once at startup and read-only during
 * runtime. The orchestrator keeps its own copy, so runs never observe a
 * configuration change mid-flight.
 */

#ifndef VAANI_CONFIG_H
#define VAANI_CONFIG_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Buffer Size Constants
 * ============================================================================= */
#define CONFIG_PATH_MAX 256
#define CONFIG_URL_MAX 256
#define CONFIG_NAME_MAX 64
#define CONFIG_LEVEL_MAX 16
#define CONFIG_BOUNDARIES_MAX 64
#define CONFIG_VOICE_MAX 16
#define CONFIG_MAX_VOICES 8

/* =============================================================================
 * Defaults
 * ============================================================================= */
#define DEFAULT_MAX_INPUT_CHARS 2000
#define DEFAULT_MAX_INPUT_BYTES 3000
#define DEFAULT_MAX_SEGMENT_CHARS 190
#define DEFAULT_MAX_ATTEMPTS 3
#define DEFAULT_REQUEST_TIMEOUT_SEC 30
#define DEFAULT_RETRY_DELAY_MS 1000
#define DEFAULT_RATE_LIMIT_BACKOFF_MS 2000
#define DEFAULT_PACING_DELAY_MS 500
#define DEFAULT_EXCERPT_CHARS 50
#define DEFAULT_MIN_AUDIO_BYTES 100
#define DEFAULT_BACKEND_ENDPOINT "https://translate.google.com/translate_tts"
#define DEFAULT_BACKEND_CLIENT "tw-ob"
#define DEFAULT_USER_AGENT "vaani/1.0 (speech synthesis client)"
#define DEFAULT_MAX_RESPONSE_BYTES (4 * 1024 * 1024)

/* =============================================================================
 * General Configuration
 * ============================================================================= */
typedef struct {
   char log_file[CONFIG_PATH_MAX];   /* Empty = stderr, or path */
   char log_level[CONFIG_LEVEL_MAX]; /* "info", "warning", "error" */
} general_config_t;

/* =============================================================================
 * Input Limits
 * ============================================================================= */
typedef struct {
   int max_input_chars; /* Code point ceiling for one request */
   int max_input_bytes; /* UTF-8 byte ceiling for one request */
} limits_config_t;

/* =============================================================================
 * Chunking Configuration
 * ============================================================================= */
typedef struct {
   int max_segment_chars;                  /* Segment cap in code points */
   char boundaries[CONFIG_BOUNDARIES_MAX]; /* UTF-8 sentence boundary characters */
} chunking_config_t;

/* =============================================================================
 * Retry Configuration
 * ============================================================================= */
typedef struct {
   int max_attempts;          /* Attempts per segment, shared across error types */
   int request_timeout_sec;   /* Per-attempt timeout */
   int retry_delay_ms;        /* Delay after timeout/server/network/payload failures */
   int rate_limit_backoff_ms; /* Multiplied by the attempt number after a 429 */
} retry_config_t;

/* =============================================================================
 * Dispatch Configuration
 * ============================================================================= */
typedef struct {
   int pacing_delay_ms; /* Delay between consecutive segments */
   int excerpt_chars;   /* Segment excerpt length in failure reports */
} dispatch_config_t;

/* =============================================================================
 * Payload Validation
 * ============================================================================= */
typedef struct {
   int min_audio_bytes; /* Smallest plausible segment and combined payload */
} payload_config_t;

/* =============================================================================
 * Remote Backend
 * ============================================================================= */
typedef struct {
   char endpoint[CONFIG_URL_MAX];    /* Synthesis URL (query parameters appended) */
   char client[CONFIG_NAME_MAX];     /* Value of the "client" query parameter */
   char user_agent[CONFIG_URL_MAX];  /* User-Agent header */
   int max_response_bytes;           /* Per-attempt download cap */
} backend_config_t;

/* =============================================================================
 * Voice Hints
 * ============================================================================= */
typedef struct {
   char names[CONFIG_MAX_VOICES][CONFIG_VOICE_MAX]; /* Accepted voice hints */
   int count;
} voices_config_t;

/* =============================================================================
 * Complete configuration
 * ============================================================================= */
typedef struct {
   general_config_t general;
   limits_config_t limits;
   chunking_config_t chunking;
   retry_config_t retry;
   dispatch_config_t dispatch;
   payload_config_t payload;
   backend_config_t backend;
   voices_config_t voices;
} vaani_config_t;

/**
 * @brief Fill a config struct with built-in defaults
 *
 * @param config Config to initialize
 */
void config_set_defaults(vaani_config_t *config);

/**
 * @brief Check whether a voice hint is in the configured list
 *
 * @return true if voice matches one of config->voices.names
 */
bool config_voice_allowed(const vaani_config_t *config, const char *voice);

/**
 * @brief Replace the voice list from a comma-separated string ("en,hi")
 *
 * Empty items are skipped and surrounding spaces stripped.
 *
 * @return 0 on success, 1 if more than CONFIG_MAX_VOICES names or a name is too long
 */
int config_set_voices_csv(vaani_config_t *config, const char *csv);

#ifdef __cplusplus
}
#endif

#endif /* VAANI_CONFIG_H */
