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
 * vaani Configuration Environment - Environment variable overrides
 */

#ifndef CONFIG_ENV_H
#define CONFIG_ENV_H

#include "config/vaani_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Apply environment variable overrides to configuration
 *
 * Environment variable format: VAANI_<SECTION>_<KEY>
 * Examples:
 *   VAANI_RETRY_MAX_ATTEMPTS=5
 *   VAANI_DISPATCH_PACING_DELAY_MS=250
 *   VAANI_BACKEND_ENDPOINT=https://tts.example.com/speak
 *   VAANI_VOICES=en,hi
 *
 * Malformed integers are logged and ignored.
 *
 * @param config Config struct to modify
 * @return Number of overrides applied
 */
int config_apply_env(vaani_config_t *config);

/**
 * @brief Environment variable name for a setting
 *
 * @param section Section name ("retry")
 * @param key Key name ("max_attempts")
 * @param out Buffer for the name ("VAANI_RETRY_MAX_ATTEMPTS")
 * @param out_size Size of out
 */
void config_env_name(const char *section, const char *key, char *out, size_t out_size);

/**
 * @brief Dump configuration to stdout
 *
 * Prints every setting as section.key = value, followed by its environment
 * variable name. Used by the --dump-config CLI option.
 *
 * @param config Configuration to dump
 */
void config_dump(const vaani_config_t *config);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_ENV_H */
