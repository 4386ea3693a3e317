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
 * vaani Configuration Parser - JSON file parsing interface
 */

#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config/vaani_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Parse a JSON configuration file into a config struct
 *
 * Fields not specified in the file retain their current values. Unknown
 * sections and keys are logged and ignored; a value of the wrong type is an
 * error.
 *
 * Example:
 * @code
 * {
 *   "retry":  { "max_attempts": 5, "retry_delay_ms": 500 },
 *   "voices": [ "en", "hi" ]
 * }
 * @endcode
 *
 * @param path Path to the JSON config file
 * @param config Config struct to populate (should be pre-initialized with defaults)
 * @return 0 on success (SUCCESS), 1 on failure (FAILURE)
 */
int config_parse_file(const char *path, vaani_config_t *config);

/**
 * @brief Parse configuration from a JSON string
 *
 * @param json JSON text
 * @param config Config struct to populate
 * @return 0 on success, 1 on failure
 */
int config_parse_string(const char *json, vaani_config_t *config);

/**
 * @brief Check if a configuration file exists and is readable
 *
 * Note: This function returns a boolean (true/false), NOT SUCCESS/FAILURE.
 *
 * @param path Path to check
 * @return true (non-zero) if file exists and is readable, false (0) otherwise
 */
int config_file_readable(const char *path);

/**
 * @brief Find and load the configuration file
 *
 * Searches for config files in order:
 * 1. --config=PATH (if provided; failure to read it is an error)
 * 2. ./vaani.json
 * 3. ~/.config/vaani/config.json
 * 4. /etc/vaani/config.json
 *
 * @param explicit_path Explicit path from command line (NULL to use search)
 * @param config Config struct to populate
 * @return 0 on success or when no file was found (defaults kept), 1 on parse error
 */
int config_load_from_search(const char *explicit_path, vaani_config_t *config);

/**
 * @brief Get the path to the loaded config file
 *
 * @return Path string, or "(none - using defaults)" if no file was loaded
 */
const char *config_get_loaded_path(void);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_PARSER_H */
