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
 * @file config_parser.cpp
 * @brief json-c based configuration loading
 */

#include "config/config_parser.h"

#include <json-c/json.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "config/config_fields.h"
#include "logging.h"
#include "utils/utf8_utils.h"

#define CONFIG_PATH_LOCAL "./vaani.json"
#define CONFIG_PATH_HOME_SUFFIX "/.config/vaani/config.json"
#define CONFIG_PATH_ETC "/etc/vaani/config.json"

static char g_loaded_path[CONFIG_PATH_MAX] = "";

static const config_field_t *find_field(const char *section, const char *key) {
   for (size_t i = 0; i < g_config_field_count; i++) {
      if (strcmp(g_config_fields[i].section, section) == 0 &&
          strcmp(g_config_fields[i].key, key) == 0) {
         return &g_config_fields[i];
      }
   }
   return NULL;
}

static int section_known(const char *section) {
   for (size_t i = 0; i < g_config_field_count; i++) {
      if (strcmp(g_config_fields[i].section, section) == 0) {
         return 1;
      }
   }
   return 0;
}

static int parse_voices(json_object *value, vaani_config_t *config) {
   if (!json_object_is_type(value, json_type_array)) {
      LOG_ERROR("Config: \"voices\" must be an array of strings");
      return 1;
   }

   size_t count = json_object_array_length(value);
   if (count > CONFIG_MAX_VOICES) {
      LOG_ERROR("Config: at most %d voices allowed (got %zu)", CONFIG_MAX_VOICES, count);
      return 1;
   }

   voices_config_t voices;
   memset(&voices, 0, sizeof(voices));
   for (size_t i = 0; i < count; i++) {
      json_object *item = json_object_array_get_idx(value, i);
      if (!json_object_is_type(item, json_type_string)) {
         LOG_ERROR("Config: voices[%zu] is not a string", i);
         return 1;
      }
      const char *name = json_object_get_string(item);
      if (strlen(name) == 0 || strlen(name) >= CONFIG_VOICE_MAX) {
         LOG_ERROR("Config: voices[%zu] has invalid length", i);
         return 1;
      }
      safe_strncpy(voices.names[voices.count++], name, CONFIG_VOICE_MAX);
   }

   config->voices = voices;
   return 0;
}

static int apply_field(const config_field_t *field, json_object *value, vaani_config_t *config) {
   if (field->type == CONFIG_FIELD_INT) {
      if (!json_object_is_type(value, json_type_int)) {
         LOG_ERROR("Config: %s.%s must be an integer", field->section, field->key);
         return 1;
      }
      *config_field_int(config, field) = json_object_get_int(value);
      return 0;
   }

   if (!json_object_is_type(value, json_type_string)) {
      LOG_ERROR("Config: %s.%s must be a string", field->section, field->key);
      return 1;
   }
   const char *str = json_object_get_string(value);
   if (strlen(str) >= field->size) {
      LOG_ERROR("Config: %s.%s is too long (max %zu bytes)", field->section, field->key,
                field->size - 1);
      return 1;
   }
   safe_strncpy(config_field_str(config, field), str, field->size);
   return 0;
}

static int apply_json(json_object *root, vaani_config_t *config) {
   if (!json_object_is_type(root, json_type_object)) {
      LOG_ERROR("Config: top level must be a JSON object");
      return 1;
   }

   int errors = 0;
   json_object_object_foreach(root, section, section_obj) {
      if (strcmp(section, "voices") == 0) {
         errors += parse_voices(section_obj, config);
         continue;
      }
      if (!section_known(section)) {
         LOG_WARNING("Config: ignoring unknown section \"%s\"", section);
         continue;
      }
      if (!json_object_is_type(section_obj, json_type_object)) {
         LOG_ERROR("Config: section \"%s\" must be an object", section);
         errors++;
         continue;
      }

      json_object_object_foreach(section_obj, key, value) {
         const config_field_t *field = find_field(section, key);
         if (!field) {
            LOG_WARNING("Config: ignoring unknown key %s.%s", section, key);
            continue;
         }
         errors += apply_field(field, value, config);
      }
   }
   return errors ? 1 : 0;
}

extern "C" {

int config_parse_string(const char *json, vaani_config_t *config) {
   if (!json || !config)
      return 1;

   enum json_tokener_error jerr = json_tokener_success;
   json_object *root = json_tokener_parse_verbose(json, &jerr);
   if (!root) {
      LOG_ERROR("Config: invalid JSON: %s", json_tokener_error_desc(jerr));
      return 1;
   }

   int rc = apply_json(root, config);
   json_object_put(root);
   return rc;
}

int config_parse_file(const char *path, vaani_config_t *config) {
   if (!path || !config)
      return 1;

   json_object *root = json_object_from_file(path);
   if (!root) {
      LOG_ERROR("Config: failed to parse %s: %s", path, json_util_get_last_err());
      return 1;
   }

   int rc = apply_json(root, config);
   json_object_put(root);
   if (rc == 0) {
      LOG_INFO("Loaded configuration from %s", path);
   }
   return rc;
}

int config_file_readable(const char *path) {
   return path && access(path, R_OK) == 0;
}

int config_load_from_search(const char *explicit_path, vaani_config_t *config) {
   g_loaded_path[0] = '\0';

   if (explicit_path) {
      if (!config_file_readable(explicit_path)) {
         LOG_ERROR("Config file not readable: %s", explicit_path);
         return 1;
      }
      if (config_parse_file(explicit_path, config) != 0) {
         return 1;
      }
      safe_strncpy(g_loaded_path, explicit_path, sizeof(g_loaded_path));
      return 0;
   }

   char home_path[CONFIG_PATH_MAX] = "";
   const char *home = getenv("HOME");
   if (home) {
      snprintf(home_path, sizeof(home_path), "%s%s", home, CONFIG_PATH_HOME_SUFFIX);
   }

   const char *candidates[] = { CONFIG_PATH_LOCAL, home_path, CONFIG_PATH_ETC };
   for (size_t i = 0; i < sizeof(candidates) / sizeof(candidates[0]); i++) {
      if (candidates[i][0] == '\0' || !config_file_readable(candidates[i])) {
         continue;
      }
      if (config_parse_file(candidates[i], config) != 0) {
         return 1;
      }
      safe_strncpy(g_loaded_path, candidates[i], sizeof(g_loaded_path));
      return 0;
   }

   LOG_INFO("No configuration file found, using defaults");
   return 0;
}

const char *config_get_loaded_path(void) {
   return g_loaded_path[0] ? g_loaded_path : "(none - using defaults)";
}

} /* extern "C" */
