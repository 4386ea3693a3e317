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
 * @file config_env.cpp
 * @brief VAANI_* environment overrides and configuration dump
 */

#include "config/config_env.h"

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "config/config_fields.h"
#include "config/config_parser.h"
#include "logging.h"
#include "utils/utf8_utils.h"

#define CONFIG_ENV_PREFIX "VAANI_"
#define CONFIG_ENV_NAME_MAX 96

extern "C" {

void config_env_name(const char *section, const char *key, char *out, size_t out_size) {
   if (!out || out_size == 0)
      return;

   snprintf(out, out_size, CONFIG_ENV_PREFIX "%s_%s", section ? section : "", key ? key : "");
   for (char *p = out; *p; p++) {
      *p = (char)toupper((unsigned char)*p);
   }
}

int config_apply_env(vaani_config_t *config) {
   if (!config)
      return 0;

   int applied = 0;
   char name[CONFIG_ENV_NAME_MAX];

   for (size_t i = 0; i < g_config_field_count; i++) {
      const config_field_t *field = &g_config_fields[i];
      config_env_name(field->section, field->key, name, sizeof(name));

      const char *value = getenv(name);
      if (!value) {
         continue;
      }

      if (field->type == CONFIG_FIELD_INT) {
         char *end = NULL;
         errno = 0;
         long parsed = strtol(value, &end, 10);
         if (errno != 0 || end == value || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
            LOG_WARNING("Ignoring %s: \"%s\" is not an integer", name, value);
            continue;
         }
         *config_field_int(config, field) = (int)parsed;
      } else {
         if (strlen(value) >= field->size) {
            LOG_WARNING("Ignoring %s: value longer than %zu bytes", name, field->size - 1);
            continue;
         }
         safe_strncpy(config_field_str(config, field), value, field->size);
      }
      applied++;
   }

   const char *voices = getenv(CONFIG_ENV_PREFIX "VOICES");
   if (voices) {
      if (config_set_voices_csv(config, voices) == 0) {
         applied++;
      } else {
         LOG_WARNING("Ignoring " CONFIG_ENV_PREFIX "VOICES: too many or too long voice names");
      }
   }

   if (applied > 0) {
      LOG_INFO("Applied %d environment override(s)", applied);
   }
   return applied;
}

void config_dump(const vaani_config_t *config) {
   if (!config)
      return;

   char name[CONFIG_ENV_NAME_MAX];
   printf("# Configuration file: %s\n", config_get_loaded_path());

   for (size_t i = 0; i < g_config_field_count; i++) {
      const config_field_t *field = &g_config_fields[i];
      config_env_name(field->section, field->key, name, sizeof(name));

      if (field->type == CONFIG_FIELD_INT) {
         printf("%s.%s = %d  (%s)\n", field->section, field->key,
                *config_field_int_const(config, field), name);
      } else {
         printf("%s.%s = \"%s\"  (%s)\n", field->section, field->key,
                config_field_str_const(config, field), name);
      }
   }

   printf("voices = [");
   for (int i = 0; i < config->voices.count; i++) {
      printf("%s\"%s\"", i ? ", " : "", config->voices.names[i]);
   }
   printf("]  (" CONFIG_ENV_PREFIX "VOICES)\n");
}

} /* extern "C" */
