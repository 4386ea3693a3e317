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
 * vaani Configuration - Field table shared by the parser, env overrides and dump
 *
 * Internal header: only the config modules include this.
 */

#ifndef CONFIG_FIELDS_H
#define CONFIG_FIELDS_H

#include <stddef.h>

#include "config/vaani_config.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
   CONFIG_FIELD_INT,
   CONFIG_FIELD_STRING,
} config_field_type_t;

/**
 * @brief Describes one scalar setting: its TOML-style path and its storage
 */
typedef struct {
   const char *section;      /* JSON object name, e.g. "retry" */
   const char *key;          /* Key inside the section, e.g. "max_attempts" */
   config_field_type_t type;
   size_t offset;            /* offsetof() into vaani_config_t */
   size_t size;              /* Buffer size for strings, 0 for ints */
} config_field_t;

extern const config_field_t g_config_fields[];
extern const size_t g_config_field_count;

static inline int *config_field_int(vaani_config_t *config, const config_field_t *field) {
   return (int *)((char *)config + field->offset);
}

static inline const int *config_field_int_const(const vaani_config_t *config,
                                                const config_field_t *field) {
   return (const int *)((const char *)config + field->offset);
}

static inline char *config_field_str(vaani_config_t *config, const config_field_t *field) {
   return (char *)config + field->offset;
}

static inline const char *config_field_str_const(const vaani_config_t *config,
                                                 const config_field_t *field) {
   return (const char *)config + field->offset;
}

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_FIELDS_H */
