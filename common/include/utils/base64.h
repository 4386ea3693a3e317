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
 * Base64 encoding for binary payloads embedded in JSON responses
 */

#ifndef VAANI_COMMON_BASE64_H
#define VAANI_COMMON_BASE64_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Size of the base64 encoding of len bytes (excluding null terminator)
 */
size_t base64_encoded_size(size_t len);

/**
 * @brief Encode binary data as standard (RFC 4648, padded) base64
 *
 * @param data Bytes to encode (may be NULL when len is 0)
 * @param len Number of bytes
 * @param out_len Receives the encoded length, excluding terminator (optional)
 * @return Allocated null-terminated string (caller frees), or NULL on allocation failure
 */
char *base64_encode(const uint8_t *data, size_t len, size_t *out_len);

#ifdef __cplusplus
}
#endif

#endif /* VAANI_COMMON_BASE64_H */
