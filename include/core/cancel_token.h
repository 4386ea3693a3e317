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
 * Cancellation token for synthesis runs
 *
 * A run blocks only in three places: the HTTP attempt, retry backoff, and the
 * pacing delay between segments. All three consult a token so a caller can
 * stop a run promptly from another thread or from a signal handler.
 *
 * Thread Safety: synth_cancel_request() and synth_cancel_is_requested() may be
 * called from any thread. synth_cancel_request_async() only performs a
 * lock-free atomic store and is safe to call from a signal handler; sleepers
 * notice it within CANCEL_POLL_INTERVAL_MS.
 */

#ifndef CANCEL_TOKEN_H
#define CANCEL_TOKEN_H

#ifdef __cplusplus
extern "C" {
#endif

/* Longest a sleeper waits before re-checking an async cancellation */
#define CANCEL_POLL_INTERVAL_MS 100

/**
 * @brief Cancellation token (opaque type)
 */
typedef struct synth_cancel synth_cancel_t;

/**
 * @brief Create a new, un-cancelled token
 *
 * @return Token, or NULL on allocation failure
 */
synth_cancel_t *synth_cancel_create(void);

/**
 * @brief Free a token (can be NULL)
 *
 * No thread may be sleeping on the token when it is freed.
 */
void synth_cancel_free(synth_cancel_t *token);

/**
 * @brief Request cancellation and wake every sleeper immediately
 */
void synth_cancel_request(synth_cancel_t *token);

/**
 * @brief Request cancellation from a signal handler (async-signal-safe)
 */
void synth_cancel_request_async(synth_cancel_t *token);

/**
 * @brief Check whether cancellation was requested
 *
 * @param token Token, or NULL (never cancelled)
 * @return 1 if cancelled, 0 otherwise
 */
int synth_cancel_is_requested(const synth_cancel_t *token);

/**
 * @brief Sleep for ms milliseconds unless cancelled first
 *
 * @param token Token to watch, or NULL for an uninterruptible sleep
 * @param ms Duration in milliseconds (<= 0 returns immediately)
 * @return 1 if the token is cancelled (before or during the sleep), 0 otherwise
 */
int synth_cancel_sleep_ms(synth_cancel_t *token, int ms);

#ifdef __cplusplus
}
#endif

#endif /* CANCEL_TOKEN_H */
