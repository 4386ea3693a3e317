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
 * @file vaani_tts.cpp
 * @brief vaani-tts command line entry point
 *
 * Reads text from --text, a JSON argument ({"text": ..., "voice": ...}) or
 * stdin, synthesizes it and prints a JSON envelope on stdout:
 *
 *   {"success": true, "audio": "<base64>", "language": "en", "segments": 2,
 *    "warnings": [{"segment": 2, "excerpt": "...", "reason": "Timeout", "attempts": 3}]}
 *
 *   {"success": false, "error": "...", "error_code": "InvalidInput"}
 *
 * Exit status: 0 on success, 1 on synthesis failure, 2 on usage or
 * configuration errors.
 */

#include <errno.h>
#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <curl/curl.h>
#include <json-c/json.h>

#include <string>

#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/vaani_config.h"
#include "core/cancel_token.h"
#include "logging.h"
#include "logging_bridge.h"
#include "tts/http_backend.h"
#include "tts/synth_envelope.h"
#include "tts/synth_orchestrator.h"

#define MAX_CONFIG_ERRORS 32

/* Read from the signal handler; set once before handlers are installed */
static synth_cancel_t *g_cancel = NULL;

typedef struct {
   const char *config_path;
   const char *text;
   const char *voice;
   const char *output_path;
   const char *json_arg;
   bool dump_config;
} cli_options_t;

static void signal_handler(int signum) {
   (void)signum;
   synth_cancel_request_async(g_cancel);
}

static void install_signal_handlers(void) {
   struct sigaction sa;
   memset(&sa, 0, sizeof(sa));
   sa.sa_handler = signal_handler;
   sigemptyset(&sa.sa_mask);
   sigaction(SIGINT, &sa, NULL);
   sigaction(SIGTERM, &sa, NULL);
}

static void print_usage(const char *prog) {
   fprintf(stderr,
           "Usage: %s [OPTIONS] ['{\"text\": \"...\", \"voice\": \"en\"}']\n"
           "\n"
           "Convert text to speech. Text comes from --text, a JSON argument or stdin.\n"
           "\n"
           "Options:\n"
           "  -c, --config=PATH   Configuration file (JSON)\n"
           "  -t, --text=TEXT     Text to synthesize\n"
           "  -v, --voice=VOICE   Voice hint (one of the configured voices)\n"
           "  -o, --output=PATH   Write raw audio to PATH instead of base64 in the envelope\n"
           "      --dump-config   Print the effective configuration and exit\n"
           "  -h, --help          Show this help\n",
           prog);
}

/* Print the envelope and release it */
static void emit_envelope(json_object *envelope) {
   if (!envelope) {
      printf("{\"success\":false,\"error\":\"Out of memory\",\"error_code\":\"%s\"}\n",
             synth_error_name(SYNTH_ERR_OUT_OF_MEMORY));
      fflush(stdout);
      return;
   }
   printf("%s\n", json_object_to_json_string_ext(envelope, JSON_C_TO_STRING_PLAIN));
   fflush(stdout);
   json_object_put(envelope);
}

static void emit_error(const char *message, const char *code) {
   emit_envelope(synth_envelope_error(message, code));
}

static int write_audio(const synth_result_t *result, const char *output_path) {
   FILE *fp = fopen(output_path, "wb");
   if (!fp) {
      LOG_ERROR("Cannot open %s: %s", output_path, strerror(errno));
      return 1;
   }
   size_t written = fwrite(result->audio, 1, result->audio_size, fp);
   if (fclose(fp) != 0 || written != result->audio_size) {
      LOG_ERROR("Short write to %s", output_path);
      return 1;
   }
   return 0;
}

/**
 * @brief Print the envelope for a finished run
 *
 * @return Process exit status
 */
static int emit_result(const synth_result_t *result, const char *output_path) {
   if (result->success && output_path && write_audio(result, output_path) != 0) {
      emit_error("Failed to write audio output", NULL);
      return VAANI_EXIT_SYNTH_FAILED;
   }

   json_object *envelope = synth_envelope_from_result(result, output_path);
   if (!envelope) {
      emit_error("Failed to encode audio", synth_error_name(SYNTH_ERR_OUT_OF_MEMORY));
      return VAANI_EXIT_SYNTH_FAILED;
   }
   emit_envelope(envelope);
   return synth_envelope_exit_code(result);
}

static int read_stream(FILE *fp, std::string *out) {
   char buf[4096];
   size_t n;
   while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) {
      out->append(buf, n);
   }
   return ferror(fp) ? 1 : 0;
}

static int parse_args(int argc, char *argv[], cli_options_t *opts) {
   enum { OPT_DUMP_CONFIG = 256 };
   static struct option long_options[] = { { "config", required_argument, 0, 'c' },
                                            { "text", required_argument, 0, 't' },
                                            { "voice", required_argument, 0, 'v' },
                                            { "output", required_argument, 0, 'o' },
                                            { "dump-config", no_argument, 0, OPT_DUMP_CONFIG },
                                            { "help", no_argument, 0, 'h' },
                                            { 0, 0, 0, 0 } };

   memset(opts, 0, sizeof(*opts));
   int opt;
   while ((opt = getopt_long(argc, argv, "c:t:v:o:h", long_options, NULL)) != -1) {
      switch (opt) {
         case 'c':
            opts->config_path = optarg;
            break;
         case 't':
            opts->text = optarg;
            break;
         case 'v':
            opts->voice = optarg;
            break;
         case 'o':
            opts->output_path = optarg;
            break;
         case OPT_DUMP_CONFIG:
            opts->dump_config = true;
            break;
         case 'h':
            print_usage(argv[0]);
            exit(0);
         default:
            print_usage(argv[0]);
            return 1;
      }
   }

   if (optind < argc) {
      if (argc - optind > 1 || opts->text) {
         fprintf(stderr, "Expected at most one JSON argument and no --text with it\n");
         return 1;
      }
      opts->json_arg = argv[optind];
   }
   return 0;
}

static int load_configuration(const cli_options_t *opts, vaani_config_t *config) {
   config_set_defaults(config);
   if (config_load_from_search(opts->config_path, config) != 0) {
      fprintf(stderr, "Failed to load configuration\n");
      return 1;
   }
   config_apply_env(config);

   config_error_t errors[MAX_CONFIG_ERRORS];
   int error_count = config_validate(config, errors, MAX_CONFIG_ERRORS);
   if (error_count > 0) {
      config_print_errors(errors, error_count < MAX_CONFIG_ERRORS ? error_count : MAX_CONFIG_ERRORS);
      return 1;
   }
   return 0;
}

int main(int argc, char *argv[]) {
   cli_options_t opts;
   if (parse_args(argc, argv, &opts) != 0) {
      return VAANI_EXIT_USAGE;
   }

   logging_bridge_init();

   vaani_config_t config;
   if (load_configuration(&opts, &config) != 0) {
      return VAANI_EXIT_USAGE;
   }

   if (opts.dump_config) {
      config_dump(&config);
      return VAANI_EXIT_OK;
   }

   if (init_logging(config.general.log_file[0] ? config.general.log_file : NULL) != 0) {
      LOG_INFO("Log file unavailable, continuing on stderr");
   }
   log_level_t level;
   if (logging_level_from_name(config.general.log_level, &level) == 0) {
      logging_set_min_level(level);
   }
   LOG_INFO("Configuration: %s", config_get_loaded_path());

   std::string text;
   std::string voice = opts.voice ? opts.voice : "";
   if (opts.json_arg) {
      synth_envelope_request_t request;
      int rc = synth_envelope_parse_request(opts.json_arg, &request);
      if (rc != 0) {
         emit_error(rc == 1 ? "Invalid JSON input" : "Out of memory",
                    synth_error_name(rc == 1 ? SYNTH_ERR_INVALID_INPUT : SYNTH_ERR_OUT_OF_MEMORY));
         close_logging();
         return VAANI_EXIT_USAGE;
      }
      text = request.text;
      if (request.voice[0] != '\0')
         voice = request.voice;
      synth_envelope_request_free(&request);
   } else if (opts.text) {
      text = opts.text;
   } else if (!isatty(STDIN_FILENO)) {
      if (read_stream(stdin, &text) != 0) {
         LOG_ERROR("Failed to read stdin: %s", strerror(errno));
         emit_error("Failed to read input", NULL);
         close_logging();
         return VAANI_EXIT_USAGE;
      }
   } else {
      emit_error("No input provided", synth_error_name(SYNTH_ERR_INVALID_INPUT));
      print_usage(argv[0]);
      close_logging();
      return VAANI_EXIT_USAGE;
   }

   if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      LOG_ERROR("curl_global_init failed");
      emit_error("Failed to initialize HTTP client", synth_error_name(SYNTH_ERR_NETWORK));
      close_logging();
      return VAANI_EXIT_SYNTH_FAILED;
   }

   int exit_code = VAANI_EXIT_SYNTH_FAILED;
   http_backend_t *http = http_backend_create(&config.backend);
   synth_orchestrator_t *orch = NULL;
   if (http) {
      synth_backend_t backend = http_backend_as_synth_backend(http);
      orch = synth_orchestrator_create(&config, &backend);
   }
   g_cancel = synth_cancel_create();

   if (!http || !orch || !g_cancel) {
      emit_error("Failed to initialize synthesis", synth_error_name(SYNTH_ERR_OUT_OF_MEMORY));
   } else {
      install_signal_handlers();

      synth_result_t result;
      synth_orchestrator_synthesize(orch, text.c_str(), voice.c_str(), g_cancel, &result);
      exit_code = emit_result(&result, opts.output_path);
      synth_result_free(&result);
   }

   signal(SIGINT, SIG_DFL);
   signal(SIGTERM, SIG_DFL);
   synth_cancel_free(g_cancel);
   g_cancel = NULL;
   synth_orchestrator_free(orch);
   http_backend_free(http);
   curl_global_cleanup();
   close_logging();
   return exit_code;
}
