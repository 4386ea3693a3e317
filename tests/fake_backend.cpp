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

#include "fake_backend.h"

#include "core/cancel_token.h"

namespace vaani_test {

FakeReply audio_reply(size_t min_size) {
   FakeReply reply;
   reply.body = std::string("ID3\x04\x00\x00", 6);
   reply.body.append(min_size > reply.body.size() ? min_size - reply.body.size() : 0, '\x55');
   reply.echo_text = true;
   return reply;
}

FakeReply http_reply(long status, const std::string &body) {
   FakeReply reply;
   reply.status = status;
   reply.body = body;
   return reply;
}

FakeReply transport_reply(synth_transport_t transport) {
   FakeReply reply;
   reply.transport = transport;
   reply.status = 0;
   return reply;
}

FakeBackend::FakeBackend(std::vector<FakeReply> script) : script_(std::move(script)) {}

synth_backend_t FakeBackend::backend() {
   synth_backend_t backend;
   backend.fetch = &FakeBackend::fetch;
   backend.userdata = this;
   backend.name = "fake";
   return backend;
}

int FakeBackend::calls() const {
   std::lock_guard<std::mutex> lock(mutex_);
   return static_cast<int>(texts_.size());
}

std::vector<std::string> FakeBackend::texts() const {
   std::lock_guard<std::mutex> lock(mutex_);
   return texts_;
}

std::vector<std::string> FakeBackend::langs() const {
   std::lock_guard<std::mutex> lock(mutex_);
   return langs_;
}

int FakeBackend::fetch(void *userdata, const synth_request_t *request, synth_response_t *response) {
   FakeBackend *self = static_cast<FakeBackend *>(userdata);
   std::string text = request->text;

   int index;
   {
      std::lock_guard<std::mutex> lock(self->mutex_);
      index = static_cast<int>(self->texts_.size());
      self->texts_.push_back(text);
      self->langs_.push_back(request->lang);
   }

   if (synth_cancel_sleep_ms(request->cancel, self->fetch_delay_ms_)) {
      response->transport = SYNTH_TRANSPORT_CANCELLED;
      return 0;
   }

   FakeReply reply;
   if (self->rule_) {
      reply = self->rule_(index, text);
   } else if (!self->script_.empty()) {
      size_t at = static_cast<size_t>(index) < self->script_.size() ? index
                                                                    : self->script_.size() - 1;
      reply = self->script_[at];
   }

   response->transport = reply.transport;
   response->http_status = reply.transport == SYNTH_TRANSPORT_OK ? reply.status : 0;
   std::string body = reply.body;
   if (reply.echo_text) {
      body += "|" + text;
   }
   if (reply.transport == SYNTH_TRANSPORT_OK && !body.empty()) {
      return synth_response_set_body(response, body.data(), body.size());
   }
   return 0;
}

vaani_config_t fast_config() {
   vaani_config_t config;
   config_set_defaults(&config);
   config.retry.retry_delay_ms = 0;
   config.retry.rate_limit_backoff_ms = 0;
   config.dispatch.pacing_delay_ms = 0;
   return config;
}

}  // namespace vaani_test
