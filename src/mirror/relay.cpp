/*
   Copyright The Overlaybd Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
#include "relay.h"

#include <errno.h>
#include <memory>
#include <photon/common/alog-stdstring.h>
#include "executor.h"

bool relayable_header(std::string_view key) {
    return !is_hop_by_hop(key);
}

static bool has_body(const ResolvedRequest &req, int status) {
    return req.verb != Verb::HEAD && status != 204 && status != 304 && status >= 200;
}

int ResponseRelay::relay(const ResolvedRequest &req, UpstreamResponse *resp,
                         DownstreamWriter *out, RelayStats *stats, Cancellation *cancel) {
    auto status = resp->status();
    stats->status = status;
    stats->bytes = 0;
    stats->complete = false;
    out->set_status(status);
    auto headers = resp->headers();
    for (auto &h : headers) {
        if (relayable_header(h.first))
            out->add_header(h.first, h.second);
    }

    if (status == 403 || status == 429) {
        auto limits = rate_limit_headers(headers);
        if (!limits.empty()) {
            if (m_events) {
                ProxyEvent ev{EventType::RateLimited};
                ev.registry = req.registry ? req.registry->id : "";
                ev.path = req.upstream_path;
                ev.status = status;
                ev.detail = "relayed";
                ev.headers = std::move(limits);
                m_events->emit(ev);
            }
        }
    }

    auto length = resp->content_length();
    if (!has_body(req, status)) {
        if (length >= 0)
            out->set_content_length(length);
        else
            out->set_content_length(0);
        stats->complete = true;
        return 0;
    }
    if (length >= 0)
        out->set_content_length(length);
    else
        out->set_keep_alive(false);

    std::unique_ptr<char[]> buf(new char[m_buffer_size]);
    while (length < 0 || stats->bytes < (uint64_t)length) {
        auto n = resp->read(buf.get(), m_buffer_size);
        if (n < 0)
            LOG_ERRNO_RETURN(0, -1, "upstream body of ` broke off after ` bytes",
                             req.upstream_path, stats->bytes);
        if (n == 0)
            break;
        auto w = out->write(buf.get(), n);
        if (w != n) {
            if (cancel)
                cancel->cancel();
            LOG_ERRNO_RETURN(0, -1, "client went away during ` after ` bytes", req.upstream_path,
                             stats->bytes);
        }
        stats->bytes += n;
    }
    if (length >= 0 && stats->bytes < (uint64_t)length)
        LOG_ERROR_RETURN(EPIPE, -1, "short upstream body for `: ` of ` bytes", req.upstream_path,
                         stats->bytes, length);
    stats->complete = true;
    return 0;
}

int ResponseRelay::relay_error(ProxyError err, int transport_errno, std::string_view message,
                               DownstreamWriter *out, RelayStats *stats) {
    auto body = error_body(err, message);
    stats->status = error_status(err, transport_errno);
    stats->bytes = 0;
    stats->complete = false;
    out->set_status(stats->status);
    out->add_header("Content-Type", "application/json; charset=utf-8");
    out->add_header("Docker-Distribution-Api-Version", "registry/2.0");
    out->set_content_length(body.size());
    auto w = out->write(body.data(), body.size());
    if (w != (ssize_t)body.size())
        LOG_ERRNO_RETURN(0, -1, "failed to send error response");
    stats->bytes = body.size();
    stats->complete = true;
    return 0;
}
