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
#pragma once

#include <stdint.h>
#include <memory>
#include <string>
#include <string_view>
#include "headers.h"
#include "path_resolver.h"
#include "transport.h"

enum class OutcomeKind {
    Success,
    Redirect,
    RateLimited,
    Unauthorized,
    TransportError,
};

const char *outcome_name(OutcomeKind kind);

struct Outcome {
    OutcomeKind kind = OutcomeKind::TransportError;
    int status = -1;
    int error = 0;        // errno of a failed exchange
    std::string url;      // what was fetched
    std::string host;
    std::string location; // absolute redirect target
    std::unique_ptr<UpstreamResponse> response;
};

struct ExecutorOptions {
    uint64_t request_timeout = 30UL * 1000 * 1000;
    uint64_t blob_timeout = 300UL * 1000 * 1000;
};

// RateLimit-*, X-RateLimit-*, Docker-RateLimit-Source and Retry-After
HeaderList rate_limit_headers(const HeaderList &headers);

// 429, or 403 whose rate-limit headers report nothing remaining
bool is_rate_limited(int status, const HeaderList &headers);

OutcomeKind classify(int status, const HeaderList &headers);

// `location` made absolute against `base`
std::string resolve_location(std::string_view base, std::string_view location);

// Header set of one upstream attempt: the client's headers minus hop-by-hop
// ones, `authorization` when given, the user agent and the Docker client
// headers. `minimal` keeps only Range and Accept from the client.
HeaderList upstream_headers(const ResolvedRequest &req, std::string_view authorization,
                            std::string_view user_agent, bool minimal = false);

// for redirect and cdn targets: never carries Authorization, keeps Range
HeaderList storage_headers(const ResolvedRequest &req, std::string_view user_agent);

class UpstreamExecutor {
public:
    UpstreamExecutor(UpstreamTransport *transport, const ExecutorOptions &opts = {})
        : m_transport(transport), m_opts(opts) {}

    uint64_t timeout_for(const ResolvedRequest &req) const {
        return req.is_blob ? m_opts.blob_timeout : m_opts.request_timeout;
    }

    // one attempt against the registry's primary host
    Outcome execute(const ResolvedRequest &req, std::string_view authorization,
                    std::string_view user_agent, bool minimal = false);

    // one attempt against an arbitrary url with the given headers, no body
    Outcome fetch(const ResolvedRequest &req, const std::string &url, HeaderList headers);

private:
    Outcome finish(UpstreamRequest &ureq);

    UpstreamTransport *m_transport;
    ExecutorOptions m_opts;
};
