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
#include <sys/types.h>
#include <string>
#include <string_view>
#include <photon/net/http/verb.h>
#include "headers.h"

using Verb = photon::net::http::Verb;

const char *verb_name(Verb verb);

// Forward-only request body, read at most once.
class RequestBody {
public:
    virtual ~RequestBody() {}
    virtual ssize_t read(void *buf, size_t count) = 0;
};

// body_size of a body sent with chunked transfer encoding
const uint64_t kUnknownBodySize = -1UL;

// Size of the body announced by inbound `headers`. False when the request
// carries none, kUnknownBodySize for a chunked body.
bool request_body_size(const HeaderList &headers, uint64_t *size);

struct UpstreamRequest {
    Verb verb = Verb::GET;
    std::string url;
    HeaderList headers;
    uint64_t timeout = -1UL; // per attempt, in us
    RequestBody *body = nullptr;
    uint64_t body_size = 0; // or kUnknownBodySize
};

class UpstreamResponse {
public:
    virtual ~UpstreamResponse() {}
    // HTTP status, or -1 when no response arrived; error() holds the errno then
    virtual int status() const = 0;
    virtual int error() const = 0;
    virtual std::string_view header(std::string_view key) const = 0;
    virtual HeaderList headers() const = 0;
    // -1 when the upstream sent no Content-Length
    virtual ssize_t content_length() const = 0;
    virtual ssize_t read(void *buf, size_t count) = 0;
};

// One HTTP exchange per call, no redirect following and no retry.
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() {}
    // never nullptr, connection failures surface as status() == -1
    virtual UpstreamResponse *call(UpstreamRequest &req) = 0;
};

UpstreamTransport *new_photon_transport();
