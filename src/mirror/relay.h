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
#include <string_view>
#include "cancellation.h"
#include "errors.h"
#include "events.h"
#include "path_resolver.h"
#include "transport.h"

// The client side of one exchange.
class DownstreamWriter {
public:
    virtual ~DownstreamWriter() {}
    virtual void set_status(int status) = 0;
    virtual void add_header(std::string_view key, std::string_view value) = 0;
    virtual void set_content_length(uint64_t length) = 0;
    // without a length the connection is closed after the body
    virtual void set_keep_alive(bool keep) = 0;
    virtual ssize_t write(const void *buf, size_t count) = 0;
};

struct RelayStats {
    int status = 0;
    uint64_t bytes = 0;
    bool complete = false;
};

// headers that stay between the proxy and the upstream
bool relayable_header(std::string_view key);

class ResponseRelay {
public:
    explicit ResponseRelay(EventSink *events = nullptr, size_t buffer_size = 64 * 1024)
        : m_events(events), m_buffer_size(buffer_size) {}

    // Streams `resp` to `out` through a fixed buffer. -1 when the upstream
    // body broke off or the client stopped reading; a failed client write
    // also cancels `cancel`.
    int relay(const ResolvedRequest &req, UpstreamResponse *resp, DownstreamWriter *out,
              RelayStats *stats, Cancellation *cancel = nullptr);

    // Registry-style json error for failures without an upstream response
    int relay_error(ProxyError err, int transport_errno, std::string_view message,
                    DownstreamWriter *out, RelayStats *stats);

private:
    EventSink *m_events;
    size_t m_buffer_size;
};
