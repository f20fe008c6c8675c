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
#include <string>
#include "headers.h"

struct MirrorMetric;

enum class EventType {
    Request,
    Attempt,
    TokenExchange,
    RateLimited,
    Backoff,
    Redirect,
    CdnFallback,
    LastResort,
    Exhausted,
    Completed,
};

const char *event_name(EventType type);

struct ProxyEvent {
    EventType type;
    std::string registry;
    std::string path;    // upstream path or the url being fetched
    int attempt = 0;
    int status = 0;
    int error = 0;       // errno or -1 for a failed exchange
    uint64_t value = 0;  // backoff delay in us, or bytes relayed
    uint64_t elapsed = 0;
    std::string detail;  // target host, user agent or error kind
    HeaderList headers;  // rate-limit headers
};

class EventSink {
public:
    virtual ~EventSink() {}
    virtual void emit(const ProxyEvent &event) = 0;
};

// Writes each event to the log and counts it in `metric` when set.
class LogEventSink : public EventSink {
public:
    explicit LogEventSink(MirrorMetric *metric = nullptr) : m_metric(metric) {}
    void emit(const ProxyEvent &event) override;

private:
    MirrorMetric *m_metric;
};
