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
#include "events.h"

#include <photon/common/alog-stdstring.h>
#include "metric.h"

const char *event_name(EventType type) {
    switch (type) {
    case EventType::Request:
        return "request";
    case EventType::Attempt:
        return "attempt";
    case EventType::TokenExchange:
        return "token_exchange";
    case EventType::RateLimited:
        return "rate_limited";
    case EventType::Backoff:
        return "backoff";
    case EventType::Redirect:
        return "redirect";
    case EventType::CdnFallback:
        return "cdn_fallback";
    case EventType::LastResort:
        return "last_resort";
    case EventType::Exhausted:
        return "exhausted";
    case EventType::Completed:
        return "completed";
    }
    return "unknown";
}

static std::string format_headers(const HeaderList &headers) {
    std::string ret;
    for (auto &h : headers) {
        if (!ret.empty())
            ret += ", ";
        ret.append(h.first).append("=").append(h.second);
    }
    return ret;
}

void LogEventSink::emit(const ProxyEvent &e) {
    switch (e.type) {
    case EventType::Request:
        LOG_DEBUG("[`] request ` `", e.registry, e.detail, e.path);
        if (m_metric)
            m_metric->requests.inc();
        break;
    case EventType::Attempt:
        LOG_DEBUG("[`] attempt ` ` -> status=`, errno=`", e.registry, e.attempt, e.path, e.status,
                  e.error);
        if (m_metric)
            m_metric->attempts.inc();
        break;
    case EventType::TokenExchange:
        if (e.error) {
            LOG_WARN("[`] token exchange for ` failed, status=`", e.registry, e.detail, e.status);
        } else {
            LOG_INFO("[`] token exchange for ` succeeded", e.registry, e.detail);
        }
        if (m_metric) {
            m_metric->token_exchanges.inc();
            if (e.error)
                m_metric->token_failures.inc();
        }
        break;
    case EventType::RateLimited:
        LOG_WARN("[`] rate limited on `, status=`, `", e.registry, e.path, e.status,
                 format_headers(e.headers));
        if (m_metric && e.detail != "relayed")
            m_metric->rate_limited.inc();
        break;
    case EventType::Backoff:
        LOG_INFO("[`] backoff ` ms before attempt `, user-agent `", e.registry, e.value / 1000,
                 e.attempt + 1, e.detail);
        if (m_metric)
            m_metric->retries.inc();
        break;
    case EventType::Redirect:
        LOG_DEBUG("[`] redirect to `", e.registry, e.path);
        if (m_metric)
            m_metric->redirects.inc();
        break;
    case EventType::CdnFallback:
        LOG_INFO("[`] fall back to cdn host `", e.registry, e.detail);
        if (m_metric)
            m_metric->cdn_fallbacks.inc();
        break;
    case EventType::LastResort:
        LOG_WARN("[`] last resort attempt for ` -> status=`", e.registry, e.path, e.status);
        if (m_metric)
            m_metric->last_resorts.inc();
        break;
    case EventType::Exhausted:
        LOG_ERROR("[`] ` exhausted after ` attempts, last status=`, errno=`", e.registry, e.path,
                  e.attempt, e.status, e.error);
        if (m_metric)
            m_metric->failures.inc();
        break;
    case EventType::Completed:
        LOG_INFO("[`] ` ` -> `, ` bytes in ` us", e.registry, e.detail, e.path, e.status,
                 e.value, e.elapsed);
        if (m_metric) {
            m_metric->bytes.add(e.value);
            m_metric->throughput.put(e.value);
            m_metric->latency.put(e.elapsed);
        }
        break;
    }
}
