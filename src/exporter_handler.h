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

#include <unistd.h>
#include <string>
#include <utility>
#include <vector>
#include <photon/common/alog.h>
#include <photon/common/metric-meter/metrics.h>
#include <photon/net/http/server.h>

namespace ExposeMetrics {

#define EXPOSE_PHOTON_METRICLIST(name, type)                  \
    std::vector<std::pair<const char*, type*>> va_##name;     \
    void add_##name(const char* tag, type& metric) {          \
        va_##name.emplace_back(std::make_pair(tag, &metric)); \
    }

// name, type and help line of one metric family
struct Family {
    const char* name;
    const char* type;
    const char* help;
};

static inline void append_family(std::string& ret, const Family& f) {
    ret.append("# HELP ").append(f.name).append(" ").append(f.help).append("\n");
    ret.append("# TYPE ").append(f.name).append(" ").append(f.type).append("\n");
}

static inline void append_sample(std::string& ret, const Family& f, const std::string& node,
                                 const char* tag, int64_t val) {
    ret.append(f.name).append("{node=\"").append(node).append("\"");
    if (tag)
        ret.append(",type=\"").append(tag).append("\"");
    ret.append("} ").append(std::to_string(val)).append("\n");
}

#define LOOP_APPEND_METRIC(ret, family, name)                              \
    if (!va_##name.empty()) {                                              \
        append_family(ret, family);                                        \
        for (auto x : va_##name) {                                         \
            append_sample(ret, family, m_node, x.first, x.second->val());  \
        }                                                                  \
        ret.append("\n");                                                  \
    }

struct ExposeRender : public photon::net::http::HTTPHandler {
    EXPOSE_PHOTON_METRICLIST(throughput, Metric::QPSCounter);
    EXPOSE_PHOTON_METRICLIST(latency, Metric::MaxLatencyCounter);
    EXPOSE_PHOTON_METRICLIST(count, Metric::AddCounter);

    ExposeRender() {
        char host[256] = {0};
        if (gethostname(host, sizeof(host) - 1) == 0)
            m_node = host;
        else
            m_node = "unknown";
    }

    std::string render() {
        static const Family alive{"DockerMirror_Alive", "gauge", "mirror process is up"};
        static const Family throughput{"DockerMirror_Relay_Throughput", "gauge",
                                       "relayed bytes per second"};
        static const Family latency{"DockerMirror_MaxLatency", "gauge",
                                    "max request latency in us"};
        static const Family count{"DockerMirror_Count", "counter", "events since start"};
        std::string ret;
        append_family(ret, alive);
        append_sample(ret, alive, m_node, nullptr, 1);
        ret.append("\n");
        LOOP_APPEND_METRIC(ret, throughput, throughput);
        LOOP_APPEND_METRIC(ret, latency, latency);
        LOOP_APPEND_METRIC(ret, count, count);
        return ret;
    }

    int handle_request(photon::net::http::Request& req,
                       photon::net::http::Response& resp,
                       std::string_view) override {
        auto body = render();
        resp.set_result(200);
        resp.keep_alive(true);
        resp.headers.insert("Content-Type", "text/plain; version=0.0.4");
        resp.headers.content_length(body.length());
        ssize_t len = resp.write((void*)body.data(), body.length());
        if (len != (ssize_t)body.length())
            LOG_ERRNO_RETURN(0, -1, "Failed to write exporter response");
        return 0;
    }

private:
    std::string m_node;
};

#undef LOOP_APPEND_METRIC
#undef EXPOSE_PHOTON_METRICLIST
};  // namespace ExposeMetrics
