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

#include <photon/common/alog.h>
#include <photon/net/http/server.h>
#include <photon/net/socket.h>

#include "config.h"
#include "exporter_handler.h"
#include "mirror/metric.h"

struct ExporterServer {
    photon::net::http::HTTPServer *httpserver = nullptr;
    photon::net::ISocketServer *tcpserver = nullptr;
    ExposeMetrics::ExposeRender exporter;

    bool ready = false;

    ExporterServer(MirrorConfigNS::GlobalConfig &config, MirrorMetric *metrics) {
        exporter.add_throughput("relay", metrics->throughput);
        exporter.add_latency("request", metrics->latency);
        exporter.add_count("requests", metrics->requests);
        exporter.add_count("upstream_attempts", metrics->attempts);
        exporter.add_count("token_exchanges", metrics->token_exchanges);
        exporter.add_count("token_failures", metrics->token_failures);
        exporter.add_count("rate_limited", metrics->rate_limited);
        exporter.add_count("retries", metrics->retries);
        exporter.add_count("redirects", metrics->redirects);
        exporter.add_count("cdn_fallbacks", metrics->cdn_fallbacks);
        exporter.add_count("last_resorts", metrics->last_resorts);
        exporter.add_count("failures", metrics->failures);
        exporter.add_count("relayed_bytes", metrics->bytes);

        auto port = config.exporterConfig().port();
        tcpserver = photon::net::new_tcp_socket_server();
        tcpserver->setsockopt(SOL_SOCKET, SO_REUSEPORT, 1);
        if (tcpserver->bind(port) < 0)
            LOG_ERRNO_RETURN(0, , "Failed to bind exporter port `", port);
        if (tcpserver->listen() < 0)
            LOG_ERRNO_RETURN(0, , "Failed to listen exporter port `", port);
        httpserver = photon::net::http::new_http_server();
        httpserver->add_handler(&exporter, false, config.exporterConfig().uriPrefix());
        tcpserver->set_handler(httpserver->get_connection_handler());
        tcpserver->start_loop();
        ready = true;
        LOG_INFO("metrics exporter listening on port `, path `", port,
                 config.exporterConfig().uriPrefix());
    }

    ~ExporterServer() {
        delete tcpserver;
        delete httpserver;
    }
};
