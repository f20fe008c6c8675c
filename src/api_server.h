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
#include <photon/net/http/server.h>
#include <photon/net/socket.h>
#include <photon/thread/thread.h>

class MirrorService;

// Accepts every method and path and hands it to the mirror service.
class ProxyHandler : public photon::net::http::HTTPHandler {
public:
    MirrorService *mirror;

    ProxyHandler(MirrorService *mirror) : mirror(mirror) {}
    int handle_request(photon::net::http::Request& req,
                       photon::net::http::Response& resp,
                       std::string_view) override;
};

struct ApiServer {
    photon::net::ISocketServer* tcpserver = nullptr;
    photon::net::http::HTTPServer* httpserver = nullptr;
    bool ready = false;
    uint16_t port = 0;

    // port 0 binds an ephemeral port, reported in `port`
    ApiServer(const std::string &addr, uint16_t port, photon::net::http::HTTPHandler* handler);
    ~ApiServer();

    int handle_connection(photon::net::ISocketStream* stream);
    // socket of the client served by the calling thread, -1 outside a connection
    static int peer_fd();

private:
    photon::net::ISocketServer::Handler m_connection_handler;
};
