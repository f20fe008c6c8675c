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
#include "api_server.h"

#include <photon/common/alog-stdstring.h>
#include <photon/common/utility.h>
#include <string_view>
#include <unordered_map>
#include "mirror_service.h"

// client socket of each connection, by the photon thread serving it
static std::unordered_map<photon::thread*, int> g_peer_fds;

class HTTPDownstream : public DownstreamWriter {
public:
    explicit HTTPDownstream(photon::net::http::Response& resp) : m_resp(resp) {}

    void set_status(int status) override {
        m_resp.set_result(status);
    }
    void add_header(std::string_view key, std::string_view value) override {
        m_resp.headers.insert(key, value);
    }
    void set_content_length(uint64_t length) override {
        m_resp.headers.content_length(length);
    }
    void set_keep_alive(bool keep) override {
        m_resp.keep_alive(keep);
    }
    ssize_t write(const void *buf, size_t count) override {
        return m_resp.write((void*)buf, count);
    }

private:
    photon::net::http::Response& m_resp;
};

class InboundBody : public RequestBody {
public:
    explicit InboundBody(photon::net::http::Request& req) : m_req(req) {}

    ssize_t read(void *buf, size_t count) override {
        return m_req.read(buf, count);
    }

private:
    photon::net::http::Request& m_req;
};

int ProxyHandler::handle_request(photon::net::http::Request& req,
                                 photon::net::http::Response& resp,
                                 std::string_view) {
    auto target = req.target();
    LOG_DEBUG("` `", verb_name(req.verb()), target);

    HeaderList headers;
    for (auto it = req.headers.begin(); it != req.headers.end(); ++it)
        headers.emplace_back(std::string(it.first()), std::string(it.second()));

    uint64_t body_size = 0;
    bool has_body = request_body_size(headers, &body_size);
    InboundBody body(req);
    HTTPDownstream out(resp);
    resp.keep_alive(true);
    if (mirror->serve(req.verb(), target, headers, has_body ? &body : nullptr, body_size, &out,
                      ApiServer::peer_fd()) < 0) {
        LOG_ERRNO_RETURN(0, -1, "failed to serve `", target);
    }
    return 0;
}

ApiServer::ApiServer(const std::string &addr, uint16_t port,
                     photon::net::http::HTTPHandler* handler) {
    tcpserver = photon::net::new_tcp_socket_server();
    tcpserver->setsockopt(SOL_SOCKET, SO_REUSEPORT, 1);
    if (tcpserver->bind(port, photon::net::IPAddr(addr.c_str())) < 0)
        LOG_ERRNO_RETURN(0, , "Failed to bind port `:`", addr, port);
    if (tcpserver->listen() < 0)
        LOG_ERRNO_RETURN(0, , "Failed to listen port `:`", addr, port);
    photon::net::EndPoint ep;
    if (tcpserver->getsockname(ep) < 0)
        LOG_ERRNO_RETURN(0, , "Failed to get listen address");
    this->port = ep.port;
    httpserver = photon::net::http::new_http_server();
    httpserver->add_handler(handler, false, "/");
    m_connection_handler = httpserver->get_connection_handler();
    tcpserver->set_handler({this, &ApiServer::handle_connection});
    tcpserver->start_loop();
    ready = true;
    LOG_INFO("listening on `:`", addr, this->port);
}

int ApiServer::handle_connection(photon::net::ISocketStream* stream) {
    g_peer_fds[photon::CURRENT] = stream->get_underlay_fd();
    DEFER(g_peer_fds.erase(photon::CURRENT));
    return m_connection_handler(stream);
}

int ApiServer::peer_fd() {
    auto it = g_peer_fds.find(photon::CURRENT);
    return it == g_peer_fds.end() ? -1 : it->second;
}

ApiServer::~ApiServer() {
    delete tcpserver;
    delete httpserver;
}
