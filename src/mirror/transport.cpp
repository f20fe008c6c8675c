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
#include "transport.h"

#include <errno.h>
#include <stdlib.h>
#include <photon/common/alog-stdstring.h>
#include <photon/common/estring.h>
#include <photon/net/http/client.h>

using namespace photon::net::http;

const char *verb_name(Verb verb) {
    switch (verb) {
    case Verb::GET:
        return "GET";
    case Verb::HEAD:
        return "HEAD";
    case Verb::POST:
        return "POST";
    case Verb::PUT:
        return "PUT";
    case Verb::DELETE:
        return "DELETE";
    case Verb::PATCH:
        return "PATCH";
    case Verb::OPTIONS:
        return "OPTIONS";
    default:
        return "OTHER";
    }
}

bool request_body_size(const HeaderList &headers, uint64_t *size) {
    auto te = find_header(headers, "Transfer-Encoding");
    if (!te.empty() && estring_view(te.data(), te.size()).find("chunked") != estring_view::npos) {
        *size = kUnknownBodySize;
        return true;
    }
    auto cl = find_header(headers, "Content-Length");
    if (cl.empty())
        return false;
    *size = strtoull(std::string(cl).c_str(), nullptr, 10);
    return *size > 0;
}

class PhotonUpstreamResponse : public UpstreamResponse {
public:
    PhotonUpstreamResponse(Client::Operation *op, int err) : m_op(op), m_error(err) {}
    ~PhotonUpstreamResponse() {
        delete m_op;
    }

    int status() const override {
        return m_op->status_code;
    }
    int error() const override {
        return m_error;
    }
    std::string_view header(std::string_view key) const override {
        if (m_op->status_code < 0)
            return {};
        auto it = m_op->resp.headers.find(key);
        if (it == m_op->resp.headers.end())
            return {};
        return it.second();
    }
    HeaderList headers() const override {
        HeaderList ret;
        if (m_op->status_code < 0)
            return ret;
        for (auto it = m_op->resp.headers.begin(); it != m_op->resp.headers.end(); ++it)
            ret.emplace_back(std::string(it.first()), std::string(it.second()));
        return ret;
    }
    ssize_t content_length() const override {
        if (m_op->status_code < 0)
            return -1;
        if (m_op->resp.headers.find("Content-Length") == m_op->resp.headers.end())
            return -1;
        return m_op->resp.headers.content_length();
    }
    ssize_t read(void *buf, size_t count) override {
        if (m_op->status_code < 0)
            return 0;
        return m_op->resp.read(buf, count);
    }

private:
    Client::Operation *m_op;
    int m_error;
};

class PhotonUpstreamTransport : public UpstreamTransport {
public:
    PhotonUpstreamTransport() {
        m_client = new_http_client();
    }
    ~PhotonUpstreamTransport() {
        delete m_client;
    }

    UpstreamResponse *call(UpstreamRequest &req) override {
        auto op = m_client->new_operation(req.verb, req.url);
        op->follow = 0;
        op->retry = 0;
        op->timeout = req.timeout;
        for (auto &h : req.headers)
            op->req.headers.insert(h.first, h.second);

        auto body = req.body;
        auto writer = [body](Request *out) -> ssize_t {
            char buf[16 * 1024];
            ssize_t total = 0;
            while (true) {
                auto n = body->read(buf, sizeof(buf));
                if (n < 0)
                    LOG_ERRNO_RETURN(0, -1, "failed to read inbound request body");
                if (n == 0)
                    return total;
                if (out->write(buf, n) != n)
                    LOG_ERRNO_RETURN(0, -1, "failed to send request body upstream");
                total += n;
            }
        };
        if (body) {
            if (req.body_size == kUnknownBodySize)
                op->req.headers.insert("Transfer-Encoding", "chunked");
            else
                op->req.headers.content_length(req.body_size);
            op->body_writer = writer;
        }

        op->call();
        int err = 0;
        if (op->status_code < 0) {
            err = errno ? errno : ECONNREFUSED;
            LOG_WARN("` ` failed: no response, errno=`", verb_name(req.verb), req.url, err);
        } else {
            LOG_DEBUG("` ` -> `", verb_name(req.verb), req.url, op->status_code);
        }
        return new PhotonUpstreamResponse(op, err);
    }

private:
    Client *m_client;
};

UpstreamTransport *new_photon_transport() {
    return new PhotonUpstreamTransport();
}
