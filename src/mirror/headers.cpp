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
#include "headers.h"

#include <errno.h>
#include <strings.h>
#include <photon/common/alog-stdstring.h>
#include <photon/common/estring.h>
#include <photon/net/http/url.h>

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

std::string_view find_header(const HeaderList &headers, std::string_view key) {
    for (auto &h : headers) {
        if (iequals(h.first, key))
            return h.second;
    }
    return {};
}

bool has_header(const HeaderList &headers, std::string_view key) {
    for (auto &h : headers) {
        if (iequals(h.first, key))
            return true;
    }
    return false;
}

void set_header(HeaderList &headers, std::string_view key, std::string_view value) {
    remove_header(headers, key);
    headers.emplace_back(std::string(key), std::string(value));
}

size_t remove_header(HeaderList &headers, std::string_view key) {
    size_t n = headers.size();
    for (auto it = headers.begin(); it != headers.end();) {
        if (iequals(it->first, key))
            it = headers.erase(it);
        else
            ++it;
    }
    return n - headers.size();
}

static const char *kHopByHop[] = {
    "Connection",        "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
    "Proxy-Connection",  "TE",         "Trailer",            "Transfer-Encoding",
    "Upgrade",           "Host",       "Content-Length",
};

bool is_hop_by_hop(std::string_view key) {
    for (auto h : kHopByHop) {
        if (iequals(key, h))
            return true;
    }
    return false;
}

static bool absolute_url(std::string_view url) {
    estring_view u(url.data(), url.size());
    return u.starts_with("http://") || u.starts_with("https://");
}

std::string url_host(std::string_view url) {
    if (!absolute_url(url))
        return {};
    photon::net::http::URL u(url);
    return std::string(u.host());
}

std::string replace_host(std::string_view url, std::string_view host) {
    if (!absolute_url(url))
        LOG_ERROR_RETURN(EINVAL, {}, "not an absolute url: `", url);
    photon::net::http::URL u(url);
    std::string ret = u.secure() ? "https://" : "http://";
    ret.append(host.data(), host.size());
    auto target = u.target();
    if (target.empty() || target[0] != '/')
        ret.push_back('/');
    ret.append(target.data(), target.size());
    return ret;
}
