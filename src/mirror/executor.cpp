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
#include "executor.h"

#include <photon/common/alog-stdstring.h>
#include <photon/common/estring.h>
#include <photon/net/http/url.h>

static const char *kManifestAccept =
    "application/vnd.docker.distribution.manifest.v2+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json, "
    "application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.oci.image.index.v1+json, "
    "application/vnd.docker.distribution.manifest.v1+prettyjws";
static const char *kBlobAccept =
    "application/octet-stream, "
    "application/vnd.docker.image.rootfs.diff.tar.gzip, "
    "application/vnd.oci.image.layer.v1.tar+gzip, */*";

const char *outcome_name(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::Success:
        return "Success";
    case OutcomeKind::Redirect:
        return "Redirect";
    case OutcomeKind::RateLimited:
        return "RateLimited";
    case OutcomeKind::Unauthorized:
        return "Unauthorized";
    case OutcomeKind::TransportError:
        return "TransportError";
    }
    return "Unknown";
}

HeaderList rate_limit_headers(const HeaderList &headers) {
    HeaderList ret;
    for (auto &h : headers) {
        if (istarts_with(h.first, "RateLimit-") || istarts_with(h.first, "X-RateLimit-") ||
            iequals(h.first, "Docker-RateLimit-Source") || iequals(h.first, "Retry-After"))
            ret.push_back(h);
    }
    return ret;
}

bool is_rate_limited(int status, const HeaderList &headers) {
    if (status == 429)
        return true;
    if (status != 403)
        return false;
    for (auto key : {"RateLimit-Remaining", "X-RateLimit-Remaining"}) {
        auto v = find_header(headers, key);
        // `0;w=21600`
        if (!v.empty() && v[0] == '0' && (v.size() == 1 || v[1] == ';'))
            return true;
    }
    return false;
}

OutcomeKind classify(int status, const HeaderList &headers) {
    if (status < 0)
        return OutcomeKind::TransportError;
    switch (status) {
    case 301:
    case 302:
    case 303:
    case 307:
    case 308:
        return find_header(headers, "Location").empty() ? OutcomeKind::Success
                                                         : OutcomeKind::Redirect;
    case 401:
        return OutcomeKind::Unauthorized;
    case 500:
    case 502:
    case 503:
    case 504:
        return OutcomeKind::TransportError;
    default:
        break;
    }
    if (is_rate_limited(status, headers))
        return OutcomeKind::RateLimited;
    return OutcomeKind::Success;
}

std::string resolve_location(std::string_view base, std::string_view location) {
    estring_view loc(location.data(), location.size());
    if (loc.find("://") != estring_view::npos || url_host(base).empty())
        return std::string(location);
    photon::net::http::URL u(base);
    std::string ret = u.secure() ? "https:" : "http:";
    if (loc.starts_with("//"))
        return ret.append(location.data(), location.size());
    ret.append("//").append(u.host().data(), u.host().size());
    if (!loc.starts_with("/")) {
        // relative to the directory of the base path
        auto target = u.target();
        auto path = target.substr(0, target.find('?'));
        auto dir = path.substr(0, path.rfind('/') + 1);
        if (dir.empty())
            ret.push_back('/');
        ret.append(dir.data(), dir.size());
    }
    ret.append(location.data(), location.size());
    return ret;
}

HeaderList upstream_headers(const ResolvedRequest &req, std::string_view authorization,
                            std::string_view user_agent, bool minimal) {
    HeaderList ret;
    for (auto &h : req.original_headers) {
        if (is_hop_by_hop(h.first) || iequals(h.first, "User-Agent"))
            continue;
        if (minimal && !iequals(h.first, "Range") && !iequals(h.first, "Accept"))
            continue;
        // the client's own Authorization only travels when nothing replaces it
        if (iequals(h.first, "Authorization") && (!authorization.empty() || req.is_version_check))
            continue;
        ret.push_back(h);
    }
    if (!authorization.empty())
        ret.emplace_back("Authorization", std::string(authorization));
    if (!user_agent.empty())
        ret.emplace_back("User-Agent", std::string(user_agent));
    set_header(ret, "Docker-Distribution-Api-Version", "registry/2.0");
    if (!has_header(ret, "Accept"))
        ret.emplace_back("Accept", req.is_blob ? kBlobAccept : kManifestAccept);
    return ret;
}

HeaderList storage_headers(const ResolvedRequest &req, std::string_view user_agent) {
    auto ret = upstream_headers(req, {}, user_agent);
    remove_header(ret, "Authorization");
    return ret;
}

Outcome UpstreamExecutor::finish(UpstreamRequest &ureq) {
    Outcome out;
    out.url = ureq.url;
    out.host = url_host(ureq.url);
    out.response.reset(m_transport->call(ureq));
    out.status = out.response->status();
    out.error = out.response->error();
    auto headers = out.status < 0 ? HeaderList() : out.response->headers();
    out.kind = classify(out.status, headers);
    if (out.kind == OutcomeKind::Redirect)
        out.location = resolve_location(ureq.url, find_header(headers, "Location"));
    return out;
}

Outcome UpstreamExecutor::execute(const ResolvedRequest &req, std::string_view authorization,
                                  std::string_view user_agent, bool minimal) {
    UpstreamRequest ureq;
    ureq.verb = req.verb;
    ureq.url = req.upstream_url();
    ureq.headers = upstream_headers(req, authorization, user_agent, minimal);
    ureq.timeout = timeout_for(req);
    ureq.body = req.body;
    ureq.body_size = req.body_size;
    return finish(ureq);
}

Outcome UpstreamExecutor::fetch(const ResolvedRequest &req, const std::string &url,
                                HeaderList headers) {
    UpstreamRequest ureq;
    ureq.verb = req.verb == Verb::HEAD ? Verb::HEAD : Verb::GET;
    ureq.url = url;
    ureq.headers = std::move(headers);
    ureq.timeout = timeout_for(req);
    return finish(ureq);
}
