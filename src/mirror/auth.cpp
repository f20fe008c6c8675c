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
#include "auth.h"

#include <errno.h>
#include <memory>
#include <photon/common/alog-stdstring.h>
#include <photon/common/estring.h>
#include <photon/net/http/url.h>
#include <rapidjson/document.h>

static const std::string_view kBearerPrefix = "Bearer ";
static const uint64_t kDefaultTokenLife = 60; // seconds, when expires_in is absent
static const size_t kMaxTokenResponse = 64 * 1024;

static std::string_view trim(std::string_view s) {
    return estring_view(s.data(), s.size()).trim(" \t");
}

int parse_challenge(std::string_view header, Challenge *out) {
    header = trim(header);
    auto sp = header.find(' ');
    auto scheme = header.substr(0, sp);
    *out = Challenge();
    if (iequals(scheme, "Basic")) {
        out->scheme = "Basic";
    } else if (iequals(scheme, "Bearer")) {
        out->scheme = "Bearer";
    } else {
        LOG_ERROR_RETURN(EINVAL, -1, "unsupported auth scheme in challenge `", header);
    }
    auto params = sp == std::string_view::npos ? std::string_view() : header.substr(sp + 1);
    while (true) {
        while (!params.empty() && (params.front() == ' ' || params.front() == ','))
            params.remove_prefix(1);
        if (params.empty())
            break;
        auto eq = params.find('=');
        if (eq == std::string_view::npos)
            LOG_ERROR_RETURN(EINVAL, -1, "malformed challenge parameter in `", header);
        auto key = trim(params.substr(0, eq));
        params.remove_prefix(eq + 1);
        std::string value;
        if (!params.empty() && params.front() == '"') {
            size_t i = 1;
            for (; i < params.size() && params[i] != '"'; i++) {
                if (params[i] == '\\' && i + 1 < params.size())
                    i++;
                value.push_back(params[i]);
            }
            if (i >= params.size())
                LOG_ERROR_RETURN(EINVAL, -1, "unterminated quote in challenge `", header);
            params.remove_prefix(i + 1);
        } else {
            auto comma = params.find(',');
            value = std::string(trim(params.substr(0, comma)));
            params.remove_prefix(comma == std::string_view::npos ? params.size() : comma);
        }
        if (iequals(key, "realm"))
            out->realm = std::move(value);
        else if (iequals(key, "service"))
            out->service = std::move(value);
        else if (iequals(key, "scope"))
            out->scope = std::move(value);
    }
    if (out->scheme == "Bearer" && out->realm.empty())
        LOG_ERROR_RETURN(EINVAL, -1, "bearer challenge without realm: `", header);
    return 0;
}

std::string request_scope(const ResolvedRequest &req) {
    if (req.repository.empty())
        return {};
    bool read = req.verb == Verb::GET || req.verb == Verb::HEAD;
    return "repository:" + req.repository + (read ? ":pull" : ":pull,push");
}

std::string token_url(const Challenge &challenge, const Credential *cred) {
    using photon::net::http::url_escape;
    std::string url = challenge.realm;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    if (!challenge.service.empty()) {
        url.push_back(sep);
        url.append("service=").append(url_escape(challenge.service));
        sep = '&';
    }
    if (!challenge.scope.empty()) {
        url.push_back(sep);
        url.append("scope=").append(url_escape(challenge.scope));
        sep = '&';
    }
    if (cred && !cred->empty()) {
        url.push_back(sep);
        url.append("account=").append(url_escape(cred->username));
    }
    return url;
}

static int parse_token(const std::string &body, AuthToken *token) {
    rapidjson::Document d;
    if (d.Parse(body.c_str()).HasParseError() || !d.IsObject())
        LOG_ERROR_RETURN(EINVAL, -1, "token response is not a json object");
    if (d.HasMember("token") && d["token"].IsString() && d["token"].GetStringLength())
        token->value = d["token"].GetString();
    else if (d.HasMember("access_token") && d["access_token"].IsString())
        token->value = d["access_token"].GetString();
    else
        LOG_ERROR_RETURN(EINVAL, -1, "JSON has no 'token' or 'access_token' member");
    uint64_t life = kDefaultTokenLife;
    if (d.HasMember("expires_in") && d["expires_in"].IsUint64())
        life = d["expires_in"].GetUint64();
    token->expires_at = photon::now + life * 1000 * 1000;
    return 0;
}

AuthNegotiator::AuthNegotiator(UpstreamTransport *transport, TokenCache *cache,
                               const CredentialStore *creds, EventSink *events, uint64_t timeout)
    : m_transport(transport), m_cache(cache), m_creds(creds), m_events(events),
      m_timeout(timeout) {}

int AuthNegotiator::exchange(const RegistryDescriptor &registry, const Challenge &challenge,
                             AuthToken *token) {
    auto cred = m_creds ? m_creds->lookup(registry) : nullptr;
    UpstreamRequest req;
    req.verb = Verb::GET;
    req.url = token_url(challenge, cred);
    req.timeout = m_timeout;
    req.headers.emplace_back("User-Agent", DOCKER_MIRROR_VERSION);
    req.headers.emplace_back("Accept", "application/json");
    if (cred && !cred->empty())
        req.headers.emplace_back("Authorization", cred->basic());

    ProxyEvent ev{EventType::TokenExchange};
    ev.registry = registry.id;
    ev.path = challenge.realm;
    ev.detail = challenge.scope;

    std::unique_ptr<UpstreamResponse> resp(m_transport->call(req));
    ev.status = resp->status();
    if (resp->status() != 200) {
        ev.error = resp->status() < 0 ? resp->error() : -1;
        if (m_events)
            m_events->emit(ev);
        LOG_ERROR_RETURN(EACCES, -1, "token exchange at ` failed, code=`", challenge.realm,
                         resp->status());
    }

    std::string body;
    char buf[4096];
    while (body.size() < kMaxTokenResponse) {
        auto n = resp->read(buf, sizeof(buf));
        if (n < 0) {
            ev.error = errno;
            if (m_events)
                m_events->emit(ev);
            LOG_ERRNO_RETURN(EACCES, -1, "failed to read token response from `", challenge.realm);
        }
        if (n == 0)
            break;
        body.append(buf, n);
    }
    token->scope = challenge.scope;
    if (parse_token(body, token) < 0) {
        ev.error = -1;
        if (m_events)
            m_events->emit(ev);
        LOG_ERROR_RETURN(EACCES, -1, "invalid token response from `", challenge.realm);
    }
    if (m_events)
        m_events->emit(ev);
    return 0;
}

bool AuthNegotiator::known_realm(const RegistryDescriptor &registry, Challenge *out) const {
    auto it = m_realms.find(registry.id);
    if (it != m_realms.end()) {
        *out = it->second;
        return true;
    }
    if (!registry.auth_server.empty()) {
        out->scheme = "Bearer";
        out->realm = registry.auth_server;
        out->service = registry.auth_service;
        return true;
    }
    return false;
}

int AuthNegotiator::bearer(const RegistryDescriptor &registry, Challenge challenge,
                           std::string *authorization) {
    AuthToken token;
    auto fetch = [&](AuthToken *t) -> int { return exchange(registry, challenge, t); };
    if (m_cache->acquire(registry.id, challenge.scope, &token, fetch) < 0)
        return -1;
    authorization->assign(kBearerPrefix.data(), kBearerPrefix.size());
    authorization->append(token.value);
    return 0;
}

int AuthNegotiator::prepare(const ResolvedRequest &req, std::string *authorization) {
    authorization->clear();
    if (req.is_version_check)
        return 0;
    auto &registry = *req.registry;
    auto scope = request_scope(req);
    AuthToken token;
    if (m_cache->lookup(registry.id, scope, &token)) {
        authorization->assign(kBearerPrefix.data(), kBearerPrefix.size());
        authorization->append(token.value);
        return 0;
    }
    if (!registry.requires_auth && !challenged(registry.id))
        return 0;
    // anonymous pulls wait for the upstream challenge
    if (!(req.is_blob || req.is_manifest) || !m_creds || !m_creds->lookup(registry))
        return 0;

    Challenge challenge;
    if (!known_realm(registry, &challenge) || challenge.scheme != "Bearer")
        return 0;
    challenge.scope = scope;
    if (bearer(registry, challenge, authorization) < 0) {
        LOG_WARN("token pre-fetch for ` on ` failed, trying anonymous", scope, registry.id);
        authorization->clear();
    }
    return 0;
}

int AuthNegotiator::on_challenge(const ResolvedRequest &req, std::string_view header,
                                 const std::string &rejected, std::string *authorization) {
    auto &registry = *req.registry;
    if (header.empty())
        LOG_ERROR_RETURN(EACCES, -1, "401 from ` without WWW-Authenticate", registry.id);
    Challenge challenge;
    if (parse_challenge(header, &challenge) < 0)
        LOG_ERROR_RETURN(EACCES, -1, "cannot answer challenge from `", registry.id);

    auto cred = m_creds ? m_creds->lookup(registry) : nullptr;
    if (challenge.scheme == "Basic") {
        if (cred == nullptr)
            LOG_ERROR_RETURN(EACCES, -1, "basic auth required by ` but no credential", registry.id);
        *authorization = cred->basic();
        return 0;
    }

    Challenge realm = challenge;
    realm.scope.clear();
    m_realms[registry.id] = realm;

    if (challenge.scope.empty())
        challenge.scope = request_scope(req);
    if (rejected.size() > kBearerPrefix.size() &&
        std::string_view(rejected).substr(0, kBearerPrefix.size()) == kBearerPrefix) {
        m_cache->invalidate(registry.id, challenge.scope, rejected.substr(kBearerPrefix.size()));
    }
    if (bearer(registry, challenge, authorization) < 0)
        LOG_ERRNO_RETURN(EACCES, -1, "token exchange for ` on ` failed", challenge.scope,
                         registry.id);
    return 0;
}
