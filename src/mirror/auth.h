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
#include <string_view>
#include <unordered_map>
#include "credentials.h"
#include "events.h"
#include "path_resolver.h"
#include "token_cache.h"
#include "transport.h"

struct Challenge {
    std::string scheme; // Bearer or Basic
    std::string realm;
    std::string service;
    std::string scope;
};

// Parses a WWW-Authenticate value such as
// `Bearer realm="https://auth.docker.io/token",service="registry.docker.io",scope="..."`.
// Quoted values may contain commas. -1 with EINVAL when malformed.
int parse_challenge(std::string_view header, Challenge *out);

// `repository:<name>:pull` for reads, `:pull,push` for writes, empty without a repository
std::string request_scope(const ResolvedRequest &req);

// token realm url with service, scope and account parameters
std::string token_url(const Challenge &challenge, const Credential *cred);

class AuthNegotiator {
public:
    AuthNegotiator(UpstreamTransport *transport, TokenCache *cache, const CredentialStore *creds,
                   EventSink *events, uint64_t timeout = 15UL * 1000 * 1000);

    // Authorization value to send with the first attempt, left empty for
    // anonymous access. A failed pre-fetch is logged and leaves it empty so the
    // upstream challenge decides.
    int prepare(const ResolvedRequest &req, std::string *authorization);

    // Answers a 401 carrying `challenge`. `rejected` is the Authorization the
    // failed attempt carried, its cached token is dropped. -1 with EACCES when
    // no usable authorization can be produced.
    int on_challenge(const ResolvedRequest &req, std::string_view challenge,
                     const std::string &rejected, std::string *authorization);

    // one GET against the realm, no caching
    int exchange(const RegistryDescriptor &registry, const Challenge &challenge, AuthToken *token);

    bool challenged(const std::string &registry_id) const {
        return m_realms.count(registry_id) > 0;
    }

private:
    bool known_realm(const RegistryDescriptor &registry, Challenge *out) const;
    int bearer(const RegistryDescriptor &registry, Challenge challenge,
               std::string *authorization);

    UpstreamTransport *m_transport;
    TokenCache *m_cache;
    const CredentialStore *m_creds;
    EventSink *m_events;
    uint64_t m_timeout;
    // realm and service learnt from challenges, by registry id
    std::unordered_map<std::string, Challenge> m_realms;
};
