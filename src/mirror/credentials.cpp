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
#include "credentials.h"

#include <errno.h>
#include <stdlib.h>
#include <photon/common/alog-stdstring.h>
#include <photon/net/utils.h>
#include "../config.h"

std::string Credential::basic() const {
    std::string b64;
    photon::net::Base64Encode(username + ":" + password, b64);
    return "Basic " + b64;
}

// docker config files key entries as `https://index.docker.io/v1/`
static std::string credential_key(const std::string &addr) {
    std::string_view key = addr;
    auto pos = key.find("://");
    if (pos != std::string_view::npos)
        key = key.substr(pos + 3);
    key = key.substr(0, key.find('/'));
    return std::string(key);
}

void CredentialStore::add(const std::string &key, Credential cred) {
    m_creds[credential_key(key)] = std::move(cred);
}

int CredentialStore::load_env() {
    auto user = getenv("DOCKERHUB_USERNAME");
    auto pass = getenv("DOCKERHUB_PASSWORD");
    if (user == nullptr || *user == '\0')
        return 0;
    if (pass == nullptr || *pass == '\0') {
        LOG_WARN("DOCKERHUB_USERNAME set without DOCKERHUB_PASSWORD, using anonymous access");
        return 0;
    }
    add("docker", Credential{user, pass});
    LOG_INFO("docker hub credential loaded from environment for `", user);
    return 0;
}

static int parse_auths(const ConfigUtils::Document &auths, CredentialStore *store) {
    if (!auths.IsObject())
        return 0;
    for (auto &iter : auths.GetObject()) {
        std::string addr = iter.name.GetString();
        if (!iter.value.IsObject())
            continue;
        if (iter.value.HasMember("auth") && iter.value["auth"].IsString()) {
            std::string token;
            if (!photon::net::Base64Decode(iter.value["auth"].GetString(), token)) {
                LOG_ERROR("invalid base64 auth for `", addr);
                continue;
            }
            auto p = token.find(':');
            if (p == std::string::npos) {
                LOG_ERROR("invalid base64 auth for `, no ':' found", addr);
                continue;
            }
            store->add(addr, Credential{token.substr(0, p), token.substr(p + 1)});
        } else if (iter.value.HasMember("username") && iter.value.HasMember("password") &&
                   iter.value["username"].IsString() && iter.value["password"].IsString()) {
            store->add(addr, Credential{iter.value["username"].GetString(),
                                        iter.value["password"].GetString()});
        } else {
            LOG_WARN("no usable credential for `", addr);
            continue;
        }
        LOG_DEBUG("cred addr: `", addr);
    }
    return 0;
}

int CredentialStore::load_file(const std::string &path) {
    MirrorConfigNS::AuthConfig cfg;
    if (!cfg.ParseJSON(path))
        LOG_ERROR_RETURN(0, -1, "parse credential file failed: `", path);
    return parse_auths(cfg.auths(), this);
}

int CredentialStore::load_json(std::string_view json) {
    MirrorConfigNS::AuthConfig cfg;
    if (!cfg.ParseJSONStream(json))
        LOG_ERROR_RETURN(0, -1, "parse credential json failed");
    return parse_auths(cfg.auths(), this);
}

const Credential *CredentialStore::lookup(const RegistryDescriptor &registry) const {
    auto it = m_creds.find(registry.id);
    if (it != m_creds.end())
        return &it->second;
    it = m_creds.find(registry.primary_host);
    if (it != m_creds.end())
        return &it->second;
    for (auto &h : registry.alias_hosts) {
        it = m_creds.find(h);
        if (it != m_creds.end())
            return &it->second;
    }
    return nullptr;
}
