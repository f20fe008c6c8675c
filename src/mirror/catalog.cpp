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
#include "catalog.h"

#include <errno.h>
#include <set>
#include <photon/common/alog-stdstring.h>
#include "../config.h"
#include "headers.h"

const RegistryDescriptor *RegistryCatalog::find_alias(std::string_view alias) const {
    for (auto &r : m_registries) {
        if (r.id == alias)
            return &r;
    }
    return nullptr;
}

const RegistryDescriptor *RegistryCatalog::find_hint(std::string_view hint) const {
    if (hint.empty())
        return nullptr;
    for (auto &r : m_registries) {
        if (iequals(r.id, hint) || iequals(r.primary_host, hint))
            return &r;
        for (auto &h : r.alias_hosts) {
            if (iequals(h, hint))
                return &r;
        }
    }
    return nullptr;
}

static RegistryDescriptor simple_registry(const char *id, const char *host) {
    RegistryDescriptor r;
    r.id = id;
    r.primary_host = host;
    return r;
}

std::vector<RegistryDescriptor> default_registries() {
    std::vector<RegistryDescriptor> ret;

    RegistryDescriptor docker = simple_registry("docker", "registry-1.docker.io");
    docker.default_namespace = "library";
    docker.alias_hosts = {"docker.io", "index.docker.io"};
    docker.requires_auth = true;
    docker.auth_server = "https://auth.docker.io/token";
    docker.auth_service = "registry.docker.io";
    docker.cdn_hosts = {"production.cloudflare.docker.com"};
    ret.emplace_back(std::move(docker));

    ret.emplace_back(simple_registry("quay", "quay.io"));
    ret.emplace_back(simple_registry("gcr", "gcr.io"));
    ret.emplace_back(simple_registry("k8s-gcr", "k8s.gcr.io"));
    RegistryDescriptor k8s = simple_registry("registry-k8s", "registry.k8s.io");
    k8s.alias_hosts = {"k8s"};
    ret.emplace_back(std::move(k8s));
    ret.emplace_back(simple_registry("ghcr", "ghcr.io"));
    ret.emplace_back(simple_registry("cloudsmith", "docker.cloudsmith.io"));
    ret.emplace_back(simple_registry("nvcr", "nvcr.io"));
    ret.emplace_back(simple_registry("gitlab", "registry.gitlab.com"));
    return ret;
}

int load_catalog(std::vector<MirrorConfigNS::RegistryConfig> &entries, RegistryCatalog *catalog) {
    if (entries.empty()) {
        *catalog = RegistryCatalog(default_registries());
        return 0;
    }
    std::vector<RegistryDescriptor> registries;
    std::set<std::string> seen;
    for (auto &e : entries) {
        RegistryDescriptor r;
        r.id = e.alias();
        r.primary_host = e.host();
        if (r.id.empty() || r.primary_host.empty())
            LOG_ERROR_RETURN(EINVAL, -1, "registry entry requires alias and host, got `",
                             e.DumpString());
        if (r.id.find('/') != std::string::npos)
            LOG_ERROR_RETURN(EINVAL, -1, "registry alias ` must be a single path segment", r.id);
        if (!seen.insert(r.id).second)
            LOG_ERROR_RETURN(EINVAL, -1, "duplicate registry alias `", r.id);
        r.scheme = e.scheme();
        if (r.scheme != "https" && r.scheme != "http")
            LOG_ERROR_RETURN(EINVAL, -1, "unsupported scheme ` for registry `", r.scheme, r.id);
        r.default_namespace = e.defaultNamespace();
        r.alias_hosts = e.aliasHosts();
        r.requires_auth = e.requiresAuth();
        r.auth_server = e.authServer();
        r.auth_service = e.authService();
        r.cdn_hosts = e.cdnHosts();
        LOG_INFO("registry ` -> `://`, ` cdn hosts", r.id, r.scheme, r.primary_host,
                 r.cdn_hosts.size());
        registries.emplace_back(std::move(r));
    }
    *catalog = RegistryCatalog(std::move(registries));
    return 0;
}
