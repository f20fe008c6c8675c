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

#include <string>
#include <string_view>
#include <vector>

namespace MirrorConfigNS {
struct RegistryConfig;
}

// One upstream registry. Immutable once the catalog is built.
struct RegistryDescriptor {
    std::string id;                     // alias path segment
    std::string scheme = "https";
    std::string primary_host;
    std::string default_namespace;      // inserted for single component names
    std::vector<std::string> alias_hosts;
    bool requires_auth = false;
    std::string auth_server;            // realm override, empty when none
    std::string auth_service;
    std::vector<std::string> cdn_hosts; // blob fallback hosts, in order
};

class RegistryCatalog {
public:
    RegistryCatalog() = default;
    explicit RegistryCatalog(std::vector<RegistryDescriptor> registries)
        : m_registries(std::move(registries)) {}

    // lookup by path alias
    const RegistryDescriptor *find_alias(std::string_view alias) const;
    // lookup by host hint: alias, primary host or one of the alias hosts
    const RegistryDescriptor *find_hint(std::string_view hint) const;

    const std::vector<RegistryDescriptor> &registries() const {
        return m_registries;
    }
    size_t size() const {
        return m_registries.size();
    }

private:
    std::vector<RegistryDescriptor> m_registries;
};

std::vector<RegistryDescriptor> default_registries();

// builds the catalog from configuration entries, the built-in list when
// `entries` is empty; -1 with EINVAL on an invalid entry
int load_catalog(std::vector<MirrorConfigNS::RegistryConfig> &entries, RegistryCatalog *catalog);
