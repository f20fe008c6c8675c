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

#include <map>
#include <string>
#include <string_view>
#include "catalog.h"

struct Credential {
    std::string username;
    std::string password;

    bool empty() const {
        return username.empty();
    }
    // value of a Basic Authorization header
    std::string basic() const;
};

// Read-only after startup. Keys are registry aliases or host names.
class CredentialStore {
public:
    // DOCKERHUB_USERNAME / DOCKERHUB_PASSWORD for the docker registry
    int load_env();
    // docker config.json style `auths` file, -1 when the file cannot be parsed
    int load_file(const std::string &path);
    int load_json(std::string_view json);

    void add(const std::string &key, Credential cred);
    // by alias, then primary host, then alias hosts; nullptr for anonymous
    const Credential *lookup(const RegistryDescriptor &registry) const;

    size_t size() const {
        return m_creds.size();
    }

private:
    std::map<std::string, Credential> m_creds;
};
