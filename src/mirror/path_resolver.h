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
#include "catalog.h"
#include "headers.h"
#include "transport.h"

// Per-request view of an inbound call, owned by the handling thread.
struct ResolvedRequest {
    const RegistryDescriptor *registry = nullptr;
    Verb verb = Verb::GET;
    std::string upstream_path; // /v2/... including the query string
    std::string repository;    // empty for /v2/ and other non-repository paths
    std::string reference;     // tag or digest
    bool is_blob = false;
    bool is_manifest = false;
    bool is_version_check = false; // GET /v2/
    HeaderList original_headers;
    RequestBody *body = nullptr;
    uint64_t body_size = 0;

    std::string upstream_url() const;
};

// Maps `target` (path plus query) onto a registry and an upstream path.
// Alias form `/{alias}/...` wins; native `/v2/...` falls back to the host
// hint and then to `default_registry`. Returns -1 with ENOENT when nothing
// applies. No I/O.
int resolve_request(const RegistryCatalog &catalog, std::string_view target,
                    std::string_view host_hint, std::string_view default_registry,
                    ResolvedRequest *out);

// fills repository/reference and the blob/manifest/version check flags from `path`
void classify_path(std::string_view path, ResolvedRequest *out);
