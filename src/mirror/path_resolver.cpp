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
#include "path_resolver.h"

#include <errno.h>
#include <photon/common/alog-stdstring.h>

static const std::string_view kV2Prefix = "/v2/";

std::string ResolvedRequest::upstream_url() const {
    std::string ret = registry->scheme;
    ret.append("://").append(registry->primary_host).append(upstream_path);
    return ret;
}

// `tail` must be a single non-empty segment
static bool single_segment(std::string_view tail) {
    return !tail.empty() && tail.find('/') == std::string_view::npos;
}

void classify_path(std::string_view path, ResolvedRequest *out) {
    out->repository.clear();
    out->reference.clear();
    out->is_blob = out->is_manifest = out->is_version_check = false;
    if (path == "/v2/" || path == "/v2") {
        out->is_version_check = true;
        return;
    }
    if (path.substr(0, kV2Prefix.size()) != kV2Prefix)
        return;
    auto rest = path.substr(kV2Prefix.size());

    auto pos = rest.rfind("/manifests/");
    if (pos != std::string_view::npos && pos > 0) {
        auto tail = rest.substr(pos + sizeof("/manifests/") - 1);
        if (single_segment(tail)) {
            out->repository = std::string(rest.substr(0, pos));
            out->reference = std::string(tail);
            out->is_manifest = true;
            return;
        }
    }
    pos = rest.rfind("/blobs/");
    if (pos != std::string_view::npos && pos > 0) {
        auto tail = rest.substr(pos + sizeof("/blobs/") - 1);
        out->repository = std::string(rest.substr(0, pos));
        // blobs/uploads/... names the upload endpoint, not a blob
        if (single_segment(tail) && tail != "uploads") {
            out->reference = std::string(tail);
            out->is_blob = true;
        }
        return;
    }
    pos = rest.rfind("/tags/list");
    if (pos != std::string_view::npos && pos > 0)
        out->repository = std::string(rest.substr(0, pos));
}

// `/v2/ubuntu/...` -> `/v2/library/ubuntu/...` when the name has one component
static std::string insert_namespace(const std::string &path, const std::string &ns) {
    ResolvedRequest shape;
    classify_path(path, &shape);
    if (ns.empty() || shape.repository.empty() ||
        shape.repository.find('/') != std::string::npos)
        return path;
    return std::string(kV2Prefix) + ns + "/" + path.substr(kV2Prefix.size());
}

int resolve_request(const RegistryCatalog &catalog, std::string_view target,
                    std::string_view host_hint, std::string_view default_registry,
                    ResolvedRequest *out) {
    auto q = target.find('?');
    auto path = target.substr(0, q);
    auto query = q == std::string_view::npos ? std::string_view() : target.substr(q);
    if (path.empty() || path[0] != '/')
        LOG_ERROR_RETURN(ENOENT, -1, "malformed request target `", target);

    auto seg_end = path.find('/', 1);
    auto segment = path.substr(1, seg_end == std::string_view::npos ? std::string_view::npos
                                                                    : seg_end - 1);
    const RegistryDescriptor *registry = nullptr;
    std::string upstream;
    if (segment != "v2") {
        registry = catalog.find_alias(segment);
        if (registry == nullptr)
            LOG_ERROR_RETURN(ENOENT, -1, "no registry alias ` for `", segment, target);
        auto rest = seg_end == std::string_view::npos ? std::string_view() : path.substr(seg_end);
        if (rest.empty() || rest == "/" || rest == "/v2") {
            upstream = kV2Prefix;
        } else if (rest.substr(0, kV2Prefix.size()) == kV2Prefix) {
            upstream = std::string(rest);
        } else {
            upstream = "/v2";
            upstream.append(rest.data(), rest.size());
        }
        upstream = insert_namespace(upstream, registry->default_namespace);
    } else {
        if (!host_hint.empty()) {
            registry = catalog.find_hint(host_hint);
            if (registry == nullptr)
                LOG_ERROR_RETURN(ENOENT, -1, "unknown registry hint ` for `", host_hint, target);
        } else if (!default_registry.empty()) {
            registry = catalog.find_alias(default_registry);
        }
        if (registry == nullptr)
            LOG_ERROR_RETURN(ENOENT, -1, "no registry selected for `", target);
        upstream = path == "/v2" ? std::string(kV2Prefix) : std::string(path);
    }

    out->registry = registry;
    classify_path(upstream, out);
    out->upstream_path = upstream;
    out->upstream_path.append(query.data(), query.size());
    return 0;
}
