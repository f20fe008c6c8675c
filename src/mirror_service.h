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

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include "config.h"
#include "exporter_server.h"
#include "mirror/auth.h"
#include "mirror/catalog.h"
#include "mirror/credentials.h"
#include "mirror/events.h"
#include "mirror/executor.h"
#include "mirror/peer_watch.h"
#include "mirror/pipeline.h"
#include "mirror/relay.h"
#include "mirror/token_cache.h"
#include "mirror/transport.h"

class MirrorService {
public:
    MirrorService(const char *config_path = nullptr);
    ~MirrorService();
    // takes `transport`, the photon http client is used when nullptr
    int init(UpstreamTransport *transport = nullptr);

    // resolve, run the upstream pipeline and relay, one inbound request.
    // `body` is nullptr without a request body. A client hanging up on
    // `peer_fd` cancels the operation.
    int serve(Verb verb, std::string_view target, const HeaderList &headers, RequestBody *body,
              uint64_t body_size, DownstreamWriter *out, int peer_fd = -1);

    // wakes every in-flight operation, used on shutdown
    void cancel_all();

    const RegistryCatalog &catalog() const {
        return m_catalog;
    }
    TokenCache *token_cache() {
        return m_tokens.get();
    }
    UpstreamPipeline *pipeline() {
        return m_pipeline.get();
    }

    MirrorConfigNS::GlobalConfig global_conf;
    std::unique_ptr<MirrorMetric> metrics;
    ExporterServer *exporter = nullptr;

private:
    int read_global_config_and_set();
    int validate_config();
    int load_credentials();

    std::string m_config_path;
    std::string m_default_registry;
    std::string m_hint_header;
    RegistryCatalog m_catalog;
    CredentialStore m_creds;
    std::unique_ptr<UpstreamTransport> m_transport;
    std::unique_ptr<TokenCache> m_tokens;
    std::unique_ptr<EventSink> m_events;
    std::unique_ptr<AuthNegotiator> m_auth;
    std::unique_ptr<UpstreamExecutor> m_executor;
    std::unique_ptr<UpstreamPipeline> m_pipeline;
    std::unique_ptr<ResponseRelay> m_relay;
    std::set<Cancellation *> m_inflight;
};

MirrorService *create_mirror_service(const char *config_path = nullptr,
                                     UpstreamTransport *transport = nullptr);
