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
#include "mirror_service.h"

#include <errno.h>
#include <photon/common/alog.h>
#include <photon/common/alog-stdstring.h>
#include <photon/common/utility.h>
#include <photon/thread/thread.h>

const int LOG_SIZE = 10 * 1024 * 1024;
const int LOG_NUM = 3;

int MirrorService::read_global_config_and_set() {
    LOG_INFO("using config `", m_config_path);
    if (!global_conf.ParseJSON(m_config_path, true)) {
        LOG_ERROR_RETURN(0, -1, "error parse global config json: `", m_config_path);
    }

    uint32_t log_level = global_conf.logConfig().logLevel();
    std::string log_path = global_conf.logConfig().logPath();
    uint32_t log_size = global_conf.logConfig().logSizeMB() * 1024 * 1024;
    int log_num = global_conf.logConfig().logRotateNum();
    if (log_size == 0)
        log_size = LOG_SIZE;
    if (log_num <= 0)
        log_num = LOG_NUM;

    set_log_output_level(log_level);
    LOG_INFO("set log_level: `", log_level);

    if (!log_path.empty()) {
        LOG_INFO("set log_path: `, log_size: `, log_num: `", log_path, log_size, log_num);
        int ret = log_output_file(log_path.c_str(), log_size, log_num);
        if (ret != 0) {
            LOG_ERROR_RETURN(0, -1, "log_output_file failed, errno:`", errno);
        }
    }
    // display in log file
    LOG_INFO("log config: ", VALUE(log_level), VALUE(log_path), VALUE(log_size), VALUE(log_num));
    return validate_config();
}

int MirrorService::validate_config() {
    auto port = global_conf.port();
    if (port <= 0 || port > 65535)
        LOG_ERROR_RETURN(EINVAL, -1, "invalid port `", port);
    auto retry = global_conf.retryConfig();
    if (retry.maxAttempts() < 1)
        LOG_ERROR_RETURN(EINVAL, -1, "retryConfig.maxAttempts must be at least 1, got `",
                         retry.maxAttempts());
    if (retry.baseDelayMs() < 0 || retry.maxDelayMs() < retry.baseDelayMs())
        LOG_ERROR_RETURN(EINVAL, -1, "invalid backoff range [`, `] ms", retry.baseDelayMs(),
                         retry.maxDelayMs());
    auto tmo = global_conf.timeoutConfig();
    if (tmo.requestTimeoutSec() <= 0 || tmo.blobTimeoutSec() <= 0 || tmo.authTimeoutSec() <= 0)
        LOG_ERROR_RETURN(EINVAL, -1, "timeouts must be positive");
    if (global_conf.tokenCacheSize() < 1)
        LOG_ERROR_RETURN(EINVAL, -1, "tokenCacheSize must be at least 1");
    if (global_conf.hostHintHeader().empty())
        LOG_ERROR_RETURN(EINVAL, -1, "hostHintHeader must not be empty");
    if (global_conf.exporterConfig().enable()) {
        auto eport = global_conf.exporterConfig().port();
        if (eport <= 0 || eport > 65535)
            LOG_ERROR_RETURN(EINVAL, -1, "invalid exporter port `", eport);
    }
    return 0;
}

int MirrorService::load_credentials() {
    if (m_creds.load_env() < 0)
        return -1;
    auto path = global_conf.credentialConfig().path();
    if (!path.empty()) {
        LOG_INFO("load credentials from `", path);
        if (m_creds.load_file(path) < 0)
            LOG_ERROR_RETURN(0, -1, "failed to load credential file `", path);
    }
    LOG_INFO("` credential entries loaded", m_creds.size());
    return 0;
}

int MirrorService::init(UpstreamTransport *transport) {
    m_transport.reset(transport);
    if (read_global_config_and_set() < 0)
        return -1;

    auto registries = global_conf.registries();
    if (load_catalog(registries, &m_catalog) < 0)
        LOG_ERROR_RETURN(0, -1, "invalid registry catalog");
    m_default_registry = global_conf.defaultRegistry();
    if (!m_default_registry.empty() && m_catalog.find_alias(m_default_registry) == nullptr)
        LOG_ERROR_RETURN(EINVAL, -1, "default registry ` is not in the catalog",
                         m_default_registry);
    m_hint_header = global_conf.hostHintHeader();
    if (load_credentials() < 0)
        return -1;

    if (!m_transport)
        m_transport.reset(new_photon_transport());

    metrics.reset(new MirrorMetric());
    if (global_conf.exporterConfig().enable()) {
        exporter = new ExporterServer(global_conf, metrics.get());
        if (!exporter->ready)
            LOG_ERROR_RETURN(0, -1, "Failed to start http server for metrics exporter");
    }
    m_events.reset(new LogEventSink(metrics.get()));

    auto tmo = global_conf.timeoutConfig();
    m_tokens.reset(new TokenCache(global_conf.tokenCacheSize()));
    m_auth.reset(new AuthNegotiator(m_transport.get(), m_tokens.get(), &m_creds, m_events.get(),
                                    tmo.authTimeoutSec() * 1000UL * 1000));

    ExecutorOptions eopts;
    eopts.request_timeout = tmo.requestTimeoutSec() * 1000UL * 1000;
    eopts.blob_timeout = tmo.blobTimeoutSec() * 1000UL * 1000;
    m_executor.reset(new UpstreamExecutor(m_transport.get(), eopts));

    auto retry = global_conf.retryConfig();
    PipelineOptions popts;
    popts.retry.max_attempts = retry.maxAttempts();
    popts.retry.base_delay = retry.baseDelayMs() * 1000UL;
    popts.retry.max_delay = retry.maxDelayMs() * 1000UL;
    popts.retry.last_resort = retry.lastResort();
    popts.user_agents = global_conf.userAgents();
    m_pipeline.reset(new UpstreamPipeline(m_executor.get(), m_auth.get(), m_events.get(), popts));
    m_relay.reset(new ResponseRelay(m_events.get()));

    LOG_INFO("mirror ready: ` registries, default `, maxAttempts `, backoff [`, `] ms",
             m_catalog.size(), m_default_registry, popts.retry.max_attempts, retry.baseDelayMs(),
             retry.maxDelayMs());
    return 0;
}

int MirrorService::serve(Verb verb, std::string_view target, const HeaderList &headers,
                         RequestBody *body, uint64_t body_size, DownstreamWriter *out,
                         int peer_fd) {
    auto start = photon::now;
    RelayStats stats;
    ResolvedRequest req;
    if (resolve_request(m_catalog, target, find_header(headers, m_hint_header),
                        m_default_registry, &req) < 0) {
        std::string msg = "no upstream registry for ";
        msg.append(target.data(), target.size());
        return m_relay->relay_error(ProxyError::UnresolvedPath, 0, msg, out, &stats);
    }
    req.verb = verb;
    req.original_headers = headers;
    remove_header(req.original_headers, m_hint_header);
    req.body = body;
    req.body_size = body ? body_size : 0;

    Cancellation cancel;
    m_inflight.insert(&cancel);
    DEFER(m_inflight.erase(&cancel));
    // the socket is readable while a body is pending, nothing to watch then
    std::unique_ptr<PeerWatch> watch;
    if (peer_fd >= 0 && body == nullptr)
        watch.reset(new PeerWatch(peer_fd, &cancel));

    auto result = m_pipeline->run(req, &cancel);
    int ret;
    if (result.response) {
        if (result.error != ProxyError::None)
            LOG_WARN("relay upstream ` for ` after `", result.status, req.upstream_path,
                     error_name(result.error));
        ret = m_relay->relay(req, result.response.get(), out, &stats, &cancel);
    } else {
        ret = m_relay->relay_error(result.error, result.transport_errno, result.message, out,
                                   &stats);
    }

    ProxyEvent ev{EventType::Completed};
    ev.registry = req.registry->id;
    ev.path = req.upstream_path;
    ev.attempt = result.attempts;
    ev.status = stats.status;
    ev.value = stats.bytes;
    ev.elapsed = photon::now - start;
    ev.detail = verb_name(verb);
    m_events->emit(ev);
    return ret;
}

void MirrorService::cancel_all() {
    LOG_INFO("cancel ` in-flight operations", m_inflight.size());
    auto inflight = m_inflight;
    for (auto c : inflight)
        c->cancel();
}

MirrorService::MirrorService(const char *config_path) {
    m_config_path = config_path ? config_path : DEFAULT_CONFIG_PATH;
}

MirrorService::~MirrorService() {
    cancel_all();
    delete exporter;
    LOG_INFO("mirror service is fully stopped");
}

MirrorService *create_mirror_service(const char *config_path, UpstreamTransport *transport) {
    MirrorService *ret = new MirrorService(config_path);
    if (ret->init(transport) < 0) {
        delete ret;
        return nullptr;
    }
    return ret;
}
