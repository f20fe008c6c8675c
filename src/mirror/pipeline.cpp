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
#include "pipeline.h"

#include <errno.h>
#include <photon/common/alog-stdstring.h>
#include <photon/thread/thread.h>

UpstreamPipeline::UpstreamPipeline(UpstreamExecutor *executor, AuthNegotiator *auth,
                                   EventSink *events, const PipelineOptions &opts)
    : m_executor(executor), m_auth(auth), m_events(events), m_opts(opts) {
    if (m_opts.user_agents.empty())
        m_opts.user_agents = default_user_agents();
    if (m_opts.retry.max_attempts < 1)
        m_opts.retry.max_attempts = 1;
}

void UpstreamPipeline::emit(EventType type, const ResolvedRequest &req, const RetryState &state,
                            const Outcome *out, std::string detail) {
    if (m_events == nullptr)
        return;
    ProxyEvent ev{type};
    ev.registry = req.registry->id;
    ev.path = out ? out->url : req.upstream_path;
    ev.attempt = state.attempt;
    ev.status = out ? out->status : state.last_status;
    ev.error = out ? out->error : state.last_error;
    ev.detail = std::move(detail);
    if (type == EventType::RateLimited && out && out->response && out->status > 0)
        ev.headers = rate_limit_headers(out->response->headers());
    m_events->emit(ev);
}

void UpstreamPipeline::record(const ResolvedRequest &req, RetryState &state, const Outcome &out) {
    state.attempt++;
    if (!out.host.empty())
        state.hosts_tried.insert(out.host);
    state.last_status = out.status;
    state.last_error = out.error;
    emit(EventType::Attempt, req, state, &out, outcome_name(out.kind));
    if (out.kind == OutcomeKind::RateLimited)
        emit(EventType::RateLimited, req, state, &out);
}

int UpstreamPipeline::backoff(const ResolvedRequest &req, RetryState &state,
                              UserAgentRotation &ua, Cancellation *cancel) {
    auto exp = state.attempt - 1;
    auto delay = backoff_delay(m_opts.retry, exp, draw_jitter(m_opts.retry, exp));
    state.backoff_deadline = photon::now + delay;
    auto &agent = ua.rotate();
    if (m_events) {
        ProxyEvent ev{EventType::Backoff};
        ev.registry = req.registry->id;
        ev.path = req.upstream_path;
        ev.attempt = state.attempt;
        ev.status = state.last_status;
        ev.error = state.last_error;
        ev.value = delay;
        ev.detail = agent;
        m_events->emit(ev);
    }
    if (cancel)
        return cancel->sleep(delay);
    photon::thread_usleep(delay);
    return 0;
}

// a storage reply other than a transport failure is final: a rate limit goes
// back to the retry loop, anything else is relayed to the client as is
static Outcome storage_reply(Outcome out) {
    if (out.kind != OutcomeKind::RateLimited)
        out.kind = OutcomeKind::Success;
    return out;
}

Outcome UpstreamPipeline::follow_redirect(const ResolvedRequest &req, Outcome redirect,
                                          RetryState &state, UserAgentRotation &ua,
                                          Cancellation *cancel) {
    std::string location = redirect.location;
    Outcome failed;
    bool unreachable = false;
    for (int hop = 0; hop < m_opts.max_redirect_hops; hop++) {
        if (!state.has_budget(m_opts.retry) || (cancel && cancel->cancelled()))
            break;
        emit(EventType::Redirect, req, state, &redirect, location);
        auto out = m_executor->fetch(req, location, storage_headers(req, ua.current()));
        record(req, state, out);
        if (out.kind == OutcomeKind::Redirect) {
            location = out.location;
            redirect = std::move(out);
            continue;
        }
        if (out.kind != OutcomeKind::TransportError)
            return storage_reply(std::move(out));
        LOG_WARN("redirect target ` unreachable, errno=`", location, out.error);
        failed = std::move(out);
        unreachable = true;
        break;
    }

    if (unreachable && req.is_blob) {
        for (auto &host : req.registry->cdn_hosts) {
            if (state.hosts_tried.count(host))
                continue;
            if (!state.has_budget(m_opts.retry) || (cancel && cancel->cancelled()))
                break;
            auto url = replace_host(location, host);
            if (url.empty())
                break;
            emit(EventType::CdnFallback, req, state, nullptr, host);
            auto out = m_executor->fetch(req, url, storage_headers(req, ua.current()));
            record(req, state, out);
            if (out.kind != OutcomeKind::TransportError && out.kind != OutcomeKind::Redirect)
                return storage_reply(std::move(out));
            LOG_WARN("cdn host ` failed, status=`, errno=`", host, out.status, out.error);
            failed = std::move(out);
        }
    }
    failed.kind = OutcomeKind::TransportError;
    return failed;
}

static PipelineResult succeed(Outcome &out, const RetryState &state) {
    PipelineResult result;
    result.status = out.status;
    result.attempts = state.attempt;
    result.response = std::move(out.response);
    return result;
}

static PipelineResult cancelled(const RetryState &state) {
    PipelineResult result;
    result.error = ProxyError::Cancelled;
    result.attempts = state.attempt;
    result.transport_errno = ECANCELED;
    result.message = "operation cancelled";
    return result;
}

PipelineResult UpstreamPipeline::run(const ResolvedRequest &req, Cancellation *cancel) {
    RetryState state;
    UserAgentRotation ua(m_opts.user_agents, m_ua_seed++);
    emit(EventType::Request, req, state, nullptr, verb_name(req.verb));

    std::string authorization;
    if (m_auth->prepare(req, &authorization) < 0)
        LOG_WARN("no authorization prepared for `, continuing anonymous", req.upstream_path);

    ProxyError failure = ProxyError::TransportError;
    Outcome last;
    state.phase = RetryPhase::Attempt;
    while (true) {
        if (cancel && cancel->cancelled())
            return cancelled(state);
        auto out = m_executor->execute(req, authorization, ua.current());
        record(req, state, out);
        if (req.body)
            state.replayable = false;
        if (cancel && cancel->cancelled())
            return cancelled(state);

        state.phase = next_phase(state, out.kind, m_opts.retry);
        LOG_DEBUG("` attempt ` -> ` -> `", req.upstream_path, state.attempt,
                  outcome_name(out.kind), phase_name(state.phase));
        if (state.phase == RetryPhase::Success)
            return succeed(out, state);

        if (state.phase == RetryPhase::NeedAuthRetry) {
            state.auth_retried = true;
            std::string challenge(out.response->header("WWW-Authenticate"));
            std::string rejected = authorization;
            if (m_auth->on_challenge(req, challenge, rejected, &authorization) < 0) {
                failure = ProxyError::AuthFailed;
                last = std::move(out);
                break;
            }
            continue;
        }

        if (state.phase == RetryPhase::NeedRedirect) {
            auto followed = follow_redirect(req, std::move(out), state, ua, cancel);
            if (followed.kind == OutcomeKind::Success) {
                state.phase = RetryPhase::Success;
                return succeed(followed, state);
            }
            if (cancel && cancel->cancelled())
                return cancelled(state);
            failure = followed.kind == OutcomeKind::RateLimited ? ProxyError::RateLimited
                                                                : ProxyError::RedirectExhausted;
            last = std::move(followed);
            if (!state.has_budget(m_opts.retry))
                break;
            state.phase = RetryPhase::NeedBackoff;
        } else if (state.phase == RetryPhase::NeedBackoff) {
            failure = out.kind == OutcomeKind::RateLimited ? ProxyError::RateLimited
                                                           : ProxyError::TransportError;
            last = std::move(out);
        } else {
            // a redirect left unfollowed is handed to the client as is
            if (out.kind == OutcomeKind::Redirect)
                return succeed(out, state);
            if (out.kind == OutcomeKind::Unauthorized)
                failure = ProxyError::AuthFailed;
            else if (out.kind == OutcomeKind::RateLimited)
                failure = ProxyError::RateLimited;
            else
                failure = ProxyError::TransportError;
            last = std::move(out);
            break;
        }

        if (backoff(req, state, ua, cancel) < 0)
            return cancelled(state);
        state.phase = RetryPhase::Attempt;
    }

    state.phase = RetryPhase::Exhausted;
    emit(EventType::Exhausted, req, state, &last, error_name(failure));

    bool retryable = failure == ProxyError::TransportError ||
                     failure == ProxyError::RedirectExhausted;
    if (m_opts.retry.last_resort && retryable && state.replayable &&
        !(cancel && cancel->cancelled())) {
        // one attempt past the budget
        auto out = m_executor->execute(req, {}, ua.current(), true);
        state.attempt++;
        emit(EventType::LastResort, req, state, &out);
        if (out.kind == OutcomeKind::Success || out.kind == OutcomeKind::Redirect)
            return succeed(out, state);
        if (last.status < 0 && out.status > 0)
            last = std::move(out);
    }

    PipelineResult result;
    result.error = failure;
    result.status = last.status;
    result.transport_errno = last.error;
    result.attempts = state.attempt;
    if (last.response && last.status > 0)
        result.response = std::move(last.response);
    result.message = std::string(error_name(failure)) + " after " +
                     std::to_string(state.attempt) + " attempts to " + req.registry->primary_host;
    return result;
}
