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
#include <string>
#include <vector>
#include "auth.h"
#include "cancellation.h"
#include "errors.h"
#include "events.h"
#include "executor.h"
#include "retry.h"

struct PipelineOptions {
    RetryPolicy retry;
    int max_redirect_hops = 5;
    std::vector<std::string> user_agents;
};

struct PipelineResult {
    ProxyError error = ProxyError::None;
    // response to relay, also kept on failure when the upstream answered
    std::unique_ptr<UpstreamResponse> response;
    int status = -1;
    int transport_errno = 0;
    int attempts = 0;
    std::string message;
};

// Drives one logical operation through the retry state machine: auth
// retries, redirect and cdn fallback, backoff and the last resort attempt.
class UpstreamPipeline {
public:
    UpstreamPipeline(UpstreamExecutor *executor, AuthNegotiator *auth, EventSink *events,
                     const PipelineOptions &opts);

    PipelineResult run(const ResolvedRequest &req, Cancellation *cancel = nullptr);

    const PipelineOptions &options() const {
        return m_opts;
    }

private:
    Outcome follow_redirect(const ResolvedRequest &req, Outcome redirect, RetryState &state,
                            UserAgentRotation &ua, Cancellation *cancel);
    int backoff(const ResolvedRequest &req, RetryState &state, UserAgentRotation &ua,
                Cancellation *cancel);
    void record(const ResolvedRequest &req, RetryState &state, const Outcome &out);
    void emit(EventType type, const ResolvedRequest &req, const RetryState &state,
              const Outcome *out = nullptr, std::string detail = {});

    UpstreamExecutor *m_executor;
    AuthNegotiator *m_auth;
    EventSink *m_events;
    PipelineOptions m_opts;
    size_t m_ua_seed = 0;
};
