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
#include "retry.h"

#include <random>

const char *phase_name(RetryPhase phase) {
    switch (phase) {
    case RetryPhase::Init:
        return "INIT";
    case RetryPhase::Attempt:
        return "ATTEMPT";
    case RetryPhase::Success:
        return "SUCCESS";
    case RetryPhase::NeedAuthRetry:
        return "NEED_AUTH_RETRY";
    case RetryPhase::NeedRedirect:
        return "NEED_REDIRECT";
    case RetryPhase::NeedBackoff:
        return "NEED_BACKOFF";
    case RetryPhase::Exhausted:
        return "EXHAUSTED";
    }
    return "UNKNOWN";
}

RetryPhase next_phase(const RetryState &state, OutcomeKind outcome, const RetryPolicy &policy) {
    switch (outcome) {
    case OutcomeKind::Success:
        return RetryPhase::Success;
    case OutcomeKind::Unauthorized:
        if (state.auth_retried || !state.replayable || !state.has_budget(policy))
            return RetryPhase::Exhausted;
        return RetryPhase::NeedAuthRetry;
    case OutcomeKind::Redirect:
        // a followed hop costs one unit of the budget
        if (!state.replayable || !state.has_budget(policy))
            return RetryPhase::Exhausted;
        return RetryPhase::NeedRedirect;
    case OutcomeKind::RateLimited:
    case OutcomeKind::TransportError:
        if (!state.replayable || !state.has_budget(policy))
            return RetryPhase::Exhausted;
        return RetryPhase::NeedBackoff;
    }
    return RetryPhase::Exhausted;
}

static uint64_t exponential(const RetryPolicy &policy, int attempt) {
    if (attempt < 0)
        attempt = 0;
    if (attempt >= 32)
        return policy.max_delay;
    auto d = policy.base_delay << attempt;
    return d < policy.max_delay || policy.base_delay == 0 ? d : policy.max_delay;
}

uint64_t backoff_delay(const RetryPolicy &policy, int attempt, uint64_t jitter) {
    auto d = exponential(policy, attempt) + jitter;
    return d < policy.max_delay ? d : policy.max_delay;
}

uint64_t draw_jitter(const RetryPolicy &policy, int attempt) {
    auto range = exponential(policy, attempt);
    if (range == 0)
        return 0;
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::uniform_int_distribution<uint64_t>(0, range - 1)(rng);
}

std::vector<std::string> default_user_agents() {
    return {
        "docker/24.0.7 go/go1.20.10 git-commit/311b9ff kernel/6.5.0 os/linux arch/amd64 "
        "UpstreamClient(Docker-Client/24.0.7 \\(linux\\))",
        "docker/20.10.24 go/go1.19.7 git-commit/5d6db84 kernel/5.15.0 os/linux arch/amd64 "
        "UpstreamClient(Docker-Client/20.10.24 \\(linux\\))",
        "containerd/v1.7.11",
        DOCKER_MIRROR_VERSION,
    };
}

UserAgentRotation::UserAgentRotation(const std::vector<std::string> &agents, size_t start)
    : m_agents(agents.empty() ? default_user_agents() : agents) {
    m_index = start % m_agents.size();
}
