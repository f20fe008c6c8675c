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

#include <stdint.h>
#include <set>
#include <string>
#include <vector>
#include "executor.h"

enum class RetryPhase {
    Init,
    Attempt,
    Success,
    NeedAuthRetry,
    NeedRedirect,
    NeedBackoff,
    Exhausted,
};

const char *phase_name(RetryPhase phase);

struct RetryPolicy {
    int max_attempts = 4;
    uint64_t base_delay = 500UL * 1000;
    uint64_t max_delay = 8UL * 1000 * 1000;
    bool last_resort = true;
};

// State of one logical upstream operation, never shared.
struct RetryState {
    RetryPhase phase = RetryPhase::Init;
    int attempt = 0;            // upstream attempts issued so far
    bool auth_retried = false;
    bool replayable = true;     // false once a request body was sent
    int last_status = -1;
    int last_error = 0;
    std::set<std::string> hosts_tried;
    uint64_t backoff_deadline = 0;

    bool has_budget(const RetryPolicy &policy) const {
        return attempt < policy.max_attempts;
    }
};

// Transition taken once an attempt ended with `outcome`. Pure.
RetryPhase next_phase(const RetryState &state, OutcomeKind outcome, const RetryPolicy &policy);

// min(max_delay, base_delay * 2^attempt + jitter); with jitter below
// base_delay * 2^attempt successive delays never decrease
uint64_t backoff_delay(const RetryPolicy &policy, int attempt, uint64_t jitter);

// uniform in [0, base_delay * 2^attempt)
uint64_t draw_jitter(const RetryPolicy &policy, int attempt);

std::vector<std::string> default_user_agents();

class UserAgentRotation {
public:
    explicit UserAgentRotation(const std::vector<std::string> &agents, size_t start = 0);

    const std::string &current() const {
        return m_agents[m_index];
    }
    const std::string &rotate() {
        m_index = (m_index + 1) % m_agents.size();
        return current();
    }
    size_t size() const {
        return m_agents.size();
    }

private:
    std::vector<std::string> m_agents;
    size_t m_index;
};
