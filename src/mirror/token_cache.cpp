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
#include "token_cache.h"

#include <errno.h>
#include <photon/common/alog-stdstring.h>

TokenCache::TokenCache(size_t capacity) : m_capacity(capacity ? capacity : 1) {}

std::string TokenCache::make_key(const std::string &registry, const std::string &scope) {
    return registry + "|" + scope;
}

bool TokenCache::find_valid(const std::string &key, AuthToken *token) {
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    if (it->second.token.expired(photon::now)) {
        LOG_DEBUG("token for ` expired", key);
        m_lru.erase(it->second.lru);
        m_entries.erase(it);
        return false;
    }
    m_lru.splice(m_lru.begin(), m_lru, it->second.lru);
    *token = it->second.token;
    return true;
}

void TokenCache::store(const std::string &key, const AuthToken &token) {
    if (token.expired(photon::now))
        return;
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        it->second.token = token;
        m_lru.splice(m_lru.begin(), m_lru, it->second.lru);
        return;
    }
    while (m_entries.size() >= m_capacity && !m_lru.empty()) {
        LOG_DEBUG("evict token for `", m_lru.back());
        m_entries.erase(m_lru.back());
        m_lru.pop_back();
    }
    m_lru.push_front(key);
    m_entries.emplace(key, Entry{token, m_lru.begin()});
}

bool TokenCache::lookup(const std::string &registry, const std::string &scope, AuthToken *token) {
    photon::scoped_lock lock(m_mutex);
    return find_valid(make_key(registry, scope), token);
}

void TokenCache::invalidate(const std::string &registry, const std::string &scope,
                            const std::string &value) {
    photon::scoped_lock lock(m_mutex);
    auto it = m_entries.find(make_key(registry, scope));
    if (it == m_entries.end() || it->second.token.value != value)
        return;
    m_lru.erase(it->second.lru);
    m_entries.erase(it);
}

int TokenCache::acquire(const std::string &registry, const std::string &scope, AuthToken *token,
                        const Fetcher &fetch) {
    auto key = make_key(registry, scope);
    photon::scoped_lock lock(m_mutex);
    if (find_valid(key, token))
        return 0;

    auto it = m_flights.find(key);
    if (it != m_flights.end()) {
        auto flight = it->second;
        LOG_DEBUG("join in-flight token fetch for `", key);
        while (!flight->finished)
            flight->done.wait(lock);
        if (flight->result < 0) {
            errno = flight->error;
            return -1;
        }
        *token = flight->token;
        return 0;
    }

    auto flight = std::make_shared<Flight>();
    m_flights.emplace(key, flight);
    lock.unlock();

    AuthToken fetched;
    fetched.scope = scope;
    int ret = fetch(&fetched);
    int err = ret < 0 ? (errno ? errno : EACCES) : 0;

    lock.lock();
    m_flights.erase(key);
    flight->finished = true;
    flight->result = ret < 0 ? -1 : 0;
    flight->error = err;
    if (ret >= 0) {
        flight->token = fetched;
        store(key, fetched);
        *token = fetched;
    }
    flight->done.notify_all();
    if (ret < 0) {
        errno = err;
        return -1;
    }
    return 0;
}
