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
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <photon/thread/thread.h>

struct AuthToken {
    std::string scope;
    std::string value;
    uint64_t expires_at = 0; // photon::now based, 0 for no recorded expiry

    bool expired(uint64_t now) const {
        return expires_at != 0 && expires_at <= now;
    }
};

// Process-wide token table keyed by (registry id, scope).
//
// A miss starts one fetch per key; concurrent misses on the same key suspend
// on that flight and all observe its token or its failure. Misses on other
// keys never wait on it. Expired entries are dropped when looked up, and the
// least recently used entry is evicted beyond `capacity`.
class TokenCache {
public:
    // fills the token, returns 0 or -1 with errno
    using Fetcher = std::function<int(AuthToken *)>;

    explicit TokenCache(size_t capacity = 1024);

    int acquire(const std::string &registry, const std::string &scope, AuthToken *token,
                const Fetcher &fetch);
    // cached and unexpired only, never fetches
    bool lookup(const std::string &registry, const std::string &scope, AuthToken *token);
    // drops the entry if it still holds `value`
    void invalidate(const std::string &registry, const std::string &scope,
                    const std::string &value);

    size_t size() const {
        return m_entries.size();
    }
    size_t capacity() const {
        return m_capacity;
    }
    size_t inflight() const {
        return m_flights.size();
    }

private:
    struct Flight {
        photon::condition_variable done;
        bool finished = false;
        int result = -1;
        int error = 0;
        AuthToken token;
    };
    struct Entry {
        AuthToken token;
        std::list<std::string>::iterator lru;
    };

    static std::string make_key(const std::string &registry, const std::string &scope);
    bool find_valid(const std::string &key, AuthToken *token);
    void store(const std::string &key, const AuthToken &token);

    size_t m_capacity;
    photon::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    std::list<std::string> m_lru; // most recent first
    std::unordered_map<std::string, std::shared_ptr<Flight>> m_flights;
};
