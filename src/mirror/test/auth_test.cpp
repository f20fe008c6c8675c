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
#include <errno.h>
#include <gflags/gflags.h>
#include <gtest/gtest.h>
#include <photon/common/alog.h>
#include <photon/photon.h>
#include <photon/thread/thread.h>
#include <photon/thread/thread11.h>
#include <vector>
#include "../auth.h"
#include "../token_cache.h"
#include "fake_transport.h"

DEFINE_int32(log_level, 0, "log level");

TEST(Challenge, bearer_with_quoted_commas) {
    Challenge c;
    ASSERT_EQ(0, parse_challenge("Bearer realm=\"https://auth.docker.io/token\","
                                 "service=\"registry.docker.io\","
                                 "scope=\"repository:library/ubuntu:pull,push\"",
                                 &c));
    EXPECT_EQ("Bearer", c.scheme);
    EXPECT_EQ("https://auth.docker.io/token", c.realm);
    EXPECT_EQ("registry.docker.io", c.service);
    EXPECT_EQ("repository:library/ubuntu:pull,push", c.scope);
}

TEST(Challenge, variants) {
    Challenge c;
    ASSERT_EQ(0, parse_challenge("  bearer realm=https://ghcr.io/token, service=ghcr.io ", &c));
    EXPECT_EQ("Bearer", c.scheme);
    EXPECT_EQ("https://ghcr.io/token", c.realm);
    EXPECT_EQ("ghcr.io", c.service);
    EXPECT_TRUE(c.scope.empty());

    ASSERT_EQ(0, parse_challenge("Basic realm=\"Registry Realm\"", &c));
    EXPECT_EQ("Basic", c.scheme);
    EXPECT_EQ("Registry Realm", c.realm);
    ASSERT_EQ(0, parse_challenge("Basic", &c));
    EXPECT_EQ("Basic", c.scheme);

    errno = 0;
    EXPECT_EQ(-1, parse_challenge("Negotiate abc", &c));
    EXPECT_EQ(EINVAL, errno);
    EXPECT_EQ(-1, parse_challenge("Bearer service=\"x\"", &c));
    EXPECT_EQ(-1, parse_challenge("Bearer realm=\"https://x", &c));
    EXPECT_EQ(-1, parse_challenge("Bearer realm", &c));
}

static RegistryDescriptor registry(const char *id, const char *host, bool requires_auth = false,
                                   const char *auth_server = "") {
    RegistryDescriptor r;
    r.id = id;
    r.primary_host = host;
    r.requires_auth = requires_auth;
    r.auth_server = auth_server;
    r.auth_service = "test-service";
    return r;
}

static ResolvedRequest request(const RegistryDescriptor *r, const char *path, Verb verb = Verb::GET) {
    ResolvedRequest req;
    req.registry = r;
    req.verb = verb;
    req.upstream_path = path;
    classify_path(path, &req);
    return req;
}

TEST(Scope, by_verb) {
    auto r = registry("quay", "quay.io");
    EXPECT_EQ("repository:a/b:pull", request_scope(request(&r, "/v2/a/b/manifests/1")));
    EXPECT_EQ("repository:a/b:pull",
              request_scope(request(&r, "/v2/a/b/blobs/sha256:1", Verb::HEAD)));
    EXPECT_EQ("repository:a/b:pull,push",
              request_scope(request(&r, "/v2/a/b/manifests/1", Verb::PUT)));
    EXPECT_EQ("", request_scope(request(&r, "/v2/")));
}

TEST(Scope, token_url) {
    Challenge c;
    c.realm = "https://auth.example/token";
    c.service = "registry.example";
    c.scope = "repository:a/b:pull";
    auto url = token_url(c, nullptr);
    EXPECT_EQ(0u, url.find("https://auth.example/token?service=registry.example&scope="));
    EXPECT_EQ(std::string::npos, url.find("account="));

    Credential cred{"alice", "secret"};
    url = token_url(c, &cred);
    EXPECT_NE(std::string::npos, url.find("&account=alice"));
    EXPECT_EQ(std::string::npos, url.find("secret"));

    c.realm = "https://auth.example/token?x=1";
    c.service.clear();
    c.scope.clear();
    EXPECT_EQ("https://auth.example/token?x=1", token_url(c, nullptr));
}

static FakeReply token_reply(const std::string &token, int expires_in = 300) {
    FakeReply r;
    r.body = "{\"token\":\"" + token + "\",\"expires_in\":" + std::to_string(expires_in) + "}";
    return r;
}

static FakeReply status_reply(int status) {
    FakeReply r;
    r.status = status;
    return r;
}

class NegotiatorTest : public ::testing::Test {
protected:
    FakeTransport transport;
    TokenCache cache{16};
    CredentialStore creds;
    RecordingSink sink;
    AuthNegotiator auth{&transport, &cache, &creds, &sink};
};

TEST_F(NegotiatorTest, exchange) {
    auto r = registry("docker", "registry-1.docker.io", true, "https://auth.test/token");
    creds.add("docker", Credential{"alice", "secret"});
    transport.route("auth.test", {token_reply("abc")});
    Challenge c{"Bearer", "https://auth.test/token", "test-service", "repository:x/y:pull"};
    AuthToken token;
    auto before = photon::now;
    ASSERT_EQ(0, auth.exchange(r, c, &token));
    EXPECT_EQ("abc", token.value);
    EXPECT_EQ("repository:x/y:pull", token.scope);
    EXPECT_GE(token.expires_at, before + 300UL * 1000 * 1000);
    ASSERT_EQ(1u, transport.calls.size());
    EXPECT_EQ(Credential({"alice", "secret"}).basic(),
              find_header(transport.calls[0].headers, "Authorization"));
    EXPECT_NE(std::string::npos, transport.calls[0].url.find("account=alice"));
    ASSERT_EQ(1u, sink.of(EventType::TokenExchange).size());
    EXPECT_EQ(200, sink.of(EventType::TokenExchange)[0].status);
}

TEST_F(NegotiatorTest, exchange_access_token_and_failures) {
    auto r = registry("quay", "quay.io");
    Challenge c{"Bearer", "https://auth.test/token", "", "repository:x/y:pull"};
    AuthToken token;

    FakeReply access;
    access.body = "{\"access_token\":\"xyz\"}";
    transport.route("auth.test/token", {access, status_reply(500), FakeReply{200, 0, {}, "oops"},
                                        FakeReply{200, 0, {}, "{\"expires_in\":10}"}});
    ASSERT_EQ(0, auth.exchange(r, c, &token));
    EXPECT_EQ("xyz", token.value);
    EXPECT_TRUE(find_header(transport.calls[0].headers, "Authorization").empty());

    errno = 0;
    EXPECT_EQ(-1, auth.exchange(r, c, &token));
    EXPECT_EQ(EACCES, errno);
    EXPECT_EQ(-1, auth.exchange(r, c, &token));
    EXPECT_EQ(-1, auth.exchange(r, c, &token));
    auto events = sink.of(EventType::TokenExchange);
    ASSERT_EQ(4u, events.size());
    EXPECT_EQ(0, events[0].error);
    EXPECT_EQ(500, events[1].status);
    EXPECT_NE(0, events[2].error);
}

TEST_F(NegotiatorTest, prepare) {
    auto docker = registry("docker", "registry-1.docker.io", true, "https://auth.test/token");
    auto quay = registry("quay", "quay.io");
    transport.route("auth.test", {token_reply("t1")});

    // anonymous pulls wait for the challenge even on a private surface
    std::string authorization;
    ASSERT_EQ(0, auth.prepare(request(&docker, "/v2/library/ubuntu/manifests/latest"),
                              &authorization));
    EXPECT_TRUE(authorization.empty());
    EXPECT_TRUE(transport.calls.empty());

    creds.add("docker", Credential{"alice", "secret"});
    ASSERT_EQ(0, auth.prepare(request(&docker, "/v2/library/ubuntu/manifests/latest"),
                              &authorization));
    EXPECT_EQ("Bearer t1", authorization);
    EXPECT_EQ(1u, transport.count("auth.test"));
    EXPECT_NE(std::string::npos, transport.calls[0].url.find("&scope=repository"));

    // cached now
    ASSERT_EQ(0, auth.prepare(request(&docker, "/v2/library/ubuntu/blobs/sha256:aa"),
                              &authorization));
    EXPECT_EQ("Bearer t1", authorization);
    EXPECT_EQ(1u, transport.calls.size());

    // the version check never carries a token
    ASSERT_EQ(0, auth.prepare(request(&docker, "/v2/"), &authorization));
    EXPECT_TRUE(authorization.empty());

    // anonymous registry, never challenged
    ASSERT_EQ(0, auth.prepare(request(&quay, "/v2/a/b/manifests/1"), &authorization));
    EXPECT_TRUE(authorization.empty());
    EXPECT_EQ(1u, transport.calls.size());
}

TEST_F(NegotiatorTest, prepare_failure_goes_anonymous) {
    auto docker = registry("docker", "registry-1.docker.io", true, "https://auth.test/token");
    creds.add("docker", Credential{"alice", "secret"});
    transport.route("auth.test", {status_reply(503)});
    std::string authorization = "stale";
    EXPECT_EQ(0, auth.prepare(request(&docker, "/v2/library/ubuntu/manifests/latest"),
                              &authorization));
    EXPECT_TRUE(authorization.empty());
    EXPECT_EQ(1u, transport.count("auth.test"));
}

TEST_F(NegotiatorTest, challenge_then_cached) {
    auto quay = registry("quay", "quay.io");
    transport.route("quay.io/token", {token_reply("q1"), token_reply("q2")});
    auto req = request(&quay, "/v2/a/b/manifests/1");

    std::string authorization;
    ASSERT_EQ(0, auth.on_challenge(req,
                                   "Bearer realm=\"https://quay.io/token\",service=\"quay.io\","
                                   "scope=\"repository:a/b:pull\"",
                                   "", &authorization));
    EXPECT_EQ("Bearer q1", authorization);
    EXPECT_TRUE(auth.challenged("quay"));

    ASSERT_EQ(0, auth.prepare(req, &authorization));
    EXPECT_EQ("Bearer q1", authorization);
    EXPECT_EQ(1u, transport.calls.size());

    // a rejected token is dropped before fetching again
    ASSERT_EQ(0, auth.on_challenge(req,
                                   "Bearer realm=\"https://quay.io/token\",service=\"quay.io\","
                                   "scope=\"repository:a/b:pull\"",
                                   "Bearer q1", &authorization));
    EXPECT_EQ("Bearer q2", authorization);
    EXPECT_EQ(2u, transport.calls.size());

    // without credentials other repositories wait for their own challenge
    auto other = request(&quay, "/v2/c/d/blobs/sha256:ee");
    ASSERT_EQ(0, auth.prepare(other, &authorization));
    EXPECT_TRUE(authorization.empty());
}

TEST_F(NegotiatorTest, challenge_errors) {
    auto r = registry("private", "private.example");
    auto req = request(&r, "/v2/a/b/manifests/1");
    std::string authorization;

    errno = 0;
    EXPECT_EQ(-1, auth.on_challenge(req, "", "", &authorization));
    EXPECT_EQ(EACCES, errno);
    EXPECT_EQ(-1, auth.on_challenge(req, "Basic realm=\"x\"", "", &authorization));
    EXPECT_EQ(EACCES, errno);

    creds.add("private.example", Credential{"bob", "pw"});
    ASSERT_EQ(0, auth.on_challenge(req, "Basic realm=\"x\"", "", &authorization));
    EXPECT_EQ(Credential({"bob", "pw"}).basic(), authorization);
    EXPECT_TRUE(transport.calls.empty());

    transport.route("private.example/token", {status_reply(401)});
    EXPECT_EQ(-1, auth.on_challenge(req, "Bearer realm=\"https://private.example/token\"", "",
                                    &authorization));
    EXPECT_EQ(EACCES, errno);
}

struct FlightContext {
    TokenCache *cache;
    std::string scope;
    uint64_t delay;
    int fetches = 0;
    int fail_errno = 0;
    std::vector<int> rets;
    std::vector<int> errs;
    std::vector<std::string> values;
};

static int flight_fetch(FlightContext *ctx, AuthToken *t) {
    ctx->fetches++;
    photon::thread_usleep(ctx->delay);
    if (ctx->fail_errno) {
        errno = ctx->fail_errno;
        return -1;
    }
    t->value = "shared";
    t->expires_at = photon::now + 60UL * 1000 * 1000;
    return 0;
}

static void flight_worker(FlightContext *ctx, int i) {
    AuthToken t;
    auto fetch = [ctx](AuthToken *out) -> int { return flight_fetch(ctx, out); };
    ctx->rets[i] = ctx->cache->acquire("docker", ctx->scope, &t, fetch);
    ctx->errs[i] = errno;
    ctx->values[i] = t.value;
}

static void run_flight(FlightContext *ctx, int n) {
    ctx->rets.assign(n, -2);
    ctx->errs.assign(n, 0);
    ctx->values.assign(n, "");
    std::vector<photon::join_handle *> jhs;
    for (int i = 0; i < n; i++)
        jhs.push_back(photon::thread_enable_join(photon::thread_create11(&flight_worker, ctx, i)));
    photon::thread_yield();
    EXPECT_EQ(1u, ctx->cache->inflight());
    for (auto jh : jhs)
        photon::thread_join(jh);
    EXPECT_EQ(0u, ctx->cache->inflight());
}

TEST(TokenCache, single_flight_success) {
    TokenCache cache(8);
    FlightContext ctx{&cache, "repository:a/b:pull", 50 * 1000};
    run_flight(&ctx, 10);

    EXPECT_EQ(1, ctx.fetches);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(0, ctx.rets[i]);
        EXPECT_EQ("shared", ctx.values[i]);
    }
    AuthToken t;
    EXPECT_TRUE(cache.lookup("docker", "repository:a/b:pull", &t));
}

TEST(TokenCache, single_flight_failure) {
    TokenCache cache(8);
    FlightContext ctx{&cache, "repository:a/b:pull", 30 * 1000};
    ctx.fail_errno = EACCES;
    run_flight(&ctx, 5);

    EXPECT_EQ(1, ctx.fetches);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(-1, ctx.rets[i]);
        EXPECT_EQ(EACCES, ctx.errs[i]);
    }
    EXPECT_EQ(0u, cache.size());

    // nothing is remembered about the failure
    int fetches = 0;
    auto ok = [&](AuthToken *t) -> int {
        fetches++;
        t->value = "later";
        return 0;
    };
    AuthToken t;
    EXPECT_EQ(0, cache.acquire("docker", "repository:a/b:pull", &t, ok));
    EXPECT_EQ("later", t.value);
    EXPECT_EQ(1, fetches);
}

static void slow_worker(TokenCache *cache, const char *scope, int *ret) {
    AuthToken t;
    auto slow = [](AuthToken *out) -> int {
        photon::thread_usleep(100 * 1000);
        out->value = "v";
        return 0;
    };
    *ret = cache->acquire("quay", scope, &t, slow);
}

TEST(TokenCache, distinct_keys_do_not_wait) {
    TokenCache cache(8);
    const char *scopes[] = {"repository:a:pull", "repository:b:pull", "repository:c:pull"};
    int rets[3] = {-2, -2, -2};
    auto start = photon::now;
    std::vector<photon::join_handle *> jhs;
    for (int i = 0; i < 3; i++)
        jhs.push_back(photon::thread_enable_join(
            photon::thread_create11(&slow_worker, &cache, scopes[i], &rets[i])));
    for (auto jh : jhs)
        photon::thread_join(jh);
    EXPECT_LT(photon::now - start, 200UL * 1000);
    for (auto r : rets)
        EXPECT_EQ(0, r);
    EXPECT_EQ(3u, cache.size());
}

TEST(TokenCache, expiry) {
    TokenCache cache(8);
    int fetches = 0;
    auto fetch = [&](AuthToken *t) -> int {
        fetches++;
        t->value = "short";
        t->expires_at = photon::now + 50 * 1000;
        return 0;
    };
    AuthToken t;
    ASSERT_EQ(0, cache.acquire("gcr", "s", &t, fetch));
    EXPECT_TRUE(cache.lookup("gcr", "s", &t));
    photon::thread_usleep(100 * 1000);
    EXPECT_FALSE(cache.lookup("gcr", "s", &t));
    ASSERT_EQ(0, cache.acquire("gcr", "s", &t, fetch));
    EXPECT_EQ(2, fetches);
}

TEST(TokenCache, lru_and_invalidate) {
    TokenCache cache(2);
    auto make = [](const char *v) {
        return [v](AuthToken *t) -> int {
            t->value = v;
            return 0;
        };
    };
    AuthToken t;
    ASSERT_EQ(0, cache.acquire("r", "a", &t, make("A")));
    ASSERT_EQ(0, cache.acquire("r", "b", &t, make("B")));
    EXPECT_TRUE(cache.lookup("r", "a", &t)); // a is now most recent
    ASSERT_EQ(0, cache.acquire("r", "c", &t, make("C")));
    EXPECT_EQ(2u, cache.size());
    EXPECT_TRUE(cache.lookup("r", "a", &t));
    EXPECT_FALSE(cache.lookup("r", "b", &t));
    EXPECT_TRUE(cache.lookup("r", "c", &t));

    // same scope on another registry is another key
    EXPECT_FALSE(cache.lookup("other", "a", &t));

    cache.invalidate("r", "a", "not-the-value");
    EXPECT_TRUE(cache.lookup("r", "a", &t));
    cache.invalidate("r", "a", "A");
    EXPECT_FALSE(cache.lookup("r", "a", &t));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::gflags::ParseCommandLineFlags(&argc, &argv, true);
    log_output_level = FLAGS_log_level;
    photon::init(photon::INIT_EVENT_DEFAULT, photon::INIT_IO_NONE);
    auto ret = RUN_ALL_TESTS();
    photon::fini();
    return ret;
}
