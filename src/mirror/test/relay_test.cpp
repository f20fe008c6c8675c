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
#include <rapidjson/document.h>
#include "../relay.h"
#include "fake_transport.h"

DEFINE_int32(log_level, 0, "log level");

class RelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.id = "docker";
        registry.primary_host = "registry-1.docker.io";
        req.registry = &registry;
        req.upstream_path = "/v2/library/ubuntu/blobs/sha256:aa";
        classify_path(req.upstream_path, &req);
    }

    FakeResponse response(int status, HeaderList headers, std::string body,
                          bool no_length = false) {
        FakeReply r;
        r.status = status;
        r.headers = std::move(headers);
        r.body = std::move(body);
        r.no_length = no_length;
        return FakeResponse(r);
    }

    RegistryDescriptor registry;
    ResolvedRequest req;
    RecordingSink sink;
    CaptureWriter out;
    RelayStats stats;
};

TEST_F(RelayTest, headers_and_body) {
    auto resp = response(200,
                         {{"Content-Type", "application/octet-stream"},
                          {"Docker-Content-Digest", "sha256:aa"},
                          {"Connection", "close"},
                          {"Transfer-Encoding", "chunked"},
                          {"Keep-Alive", "timeout=5"},
                          {"ETag", "\"sha256:aa\""}},
                         std::string(100000, 'x'));
    ResponseRelay relay(&sink, 4096);
    ASSERT_EQ(0, relay.relay(req, &resp, &out, &stats));
    EXPECT_EQ(200, out.status);
    EXPECT_EQ(100000, out.content_length);
    EXPECT_EQ(100000u, out.body.size());
    EXPECT_TRUE(out.keep_alive);
    EXPECT_EQ("sha256:aa", find_header(out.headers, "Docker-Content-Digest"));
    EXPECT_EQ("\"sha256:aa\"", find_header(out.headers, "ETag"));
    EXPECT_EQ("application/octet-stream", find_header(out.headers, "Content-Type"));
    EXPECT_FALSE(has_header(out.headers, "Connection"));
    EXPECT_FALSE(has_header(out.headers, "Transfer-Encoding"));
    EXPECT_FALSE(has_header(out.headers, "Keep-Alive"));
    EXPECT_FALSE(has_header(out.headers, "Content-Length"));
    EXPECT_EQ(200, stats.status);
    EXPECT_EQ(100000u, stats.bytes);
    EXPECT_TRUE(stats.complete);
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(RelayTest, unknown_length_closes_connection) {
    auto resp = response(200, {}, "streamed body", true);
    ResponseRelay relay(&sink, 5);
    ASSERT_EQ(0, relay.relay(req, &resp, &out, &stats));
    EXPECT_EQ("streamed body", out.body);
    EXPECT_FALSE(out.keep_alive);
    EXPECT_EQ(-1, out.content_length);
}

TEST_F(RelayTest, no_body_for_head_and_304) {
    req.verb = Verb::HEAD;
    auto head = response(200, {{"Docker-Content-Digest", "sha256:aa"}}, "ignored");
    ResponseRelay relay(&sink);
    ASSERT_EQ(0, relay.relay(req, &head, &out, &stats));
    EXPECT_TRUE(out.body.empty());
    EXPECT_EQ(7, out.content_length);
    EXPECT_EQ("sha256:aa", find_header(out.headers, "Docker-Content-Digest"));

    req.verb = Verb::GET;
    CaptureWriter out2;
    auto not_modified = response(304, {{"ETag", "x"}}, "");
    ASSERT_EQ(0, relay.relay(req, &not_modified, &out2, &stats));
    EXPECT_EQ(304, out2.status);
    EXPECT_TRUE(out2.body.empty());
}

TEST_F(RelayTest, rate_limit_headers_reach_client_and_events) {
    auto resp = response(429,
                         {{"RateLimit-Limit", "100;w=21600"},
                          {"RateLimit-Remaining", "0;w=21600"},
                          {"Docker-RateLimit-Source", "10.0.0.1"},
                          {"Content-Type", "application/json"}},
                         "{\"errors\":[{\"code\":\"TOOMANYREQUESTS\"}]}");
    ResponseRelay relay(&sink);
    ASSERT_EQ(0, relay.relay(req, &resp, &out, &stats));
    EXPECT_EQ(429, out.status);
    EXPECT_EQ("0;w=21600", find_header(out.headers, "RateLimit-Remaining"));
    EXPECT_EQ("{\"errors\":[{\"code\":\"TOOMANYREQUESTS\"}]}", out.body);

    auto events = sink.of(EventType::RateLimited);
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(3u, events[0].headers.size());
    EXPECT_EQ("relayed", events[0].detail);
    EXPECT_EQ("docker", events[0].registry);
}

TEST_F(RelayTest, forbidden_without_limits_emits_nothing) {
    auto resp = response(403, {}, "denied");
    ResponseRelay relay(&sink);
    ASSERT_EQ(0, relay.relay(req, &resp, &out, &stats));
    EXPECT_EQ(403, out.status);
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(RelayTest, client_gone_cancels) {
    auto resp = response(200, {}, std::string(1000, 'y'));
    out.fail_after = 300;
    Cancellation cancel;
    ResponseRelay relay(&sink, 100);
    EXPECT_EQ(-1, relay.relay(req, &resp, &out, &stats, &cancel));
    EXPECT_TRUE(cancel.cancelled());
    EXPECT_FALSE(stats.complete);
    EXPECT_EQ(300u, stats.bytes);
}

class ShortResponse : public FakeResponse {
public:
    using FakeResponse::FakeResponse;
    ssize_t content_length() const override {
        return 50;
    }
};

TEST_F(RelayTest, short_upstream_body) {
    FakeReply r;
    r.body = "only twenty bytes!!!";
    ShortResponse resp(r);
    ResponseRelay relay(&sink);
    errno = 0;
    EXPECT_EQ(-1, relay.relay(req, &resp, &out, &stats));
    EXPECT_EQ(EPIPE, errno);
    EXPECT_FALSE(stats.complete);
    EXPECT_EQ(20u, stats.bytes);
}

TEST_F(RelayTest, error_responses) {
    ResponseRelay relay(&sink);
    ASSERT_EQ(0, relay.relay_error(ProxyError::UnresolvedPath, 0, "no upstream registry for /foo",
                                   &out, &stats));
    EXPECT_EQ(404, out.status);
    EXPECT_EQ("application/json; charset=utf-8", find_header(out.headers, "Content-Type"));
    EXPECT_EQ("registry/2.0", find_header(out.headers, "Docker-Distribution-Api-Version"));
    EXPECT_EQ((int64_t)out.body.size(), out.content_length);

    rapidjson::Document d;
    ASSERT_FALSE(d.Parse(out.body.c_str()).HasParseError());
    ASSERT_TRUE(d.HasMember("errors"));
    ASSERT_EQ(1u, d["errors"].Size());
    EXPECT_STREQ("NAME_UNKNOWN", d["errors"][0]["code"].GetString());
    EXPECT_STREQ("no upstream registry for /foo", d["errors"][0]["message"].GetString());

    struct {
        ProxyError err;
        int err_no;
        int status;
        const char *code;
    } cases[] = {
        {ProxyError::AuthFailed, 0, 401, "UNAUTHORIZED"},
        {ProxyError::RateLimited, 0, 429, "TOOMANYREQUESTS"},
        {ProxyError::TransportError, ECONNREFUSED, 502, "UNAVAILABLE"},
        {ProxyError::TransportError, ETIMEDOUT, 504, "UNAVAILABLE"},
        {ProxyError::RedirectExhausted, 0, 502, "BLOB_UNKNOWN"},
        {ProxyError::Cancelled, ECANCELED, 503, "UNAVAILABLE"},
    };
    for (auto &c : cases) {
        CaptureWriter w;
        ASSERT_EQ(0, relay.relay_error(c.err, c.err_no, "m\"quoted\"", &w, &stats));
        EXPECT_EQ(c.status, w.status) << error_name(c.err);
        EXPECT_EQ(c.status, stats.status);
        rapidjson::Document doc;
        ASSERT_FALSE(doc.Parse(w.body.c_str()).HasParseError()) << w.body;
        EXPECT_STREQ(c.code, doc["errors"][0]["code"].GetString());
        EXPECT_STREQ("m\"quoted\"", doc["errors"][0]["message"].GetString());
    }
}

TEST(Headers, helpers) {
    HeaderList h{{"Content-Type", "a"}, {"x-dup", "1"}, {"X-Dup", "2"}};
    EXPECT_EQ("a", find_header(h, "content-type"));
    EXPECT_EQ("1", find_header(h, "X-DUP"));
    set_header(h, "x-dup", "3");
    EXPECT_EQ(2u, h.size());
    EXPECT_EQ("3", find_header(h, "X-Dup"));
    EXPECT_EQ(1u, remove_header(h, "X-DUP"));
    EXPECT_FALSE(has_header(h, "x-dup"));

    for (auto k : {"Connection", "keep-alive", "Proxy-Authorization", "TE", "Trailer",
                   "transfer-encoding", "Upgrade", "Host", "Content-Length"})
        EXPECT_TRUE(is_hop_by_hop(k)) << k;
    for (auto k : {"Range", "Authorization", "Docker-Content-Digest", "WWW-Authenticate"})
        EXPECT_FALSE(is_hop_by_hop(k)) << k;

    EXPECT_EQ("s1.test", url_host("https://s1.test/a/b?x=1&y=2"));
    EXPECT_EQ("https://cdn.test/a/b?x=1&y=2", replace_host("https://s1.test/a/b?x=1&y=2", "cdn.test"));
    EXPECT_EQ("http://cdn.test/", replace_host("http://s1.test", "cdn.test"));
    EXPECT_EQ("", url_host("not a url"));
    EXPECT_TRUE(replace_host("not a url", "cdn.test").empty());
}

TEST(Headers, request_body_size) {
    uint64_t size = 0;
    EXPECT_TRUE(request_body_size({{"Content-Length", "7"}}, &size));
    EXPECT_EQ(7u, size);
    EXPECT_TRUE(request_body_size({{"transfer-encoding", "chunked"}}, &size));
    EXPECT_EQ(kUnknownBodySize, size);
    EXPECT_FALSE(request_body_size({{"Content-Length", "0"}}, &size));
    EXPECT_FALSE(request_body_size({{"Content-Type", "text/plain"}}, &size));
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
