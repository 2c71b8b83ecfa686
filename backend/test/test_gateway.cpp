#include "../src/access/data_access.hpp"
#include "../src/auth/credential_verifier.hpp"
#include "../src/auth/session_verifier_redis.hpp"
#include "../src/pipeline/price_source.hpp"
#include "../src/pipeline/topic_snapshot.hpp"
#include "../src/stream/connection_gateway.hpp"
#include "../src/stream/connection_registry.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>
#include <memory>

using json = nlohmann::json;

namespace {

class IdleWorker final : public ITopicWorker {
public:
    explicit IdleWorker(TopicId t) : t_(t) {}
    TopicId topic() const override { return t_; }
    void start() override { state_ = WorkerState::Running; }
    void stop() override { state_ = WorkerState::Stopped; }
    WorkerState state() const override { return state_; }
private:
    TopicId t_;
    std::atomic<WorkerState> state_{WorkerState::Starting};
};

struct Fixture {
    std::shared_ptr<MemoryDataAccess> db = make_memory_data_access();
    std::shared_ptr<StaticVerifier> verifier = std::make_shared<StaticVerifier>();
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::shared_ptr<TopicSnapshotter> snap;
    ConnectionRegistry registry{[](TopicId t, const Principal&, ConnectionRegistry&)
                                    -> std::unique_ptr<ITopicWorker> {
        return std::make_unique<IdleWorker>(t);
    }};
    std::unique_ptr<ConnectionGateway> gw;

    Fixture() {
        seed_demo_data(*db);   // users 1,2 active, 3 inactive; lists 1 (u1), 2 (u1 public), 3 (u2)
        verifier->add("alice", 1);
        verifier->add("bob", 2);
        verifier->add("carol", 3);
        verifier->add("ghost", 99);
        verifier->add_malformed("blank");
        provider->set("7203", 2500.0, 2450.0);

        TokenBucketLimiter::Options lo;
        lo.key = "test:gateway";
        auto limiter = std::make_shared<TokenBucketLimiter>(make_memory_bucket_store(), lo);
        auto prices = std::make_shared<PriceSource>(provider, limiter, nullptr, PriceSource::Options{});
        snap = std::make_shared<TopicSnapshotter>(db, prices);
        gw = std::make_unique<ConnectionGateway>(verifier, snap, registry);
    }

    Rejection reject(TopicId topic, const std::string& token) {
        AdmitResult r = gw->admit(StreamTarget{topic, token});
        auto* rej = std::get_if<Rejection>(&r);
        assert(rej);
        return *rej;
    }
};

} // namespace

static void test_parse_target() {
    auto t = ConnectionGateway::parse_target("/api/v1/ws/watchlist/42/prices?token=abc%2Bdef");
    assert(t && t->topic == 42 && t->token == "abc+def");

    auto no_token = ConnectionGateway::parse_target("/api/v1/ws/watchlist/7/prices");
    assert(no_token && no_token->topic == 7 && no_token->token.empty());

    assert(!ConnectionGateway::parse_target("/api/v1/ws/watchlist/abc/prices?token=x"));
    assert(!ConnectionGateway::parse_target("/api/v1/ws/watchlist/7/quotes?token=x"));
    assert(!ConnectionGateway::parse_target("/api/health"));
    assert(!ConnectionGateway::parse_target("/api/v1/ws/watchlist//prices"));
}

static void test_rejections() {
    Fixture f;
    Rejection r = f.reject(1, "");
    assert(r.code == close_code::policy && r.reason == "Missing authentication token");

    r = f.reject(1, "nope");
    assert(r.code == close_code::policy && r.reason == "Invalid or expired session");

    r = f.reject(1, "blank");
    assert(r.code == close_code::policy && r.reason == "Invalid session data");

    r = f.reject(1, "ghost");
    assert(r.code == close_code::policy && r.reason == "User not found");

    r = f.reject(1, "carol");
    assert(r.code == close_code::policy && r.reason == "User account is inactive");

    r = f.reject(999, "alice");
    assert(r.code == close_code::policy && r.reason == "Watchlist not found or access denied");

    r = f.reject(1, "bob");   // private list of another user
    assert(r.code == close_code::policy && r.reason == "Watchlist not found or access denied");

    f.verifier->set_available(false);
    r = f.reject(1, "alice");
    assert(r.code == close_code::internal_error && r.reason == "Session service unavailable");
    f.verifier->set_available(true);

    f.db->set_failing(true);
    r = f.reject(1, "alice");
    assert(r.code == close_code::internal_error);
    f.db->set_failing(false);

    assert(f.registry.stats().connections == 0);
}

static void test_admit_public_and_initial_frame() {
    Fixture f;
    AdmitResult r = f.gw->admit(StreamTarget{2, "bob"});   // public list owned by user 1
    auto* adm = std::get_if<Admission>(&r);
    assert(adm && adm->principal.user_id == 2);
    json j = json::parse(adm->initial_frame);
    assert(j["type"] == "price_update" && j["topic_id"] == 2);
    assert(j["items"].size() == 3);

    AdmitResult own = f.gw->admit(StreamTarget{1, "alice"});
    auto* a = std::get_if<Admission>(&own);
    assert(a);
    json k = json::parse(a->initial_frame);
    assert(k["items"][0]["symbol"] == "7203");
    assert(k["items"][0]["price"] == 2500.0);
    assert(k["items"][0]["delta"] == 50.0);
    assert(k["items"][0]["delta_percent"] == 2.04);
    assert(k["items"][0]["unrealized_pnl"] == 10000.0);
}

static void test_open_ping_close() {
    Fixture f;
    AdmitResult r = f.gw->admit(StreamTarget{1, "alice"});
    auto& adm = std::get<Admission>(r);
    auto c = std::make_shared<FakeConnection>(10, 1, 1);

    assert(f.gw->open(c, adm.initial_frame));
    assert(c->frame_count() == 1);
    assert(f.registry.subscriber_count(1) == 1);
    assert(f.registry.has_worker(1));

    f.gw->on_frame(c, "ping");
    f.gw->on_frame(c, R"({"type":"ping"})");
    f.gw->on_frame(c, R"({"type":"subscribe","symbols":["X"]})");
    f.gw->on_frame(c, "hello");
    auto frames = c->frames();
    assert(frames.size() == 3);
    assert(frames[1] == R"({"type":"pong"})" && frames[2] == frames[1]);

    f.gw->on_close(c);
    f.gw->on_close(c);
    assert(f.registry.subscriber_count(1) == 0);
    assert(!f.registry.has_worker(1));
}

static void test_open_fails_when_initial_send_fails() {
    Fixture f;
    AdmitResult r = f.gw->admit(StreamTarget{1, "alice"});
    auto c = std::make_shared<FakeConnection>(11, 1, 1);
    c->fail_sends = true;
    assert(!f.gw->open(c, std::get<Admission>(r).initial_frame));
    assert(c->closes() == 1);
    assert(f.registry.subscriber_count(1) == 0);
    assert(!f.registry.has_worker(1));
    f.gw->on_close(c);   // harmless
}

static void test_session_documents() {
    assert(RedisSessionVerifier::parse_session(R"({"user_id":7,"email":"a@b"})") == UserId{7});
    assert(RedisSessionVerifier::parse_session(R"({"user_id":"12"})") == UserId{12});
    assert(!RedisSessionVerifier::parse_session(R"({"email":"a@b"})"));
    assert(!RedisSessionVerifier::parse_session(R"({"user_id":"12x"})"));
    assert(!RedisSessionVerifier::parse_session("garbage"));
}

static void test_is_ping() {
    assert(ConnectionGateway::is_ping("ping"));
    assert(ConnectionGateway::is_ping(R"({"type":"ping"})"));
    assert(!ConnectionGateway::is_ping("PING"));
    assert(!ConnectionGateway::is_ping(R"({"type":"pong"})"));
    assert(!ConnectionGateway::is_ping("{not json"));
    assert(!ConnectionGateway::is_ping(R"(["ping"])"));
}

int main() {
    test_parse_target();
    test_rejections();
    test_admit_public_and_initial_frame();
    test_open_ping_close();
    test_open_fails_when_initial_send_fails();
    test_session_documents();
    test_is_ping();
    std::cout << "OK\n";
    return 0;
}
