#include "../src/access/data_access.hpp"
#include "../src/auth/credential_verifier.hpp"
#include "../src/pipeline/price_source.hpp"
#include "../src/pipeline/topic_snapshot.hpp"
#include "../src/ratelimit/token_bucket.hpp"
#include "../src/stream/connection_gateway.hpp"
#include "../src/stream/connection_registry.hpp"
#include "../src/stream/topic_worker.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>
#include <memory>

using json = nlohmann::json;
using namespace std::chrono;

namespace {

const auto kInterval = milliseconds(150);

struct Harness {
    std::shared_ptr<MemoryDataAccess> db;
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::shared_ptr<StaticVerifier> verifier = std::make_shared<StaticVerifier>();
    std::shared_ptr<TopicSnapshotter> snap;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<ConnectionGateway> gateway;

    std::mutex m;
    std::vector<TopicWorker*> workers;

    Harness() {
        db = make_memory_data_access();
        db->add_user(UserRecord{1, true});
        db->add_user(UserRecord{2, true});
        TopicView t;
        t.topic_id = 1;
        t.owner = 1;
        t.is_public = true;
        t.items = {{"AAA", "Alpha", 10.0, 90.0}, {"BBB", "Beta", std::nullopt, std::nullopt}};
        db->add_watchlist(t);

        provider->set("AAA", 100.0, 98.0);
        provider->set("BBB", std::nullopt);

        verifier->add("tok-1", 1);
        verifier->add("tok-2", 2);

        TokenBucketLimiter::Options lo;
        lo.key = "test:worker";
        lo.capacity = 100;
        lo.refill_rate = 100;
        auto limiter = std::make_shared<TokenBucketLimiter>(make_memory_bucket_store(), lo);
        PriceSource::Options po;
        po.acquire_timeout = milliseconds(200);
        auto prices = std::make_shared<PriceSource>(provider, limiter, nullptr, po);
        snap = std::make_shared<TopicSnapshotter>(db, prices);

        registry = std::make_unique<ConnectionRegistry>(
            [this](TopicId topic, const Principal& who, ConnectionRegistry& reg)
                -> std::unique_ptr<ITopicWorker> {
                auto w = std::make_unique<TopicWorker>(
                    topic, who, snap,
                    [&reg](TopicId t, const std::string& msg) { return reg.broadcast(t, msg); },
                    PollSchedule::fixed(kInterval));
                std::lock_guard<std::mutex> lk(m);
                workers.push_back(w.get());
                return w;
            });
        gateway = std::make_unique<ConnectionGateway>(verifier, snap, *registry);
    }

    std::shared_ptr<FakeConnection> connect(ConnectionId id, const std::string& token) {
        AdmitResult r = gateway->admit(StreamTarget{1, token});
        auto* adm = std::get_if<Admission>(&r);
        assert(adm);
        auto c = std::make_shared<FakeConnection>(id, 1, adm->principal.user_id);
        assert(gateway->open(c, adm->initial_frame));
        return c;
    }
};

void check_frame(const std::string& text) {
    json j = json::parse(text);
    assert(j["type"] == "price_update");
    assert(j["topic_id"] == 1);
    assert(j["timestamp"].is_string());
    const auto& items = j["items"];
    assert(items.size() == 2);
    assert(items[0]["symbol"] == "AAA");
    assert(items[0]["price"] == 100.0);
    assert(items[0]["delta"] == 2.0);
    assert(items[0]["delta_percent"] == 2.04);
    assert(items[0]["unrealized_pnl"] == 100.0);
    assert(items[1]["symbol"] == "BBB");
    assert(items[1]["price"].is_null());
    assert(items[1]["delta"].is_null());
    assert(items[1]["unrealized_pnl"].is_null());
}

bool all_prices_null(const std::string& text) {
    json j = json::parse(text);
    for (const auto& it : j["items"]) {
        if (!it["price"].is_null()) return false;
    }
    return true;
}

} // namespace

static void test_two_clients_same_frames() {
    Harness h;
    auto c1 = h.connect(1, "tok-1");
    auto c2 = h.connect(2, "tok-2");

    // Initial frame arrives before any worker tick
    assert(c1->frame_count() == 1 && c2->frame_count() == 1);
    check_frame(c1->frames()[0]);
    check_frame(c2->frames()[0]);

    assert(h.registry->has_worker(1));
    assert(h.workers.size() == 1);

    assert(wait_until([&] { return c1->frame_count() >= 2 && c2->frame_count() >= 2; },
                      kInterval * 4));
    const auto f1 = c1->frames();
    const auto f2 = c2->frames();
    check_frame(f1[1]);
    assert(f1[1] == f2[1]);

    h.gateway->on_close(c1);
    h.gateway->on_close(c1);  // second report ignored
    assert(h.registry->has_worker(1));
    h.gateway->on_close(c2);
    assert(!h.registry->has_worker(1));

    // Nothing arrives after teardown
    const std::size_t seen = c2->frame_count();
    std::this_thread::sleep_for(kInterval * 2);
    assert(c2->frame_count() == seen);
}

static void test_fetch_failure_keeps_worker() {
    Harness h;
    auto c = h.connect(1, "tok-1");
    TopicWorker* w = h.workers.at(0);

    h.provider->unreachable = true;
    assert(wait_until([&] { return all_prices_null(c->frames().back()); }, kInterval * 4));
    assert(w->state() == WorkerState::Running);

    h.provider->unreachable = false;
    assert(wait_until([&] { return !all_prices_null(c->frames().back()); }, kInterval * 4));
    check_frame(c->frames().back());
    assert(w->cycles() >= 2);
    assert(w->last_run_ms() > 0);

    h.gateway->on_close(c);
}

static void test_resolve_failure_skips_cycle() {
    Harness h;
    auto c = h.connect(1, "tok-1");
    TopicWorker* w = h.workers.at(0);

    h.db->set_failing(true);
    // let a cycle that already resolved finish
    std::this_thread::sleep_for(kInterval + milliseconds(50));
    const std::size_t before = c->frame_count();
    std::this_thread::sleep_for(kInterval * 3);
    assert(c->frame_count() == before);
    assert(w->state() == WorkerState::Running);

    h.db->set_failing(false);
    assert(wait_until([&] { return c->frame_count() > before; }, kInterval * 4));

    h.gateway->on_close(c);
}

static void test_items_follow_watchlist_changes() {
    Harness h;
    auto c = h.connect(1, "tok-1");
    h.provider->set("CCC", 5.5, 5.0);
    assert(h.db->set_items(1, {{"CCC", "Gamma", std::nullopt, std::nullopt}}));

    assert(wait_until([&] {
        json j = json::parse(c->frames().back());
        return j["items"].size() == 1 && j["items"][0]["symbol"] == "CCC";
    }, kInterval * 4));
    json j = json::parse(c->frames().back());
    assert(j["items"][0]["price"] == 5.5);
    assert(j["items"][0]["delta"] == 0.5);
    assert(j["items"][0]["delta_percent"] == 10.0);

    h.gateway->on_close(c);
}

static void test_owner_keeps_stream_after_list_goes_private() {
    Harness h;
    auto guest = h.connect(1, "tok-2");   // non-owner starts the worker
    auto owner = h.connect(2, "tok-1");
    assert(h.workers.size() == 1);

    h.gateway->on_close(guest);
    assert(h.registry->has_worker(1));
    assert(h.db->set_public(1, false));

    // let a cycle already in flight finish, then expect fresh frames
    std::this_thread::sleep_for(kInterval + milliseconds(50));
    const std::size_t before = owner->frame_count();
    assert(wait_until([&] { return owner->frame_count() >= before + 2; }, kInterval * 6));
    check_frame(owner->frames().back());
    assert(h.workers.size() == 1);

    h.gateway->on_close(owner);
}

static void test_stop_is_prompt_and_final() {
    Harness h;
    auto c = h.connect(1, "tok-1");
    TopicWorker* w = h.workers.at(0);
    assert(wait_until([&] { return w->state() == WorkerState::Running; }));

    const auto t0 = steady_clock::now();
    h.gateway->on_close(c);
    assert(steady_clock::now() - t0 < kInterval);
    assert(!h.registry->has_worker(1));
}

int main() {
    test_two_clients_same_frames();
    test_fetch_failure_keeps_worker();
    test_resolve_failure_skips_cycle();
    test_items_follow_watchlist_changes();
    test_owner_keeps_stream_after_list_goes_private();
    test_stop_is_prompt_and_final();
    std::cout << "OK\n";
    return 0;
}
