#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <curl/curl.h>
#include <memory>
#include <thread>
#include <iostream>
#include <string>
#include <vector>

#include "access/data_access.hpp"
#include "access/data_access_pg.hpp"
#include "auth/session_verifier_redis.hpp"
#include "pipeline/price_source.hpp"
#include "pipeline/quote_cache.hpp"
#include "pipeline/topic_snapshot.hpp"
#include "ratelimit/bucket_store_redis.hpp"
#include "ratelimit/token_bucket.hpp"
#include "redis/redis_pool.hpp"
#include "server/http_routes.hpp"
#include "server/stream_config.hpp"
#include "server/ws_server.hpp"
#include "stream/connection_gateway.hpp"
#include "stream/connection_registry.hpp"
#include "stream/topic_worker.hpp"
#include "upstream/yahoo_rest.hpp"

using tcp = boost::asio::ip::tcp;

namespace {

std::shared_ptr<IDataAccess> make_data_access(const StreamConfig& cfg) {
    if (!cfg.database_url.empty()) {
        try {
            return make_pg_data_access(cfg.database_url);
        } catch (const std::exception& e) {
            std::cerr << "[setup] Failed to connect to database: " << e.what() << std::endl;
            throw;
        }
    }
    std::cout << "[setup] DATABASE_URL not set; using in-memory demo watchlists" << std::endl;
    std::shared_ptr<MemoryDataAccess> mem = make_memory_data_access();
    seed_demo_data(*mem);
    return mem;
}

} // namespace

int main() {
    load_env_file();

    StreamConfig cfg;
    try {
        cfg = StreamConfig::from_env();
    } catch (const std::exception& e) {
        std::cerr << "[setup] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[setup] curl_global_init failed" << std::endl;
        return 1;
    }

    int rc = 0;
    try {
        auto redis = std::make_shared<RedisPool>(cfg.redis);

        auto limiter = std::make_shared<TokenBucketLimiter>(
            std::make_shared<RedisBucketStore>(redis), cfg.limiter);

        std::shared_ptr<IQuoteCache> cache;
        if (cfg.quote_cache_ttl.count() > 0) {
            cache = std::make_shared<RedisQuoteCache>(redis, cfg.quote_cache_ttl);
        }

        PriceSource::Options ps_opts;
        ps_opts.acquire_timeout = cfg.acquire_timeout;
        auto prices = std::make_shared<PriceSource>(
            std::make_shared<YahooRest>(cfg.upstream_base_url), limiter, cache, ps_opts);

        auto snapshotter = std::make_shared<TopicSnapshotter>(make_data_access(cfg), prices);
        const PollSchedule schedule = cfg.poll_schedule();

        ConnectionRegistry registry{
            [snapshotter, schedule](TopicId topic, const Principal& who, ConnectionRegistry& reg)
                -> std::unique_ptr<ITopicWorker> {
                return std::make_unique<TopicWorker>(
                    topic, who, snapshotter,
                    [&reg](TopicId t, const std::string& msg) { return reg.broadcast(t, msg); },
                    schedule);
            }};

        ConnectionGateway gateway{std::make_shared<RedisSessionVerifier>(redis), snapshotter, registry};
        StreamProbes probes{registry, *limiter};

        boost::asio::io_context ioc{cfg.io_threads};
        tcp::endpoint ep{boost::asio::ip::make_address(cfg.host), cfg.port};

        StreamServer::Options srv_opts;
        srv_opts.send_queue_limit = cfg.send_queue_limit;
        StreamServer server{ioc, ep, gateway,
                            [&](auto const& req, auto& res) { handle_request(probes, req, res); },
                            srv_opts};
        server.run();

        // Shutdown joins workers, so it runs off the io threads; close frames
        // still go out because the loop keeps running until it is done.
        std::thread stopper;
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            std::cout << "[server] signal " << sig << ", shutting down" << std::endl;
            stopper = std::thread([&] {
                registry.shutdown();
                ioc.stop();
            });
        });

        std::cout << "[server] env=" << cfg.app_env << " listening on " << cfg.host << ":"
                  << server.port() << " (" << cfg.io_threads << " io threads)" << std::endl;

        std::vector<std::thread> io;
        io.reserve(cfg.io_threads - 1);
        for (int i = 1; i < cfg.io_threads; ++i) io.emplace_back([&ioc] { ioc.run(); });
        ioc.run();
        for (auto& t : io) t.join();
        if (stopper.joinable()) stopper.join();

        registry.shutdown();
        server.stop();
        std::cout << "[server] stopped" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[setup] Fatal: " << e.what() << std::endl;
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
