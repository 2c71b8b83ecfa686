#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "stream/connection.hpp"
#include "stream/topic_worker_iface.hpp"

class ConnectionRegistry;

struct RegistryStats {
    std::size_t topics{0};
    std::size_t connections{0};
    std::size_t workers{0};
};

// Owner of topic -> connections and topic -> worker. Exactly one worker per
// topic with subscribers.
//
// lifecycle_m_ serializes subscribe/unsubscribe/shutdown together with
// worker start and stop, so a topic emptied by one call is fully torn down
// before the next call can restart it. members_m_ guards the maps and is
// the only lock broadcast takes; it is never held while sending, closing
// or joining. Order: lifecycle_m_ then members_m_.
class ConnectionRegistry {
public:
    using WorkerFactory = std::function<std::unique_ptr<ITopicWorker>(
        TopicId, const Principal&, ConnectionRegistry&)>;

    explicit ConnectionRegistry(WorkerFactory factory);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Caller has already authorized `conn` for `topic`. Starts the topic's
    // worker on the first subscriber. Subscribing twice is a no-op.
    void subscribe(TopicId topic, const ConnectionPtr& conn);

    // Removes `conn` if present; if the topic is left without subscribers
    // its worker is stopped and joined before returning.
    void unsubscribe(TopicId topic, const ConnectionPtr& conn);

    // Sends to a snapshot of the topic's subscribers. Connections whose send
    // fails are dropped and closed. Returns the number of successful sends.
    std::size_t broadcast(TopicId topic, const std::string& message);

    // Same failure handling as broadcast, for one connection.
    bool send_to(const ConnectionPtr& conn, const std::string& message);

    // Stops every worker and closes every connection; later subscribes are refused.
    void shutdown();

    RegistryStats stats() const;
    std::size_t subscriber_count(TopicId topic) const;
    bool has_worker(TopicId topic) const;

private:
    void drop_failed(const std::vector<ConnectionPtr>& failed);

    WorkerFactory factory_;

    std::mutex lifecycle_m_;
    mutable std::mutex members_m_;
    std::unordered_map<TopicId, std::unordered_map<ConnectionId, ConnectionPtr>> members_;
    std::unordered_map<TopicId, std::unique_ptr<ITopicWorker>> workers_;
    bool shut_down_{false};
};
