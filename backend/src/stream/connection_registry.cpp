#include "stream/connection_registry.hpp"

#include <iostream>
#include <utility>

ConnectionRegistry::ConnectionRegistry(WorkerFactory factory)
    : factory_(std::move(factory)) {}

ConnectionRegistry::~ConnectionRegistry() {
    shutdown();
}

void ConnectionRegistry::subscribe(TopicId topic, const ConnectionPtr& conn) {
    std::lock_guard<std::mutex> life(lifecycle_m_);
    if (shut_down_) {
        conn->close(close_code::going_away, "server shutting down");
        return;
    }

    bool need_worker = false;
    {
        std::lock_guard<std::mutex> lk(members_m_);
        members_[topic].emplace(conn->id(), conn);
        need_worker = (workers_.find(topic) == workers_.end());
    }
    if (!need_worker) return;

    std::unique_ptr<ITopicWorker> w;
    try {
        w = factory_(topic, conn->principal(), *this);
        w->start();
    } catch (const std::exception& e) {
        std::cerr << "[registry] topic " << topic << ": worker start failed: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lk(members_m_);
            auto it = members_.find(topic);
            if (it != members_.end()) {
                it->second.erase(conn->id());
                if (it->second.empty()) members_.erase(it);
            }
        }
        conn->close(close_code::internal_error, "stream unavailable");
        return;
    }

    std::lock_guard<std::mutex> lk(members_m_);
    workers_.emplace(topic, std::move(w));
    std::cout << "[registry] topic " << topic << ": worker started" << std::endl;
}

void ConnectionRegistry::unsubscribe(TopicId topic, const ConnectionPtr& conn) {
    std::lock_guard<std::mutex> life(lifecycle_m_);

    std::unique_ptr<ITopicWorker> retired;
    {
        std::lock_guard<std::mutex> lk(members_m_);
        auto it = members_.find(topic);
        if (it != members_.end()) {
            if (conn) it->second.erase(conn->id());
            if (it->second.empty()) members_.erase(it);
        }
        // Also reaps a worker whose subscribers were all dropped by failed sends
        if (members_.find(topic) == members_.end()) {
            auto w = workers_.find(topic);
            if (w != workers_.end()) {
                retired = std::move(w->second);
                workers_.erase(w);
            }
        }
    }

    if (retired) {
        retired->stop();
        std::cout << "[registry] topic " << topic << ": worker stopped" << std::endl;
    }
}

std::size_t ConnectionRegistry::broadcast(TopicId topic, const std::string& message) {
    std::vector<ConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lk(members_m_);
        auto it = members_.find(topic);
        if (it == members_.end()) return 0;
        targets.reserve(it->second.size());
        for (const auto& kv : it->second) targets.push_back(kv.second);
    }

    std::size_t delivered = 0;
    std::vector<ConnectionPtr> failed;
    for (const auto& c : targets) {
        if (c->send(message)) {
            ++delivered;
        } else {
            failed.push_back(c);
        }
    }
    if (!failed.empty()) drop_failed(failed);
    return delivered;
}

bool ConnectionRegistry::send_to(const ConnectionPtr& conn, const std::string& message) {
    if (conn->send(message)) return true;
    drop_failed({conn});
    return false;
}

void ConnectionRegistry::drop_failed(const std::vector<ConnectionPtr>& failed) {
    {
        std::lock_guard<std::mutex> lk(members_m_);
        for (const auto& c : failed) {
            auto it = members_.find(c->topic());
            if (it == members_.end()) continue;
            auto m = it->second.find(c->id());
            // Only drop the exact connection we failed to reach
            if (m != it->second.end() && m->second == c) it->second.erase(m);
            if (it->second.empty()) members_.erase(it);
        }
    }
    for (const auto& c : failed) {
        std::cerr << "[registry] topic " << c->topic() << ": dropping connection " << c->id()
                  << " after failed send" << std::endl;
        c->close(close_code::internal_error, "send failed");
    }
}

void ConnectionRegistry::shutdown() {
    std::lock_guard<std::mutex> life(lifecycle_m_);
    if (shut_down_) return;
    shut_down_ = true;

    std::unordered_map<TopicId, std::unique_ptr<ITopicWorker>> workers;
    std::unordered_map<TopicId, std::unordered_map<ConnectionId, ConnectionPtr>> members;
    {
        std::lock_guard<std::mutex> lk(members_m_);
        workers.swap(workers_);
        members.swap(members_);
    }
    for (auto& kv : workers) kv.second->stop();
    for (auto& t : members) {
        for (auto& c : t.second) c.second->close(close_code::going_away, "server shutting down");
    }
    if (!workers.empty() || !members.empty()) {
        std::cout << "[registry] shutdown: stopped " << workers.size() << " worker(s), closed "
                  << members.size() << " topic(s)" << std::endl;
    }
}

RegistryStats ConnectionRegistry::stats() const {
    std::lock_guard<std::mutex> lk(members_m_);
    RegistryStats s;
    s.topics = members_.size();
    for (const auto& kv : members_) s.connections += kv.second.size();
    for (const auto& kv : workers_) {
        const WorkerState st = kv.second->state();
        if (st == WorkerState::Starting || st == WorkerState::Running) ++s.workers;
    }
    return s;
}

std::size_t ConnectionRegistry::subscriber_count(TopicId topic) const {
    std::lock_guard<std::mutex> lk(members_m_);
    auto it = members_.find(topic);
    return it == members_.end() ? 0 : it->second.size();
}

bool ConnectionRegistry::has_worker(TopicId topic) const {
    std::lock_guard<std::mutex> lk(members_m_);
    return workers_.find(topic) != workers_.end();
}
