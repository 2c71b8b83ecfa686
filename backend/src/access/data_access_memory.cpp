#include "access/data_access.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace
{
class MemoryTables final : public MemoryDataAccess
{
    mutable std::mutex mtx_;
    std::unordered_map<UserId, UserRecord> users_;
    std::unordered_map<TopicId, TopicView> lists_;
    std::atomic<bool> failing_{false};

    void check() const
    {
        if (failing_.load()) throw DataAccessError("memory data access: simulated outage");
    }

public:
    ResolveResult resolve_topic(TopicId topic, const Principal &who) override
    {
        check();
        std::scoped_lock lk(mtx_);
        auto it = lists_.find(topic);
        if (it == lists_.end()) return ResolveError::NotFound;
        const TopicView &w = it->second;
        if (w.owner != who.user_id && !w.is_public) return ResolveError::Unauthorized;
        return w;
    }

    std::optional<UserRecord> find_user(UserId id) override
    {
        check();
        std::scoped_lock lk(mtx_);
        auto it = users_.find(id);
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<UserId> topic_owner(TopicId topic) override
    {
        check();
        std::scoped_lock lk(mtx_);
        auto it = lists_.find(topic);
        if (it == lists_.end()) return std::nullopt;
        return it->second.owner;
    }

    void add_user(UserRecord u) override
    {
        std::scoped_lock lk(mtx_);
        users_[u.id] = u;
    }

    void add_watchlist(TopicView w) override
    {
        std::scoped_lock lk(mtx_);
        lists_[w.topic_id] = std::move(w);
    }

    bool set_items(TopicId topic, std::vector<TopicItem> items) override
    {
        std::scoped_lock lk(mtx_);
        auto it = lists_.find(topic);
        if (it == lists_.end()) return false;
        it->second.items = std::move(items);
        return true;
    }

    bool set_public(TopicId topic, bool is_public) override
    {
        std::scoped_lock lk(mtx_);
        auto it = lists_.find(topic);
        if (it == lists_.end()) return false;
        it->second.is_public = is_public;
        return true;
    }

    void set_failing(bool failing) override { failing_.store(failing); }
};
}

std::unique_ptr<MemoryDataAccess> make_memory_data_access()
{
    return std::make_unique<MemoryTables>();
}

void seed_demo_data(MemoryDataAccess &db)
{
    db.add_user(UserRecord{1, true});
    db.add_user(UserRecord{2, true});
    db.add_user(UserRecord{3, false});

    TopicView autos;
    autos.topic_id = 1;
    autos.owner = 1;
    autos.items = {
        {"7203", "Toyota Motor", 100.0, 2400.0},
        {"7267", "Honda Motor", std::nullopt, std::nullopt},
        {"7201", "Nissan Motor", 500.0, 420.0},
    };
    db.add_watchlist(autos);

    TopicView tech;
    tech.topic_id = 2;
    tech.owner = 1;
    tech.is_public = true;
    tech.items = {
        {"6758", "Sony Group", 50.0, 12000.0},
        {"9984", "SoftBank Group", std::nullopt, std::nullopt},
        {"6861", "Keyence", std::nullopt, std::nullopt},
    };
    db.add_watchlist(tech);

    TopicView banks;
    banks.topic_id = 3;
    banks.owner = 2;
    banks.items = {
        {"8306", "Mitsubishi UFJ", 1000.0, 1250.0},
        {"8316", "Sumitomo Mitsui", std::nullopt, std::nullopt},
    };
    db.add_watchlist(banks);
}
