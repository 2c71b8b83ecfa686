#pragma once
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "stream/stream_types.hpp"

// The database could not be queried. Distinct from "not found".
class DataAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TopicItem {
    std::string symbol;                   // canonical listing code
    std::string name;                     // display name
    std::optional<double> quantity;       // holding overlay
    std::optional<double> purchase_price;
};

// A watchlist as seen by one principal, items in display order.
struct TopicView {
    TopicId topic_id{0};
    UserId owner{0};
    bool is_public{false};
    std::vector<TopicItem> items;
};

enum class ResolveError { NotFound, Unauthorized };

inline const char* to_cstr(ResolveError e) {
    return e == ResolveError::NotFound ? "not_found" : "unauthorized";
}

using ResolveResult = std::variant<TopicView, ResolveError>;

struct UserRecord {
    UserId id{0};
    bool is_active{true};
};

// Read side of the persistence layer. Every call borrows its own
// connection and returns it before returning; nothing is held between
// calls. Throws DataAccessError when the backing store fails.
class IDataAccess {
public:
    virtual ~IDataAccess() = default;

    // Owner, or anyone when the watchlist is public.
    virtual ResolveResult resolve_topic(TopicId topic, const Principal& who) = 0;

    virtual std::optional<UserRecord> find_user(UserId id) = 0;

    // Owner of the watchlist, nullopt if it does not exist.
    virtual std::optional<UserId> topic_owner(TopicId topic) = 0;
};

// In-process tables, for development runs and tests.
class MemoryDataAccess : public IDataAccess {
public:
    virtual void add_user(UserRecord u) = 0;
    virtual void add_watchlist(TopicView w) = 0;
    // Replaces the item list; the next resolve sees the new items.
    virtual bool set_items(TopicId topic, std::vector<TopicItem> items) = 0;
    virtual bool set_public(TopicId topic, bool is_public) = 0;
    // Subsequent calls throw DataAccessError while set.
    virtual void set_failing(bool failing) = 0;
};

std::unique_ptr<MemoryDataAccess> make_memory_data_access();

// Three users (one inactive) and three watchlists of TSE codes, used when no DATABASE_URL is set.
void seed_demo_data(MemoryDataAccess& db);
