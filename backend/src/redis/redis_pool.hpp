#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// hiredis types live in the global namespace
#include <hiredis/hiredis.h>

struct RedisOptions {
    std::string host = "127.0.0.1";
    int         port = 6379;
    int         db   = 0;           // SELECT db
    std::string password;           // optional AUTH
    int         pool_size  = 8;     // number of hiredis connections
    int         timeout_ms = 200;   // connect + command timeout
};

// Owns a redisReply* and frees it on scope exit.
class RedisReply {
public:
    explicit RedisReply(redisReply* r = nullptr) : r_(r) {}
    ~RedisReply() { if (r_) freeReplyObject(r_); }
    RedisReply(const RedisReply&) = delete;
    RedisReply& operator=(const RedisReply&) = delete;
    RedisReply(RedisReply&& o) noexcept : r_(o.r_) { o.r_ = nullptr; }
    RedisReply& operator=(RedisReply&& o) noexcept {
        if (this != &o) {
            if (r_) freeReplyObject(r_);
            r_ = o.r_;
            o.r_ = nullptr;
        }
        return *this;
    }

    redisReply* get() const { return r_; }
    redisReply* operator->() const { return r_; }
    explicit operator bool() const { return r_ != nullptr; }
    bool is_error() const { return r_ && r_->type == REDIS_REPLY_ERROR; }
    std::string error_text() const {
        return (r_ && r_->str) ? std::string(r_->str, r_->len) : std::string{};
    }

private:
    redisReply* r_;
};

// Fixed-size pool of blocking hiredis connections. Broken connections are
// reconnected lazily on the next checkout. Thread-safe.
class RedisPool {
public:
    explicit RedisPool(RedisOptions opt);
    ~RedisPool();

    RedisPool(const RedisPool&) = delete;
    RedisPool& operator=(const RedisPool&) = delete;

    const RedisOptions& options() const { return opt_; }

    // RAII checkout of one connection. ctx() is nullptr if the server is
    // unreachable or no connection freed up within timeout_ms; the caller
    // treats that as a store failure.
    class Slot {
    public:
        explicit Slot(RedisPool& pool);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        redisContext* ctx();
        // Drop the connection so the next checkout reconnects.
        void invalidate();

    private:
        RedisPool& pool_;
        std::size_t idx_;
    };

private:
    struct Conn { redisContext* ctx = nullptr; bool valid = false; };
    static constexpr std::size_t kNoSlot = static_cast<std::size_t>(-1);

    bool connect_one(std::size_t idx);
    void close_one(std::size_t idx);
    bool auth_and_select(redisContext* ctx);

    // kNoSlot if every connection stayed busy for timeout_ms
    std::size_t checkout();
    void checkin(std::size_t idx);

    RedisOptions opt_;
    std::vector<Conn> pool_;
    std::deque<std::size_t> free_;
    std::mutex m_;
    std::condition_variable cv_;
};
