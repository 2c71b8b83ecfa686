#include "redis_pool.hpp"

#include <iostream>
#include <utility>

RedisPool::RedisPool(RedisOptions opt) : opt_(std::move(opt)) {
    if (opt_.pool_size <= 0) opt_.pool_size = 1;
    pool_.resize(static_cast<std::size_t>(opt_.pool_size));

    // Pre-connect all slots (best effort; a down server is retried on checkout)
    std::size_t connected = 0;
    for (std::size_t i = 0; i < pool_.size(); ++i) {
        if (connect_one(i)) ++connected;
        free_.push_back(i);
    }
    std::cout << "[redis] pool ready: " << connected << "/" << pool_.size()
              << " connected to " << opt_.host << ":" << opt_.port
              << " db=" << opt_.db << std::endl;
}

RedisPool::~RedisPool() {
    for (std::size_t i = 0; i < pool_.size(); ++i) close_one(i);
}

bool RedisPool::connect_one(std::size_t idx) {
    timeval tv{};
    tv.tv_sec  = opt_.timeout_ms / 1000;
    tv.tv_usec = (opt_.timeout_ms % 1000) * 1000;

    redisContext* ctx = redisConnectWithTimeout(opt_.host.c_str(), opt_.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            std::cerr << "[redis] connect error: " << ctx->errstr << std::endl;
            redisFree(ctx);
        } else {
            std::cerr << "[redis] connect error: NULL context" << std::endl;
        }
        pool_[idx] = Conn{};
        return false;
    }
    // Command timeout as well, so a hung server cannot block a caller forever
    redisSetTimeout(ctx, tv);

    if (!auth_and_select(ctx)) {
        redisFree(ctx);
        pool_[idx] = Conn{};
        return false;
    }
    pool_[idx].ctx = ctx;
    pool_[idx].valid = true;
    return true;
}

bool RedisPool::auth_and_select(redisContext* ctx) {
    if (!opt_.password.empty()) {
        RedisReply r(static_cast<redisReply*>(
            redisCommand(ctx, "AUTH %s", opt_.password.c_str())));
        if (!r || r.is_error()) {
            std::cerr << "[redis] AUTH failed: " << r.error_text() << std::endl;
            return false;
        }
    }
    if (opt_.db != 0) {
        RedisReply r(static_cast<redisReply*>(redisCommand(ctx, "SELECT %d", opt_.db)));
        if (!r || r.is_error()) {
            std::cerr << "[redis] SELECT failed: " << r.error_text() << std::endl;
            return false;
        }
    }
    return true;
}

void RedisPool::close_one(std::size_t idx) {
    if (idx >= pool_.size()) return;
    if (pool_[idx].ctx) redisFree(pool_[idx].ctx);
    pool_[idx] = Conn{};
}

std::size_t RedisPool::checkout() {
    std::unique_lock<std::mutex> lk(m_);
    const auto budget = std::chrono::milliseconds(opt_.timeout_ms);
    if (!cv_.wait_for(lk, budget, [&] { return !free_.empty(); })) {
        std::cerr << "[redis] no free connection after " << opt_.timeout_ms << " ms" << std::endl;
        return kNoSlot;
    }
    std::size_t idx = free_.front();
    free_.pop_front();
    return idx;
}

void RedisPool::checkin(std::size_t idx) {
    if (idx == kNoSlot) return;
    {
        std::lock_guard<std::mutex> lk(m_);
        free_.push_back(idx);
    }
    cv_.notify_one();
}

RedisPool::Slot::Slot(RedisPool& pool) : pool_(pool), idx_(pool.checkout()) {}

RedisPool::Slot::~Slot() { pool_.checkin(idx_); }

redisContext* RedisPool::Slot::ctx() {
    if (idx_ == kNoSlot) return nullptr;
    // The slot is exclusively owned by this thread until the destructor runs
    auto& c = pool_.pool_[idx_];
    if (!c.valid || !c.ctx || c.ctx->err) {
        pool_.close_one(idx_);
        (void)pool_.connect_one(idx_);
    }
    return pool_.pool_[idx_].ctx;
}

void RedisPool::Slot::invalidate() {
    if (idx_ != kNoSlot) pool_.close_one(idx_);
}
