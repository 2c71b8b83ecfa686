#pragma once
#include <memory>
#include <stdexcept>
#include <string>

// Thrown by a store that cannot be reached; the limiter switches to its
// degraded mode instead of propagating it.
class BucketStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BucketParams {
    std::string key;       // rate-limit identifier, e.g. "rate_limit:yahoo_api"
    double capacity{0.0};  // C
    double refill_rate{0.0}; // r, tokens per second
};

struct BucketOutcome {
    bool granted{false};
    double tokens{0.0};    // token count after refill (and after deduction if granted)
};

// Shared bucket state. take() must refill, compare and deduct as one
// indivisible operation against the backing store. A cost of 0 refills
// and reports without consuming.
class IBucketStore {
public:
    virtual ~IBucketStore() = default;
    virtual BucketOutcome take(const BucketParams& p, double cost) = 0;
    virtual const char* name() const = 0;
};

// Single-process store guarded by a mutex.
std::unique_ptr<IBucketStore> make_memory_bucket_store();
