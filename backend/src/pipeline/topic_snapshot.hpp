#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <variant>

#include "access/data_access.hpp"
#include "pipeline/price_source.hpp"
#include "stream/price_update.hpp"

struct SnapshotError {
    enum class Kind { NotFound, Unauthorized, StoreFailure };
    Kind kind{Kind::StoreFailure};
    std::string message;
};

inline const char* to_cstr(SnapshotError::Kind k) {
    switch (k) {
        case SnapshotError::Kind::NotFound: return "not_found";
        case SnapshotError::Kind::Unauthorized: return "unauthorized";
        case SnapshotError::Kind::StoreFailure: return "store_failure";
    }
    return "?";
}

using SnapshotResult = std::variant<PriceUpdate, SnapshotError>;

// resolve -> fetch -> merge for one topic. The gateway's first frame and
// every worker cycle go through here, so both look the same.
class TopicSnapshotter {
public:
    TopicSnapshotter(std::shared_ptr<IDataAccess> db, std::shared_ptr<PriceSource> prices);

    SnapshotResult snapshot(TopicId topic, const Principal& who,
                            const std::atomic<bool>* cancel = nullptr);

    IDataAccess& data_access() { return *db_; }

private:
    std::shared_ptr<IDataAccess> db_;
    std::shared_ptr<PriceSource> prices_;
};
