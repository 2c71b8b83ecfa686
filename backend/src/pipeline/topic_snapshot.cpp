#include "pipeline/topic_snapshot.hpp"

#include <chrono>
#include <utility>
#include <vector>

TopicSnapshotter::TopicSnapshotter(std::shared_ptr<IDataAccess> db,
                                   std::shared_ptr<PriceSource> prices)
    : db_(std::move(db)), prices_(std::move(prices)) {}

SnapshotResult TopicSnapshotter::snapshot(TopicId topic, const Principal& who,
                                          const std::atomic<bool>* cancel)
{
    ResolveResult rr;
    try {
        rr = db_->resolve_topic(topic, who);
    } catch (const DataAccessError& e) {
        return SnapshotError{SnapshotError::Kind::StoreFailure, e.what()};
    }

    if (auto* err = std::get_if<ResolveError>(&rr)) {
        if (*err == ResolveError::NotFound) {
            return SnapshotError{SnapshotError::Kind::NotFound, "watchlist not found"};
        }
        return SnapshotError{SnapshotError::Kind::Unauthorized, "access denied"};
    }
    const TopicView& view = std::get<TopicView>(rr);

    std::vector<std::string> symbols;
    symbols.reserve(view.items.size());
    for (const auto& it : view.items) symbols.push_back(it.symbol);

    const QuoteMap quotes = prices_->fetch(symbols, cancel);

    using namespace std::chrono;
    const auto now = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return merge_quotes(view, quotes, now);
}
