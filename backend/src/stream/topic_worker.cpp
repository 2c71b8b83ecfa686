#include "stream/topic_worker.hpp"

#include <iostream>
#include <utility>

TopicWorker::TopicWorker(TopicId topic, Principal as, std::shared_ptr<TopicSnapshotter> snap,
                         BroadcastFn broadcast, PollSchedule schedule)
    : topic_(topic), principal_(as), snap_(std::move(snap)),
      broadcast_(std::move(broadcast)), schedule_(std::move(schedule)) {}

TopicWorker::~TopicWorker() {
    stop();
}

void TopicWorker::start() {
    if (th_.joinable()) return;
    th_ = std::thread([this] { run(); });
}

void TopicWorker::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (cancel_.exchange(true) && !th_.joinable()) return;
        if (state_.load() != WorkerState::Stopped) state_.store(WorkerState::Cancelling);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
    state_.store(WorkerState::Stopped);
}

bool TopicWorker::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(m_);
    return !cv_.wait_for(lk, d, [this] { return cancel_.load(); });
}

void TopicWorker::run() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!cancel_.load()) state_.store(WorkerState::Running);
    }
    for (;;) {
        const auto interval = schedule_.interval_at(std::chrono::system_clock::now());
        if (!wait_for(interval)) break;
        try {
            run_cycle();
        } catch (const std::exception& e) {
            std::cerr << "[worker] topic " << topic_ << ": cycle failed: " << e.what() << std::endl;
        }
        if (cancel_.load()) break;
    }
}

void TopicWorker::run_cycle() {
    using namespace std::chrono;
    last_run_ms_.store(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());

    SnapshotResult res = snap_->snapshot(topic_, principal_, &cancel_);
    if (cancel_.load()) return;

    // Subscribers are authorized one by one at admission; the loop only needs
    // read access, which the owner always has.
    auto* denied = std::get_if<SnapshotError>(&res);
    if (denied && denied->kind == SnapshotError::Kind::Unauthorized) {
        const auto owner = snap_->data_access().topic_owner(topic_);
        if (owner && *owner != principal_.user_id) {
            std::cout << "[worker] topic " << topic_ << ": user " << principal_.user_id
                      << " lost access, polling as owner " << *owner << std::endl;
            principal_ = Principal{*owner};
            res = snap_->snapshot(topic_, principal_, &cancel_);
            if (cancel_.load()) return;
        }
    }

    if (auto* err = std::get_if<SnapshotError>(&res)) {
        std::cerr << "[worker] topic " << topic_ << ": resolve failed (" << to_cstr(err->kind)
                  << "): " << err->message << "; skipping cycle" << std::endl;
        return;
    }

    const std::string frame = to_json(std::get<PriceUpdate>(res));
    // Holding m_ orders this against stop(): once cancel_ is set, nothing is sent
    std::lock_guard<std::mutex> lk(m_);
    if (cancel_.load()) return;
    broadcast_(topic_, frame);
    cycles_.fetch_add(1);
}
