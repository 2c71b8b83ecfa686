#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "md/poll_schedule.hpp"
#include "pipeline/topic_snapshot.hpp"
#include "stream/topic_worker_iface.hpp"

// Polls one topic on a thread: wait an interval, snapshot, broadcast.
// The first broadcast comes one interval after start(); the gateway sends
// the immediate frame itself. After stop() begins nothing more is sent.
class TopicWorker final : public ITopicWorker {
public:
    using BroadcastFn = std::function<std::size_t(TopicId, const std::string&)>;

    TopicWorker(TopicId topic, Principal as, std::shared_ptr<TopicSnapshotter> snap,
                BroadcastFn broadcast, PollSchedule schedule);
    ~TopicWorker() override;

    TopicWorker(const TopicWorker&) = delete;
    TopicWorker& operator=(const TopicWorker&) = delete;

    TopicId topic() const override { return topic_; }
    void start() override;
    void stop() override;
    WorkerState state() const override { return state_.load(); }

    std::int64_t last_run_ms() const { return last_run_ms_.load(); }
    std::uint64_t cycles() const { return cycles_.load(); }

private:
    void run();
    void run_cycle();
    // False if cancelled before `d` elapsed.
    bool wait_for(std::chrono::milliseconds d);

    TopicId topic_;
    Principal principal_;  // switches to the owner if this user loses access
    std::shared_ptr<TopicSnapshotter> snap_;
    BroadcastFn broadcast_;
    PollSchedule schedule_;

    std::thread th_;
    std::atomic<bool> cancel_{false};
    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::atomic<std::int64_t> last_run_ms_{0};
    std::atomic<std::uint64_t> cycles_{0};

    std::mutex m_;
    std::condition_variable cv_;
};
