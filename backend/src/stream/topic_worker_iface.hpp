#pragma once
#include "stream/stream_types.hpp"

enum class WorkerState { Starting, Running, Cancelling, Stopped };

inline const char* to_cstr(WorkerState s) {
    switch (s) {
        case WorkerState::Starting: return "starting";
        case WorkerState::Running: return "running";
        case WorkerState::Cancelling: return "cancelling";
        case WorkerState::Stopped: return "stopped";
    }
    return "?";
}

// Background poll loop for one topic. Only the registry starts and stops these.
class ITopicWorker {
public:
    virtual ~ITopicWorker() = default;
    virtual TopicId topic() const = 0;
    virtual void start() = 0;
    // Requests cancellation and returns once the loop has exited.
    virtual void stop() = 0;
    virtual WorkerState state() const = 0;
};
