#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "stream/stream_types.hpp"

using ConnectionId = std::uint64_t;

// WebSocket close codes used by the stream endpoint
namespace close_code {
constexpr int normal         = 1000;
constexpr int going_away     = 1001;
constexpr int policy         = 1008;
constexpr int internal_error = 1011;
}

// One subscribed client. send() never blocks on the network: it queues the
// frame and returns false if the connection is dead or its queue is full.
// close() must not call back into the registry on the caller's thread.
class IConnection {
public:
    virtual ~IConnection() = default;

    virtual ConnectionId id() const = 0;
    virtual const Principal& principal() const = 0;
    virtual TopicId topic() const = 0;
    virtual bool alive() const = 0;

    virtual bool send(const std::string& text) = 0;
    virtual void close(int code, const std::string& reason) = 0;
};

using ConnectionPtr = std::shared_ptr<IConnection>;
