#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

#include "auth/credential_verifier.hpp"
#include "pipeline/topic_snapshot.hpp"
#include "stream/connection.hpp"
#include "stream/connection_registry.hpp"

// /api/v1/ws/watchlist/{topic_id}/prices?token=...
struct StreamTarget {
    TopicId topic{0};
    std::string token;  // empty if absent
};

struct Admission {
    Principal principal;
    std::string initial_frame;  // current state, sent before subscribing
};

struct Rejection {
    int code{close_code::policy};
    std::string reason;
};

using AdmitResult = std::variant<Admission, Rejection>;

// Per-connection entry point, independent of the transport. The transport
// calls admit() (blocking: session store, database, upstream), then open()
// with the accepted connection, on_frame() per inbound text frame and
// on_close() when the socket goes away.
class ConnectionGateway {
public:
    ConnectionGateway(std::shared_ptr<ICredentialVerifier> verifier,
                      std::shared_ptr<TopicSnapshotter> snapshotter,
                      ConnectionRegistry& registry);

    static constexpr std::string_view kPathPrefix = "/api/v1/ws/watchlist/";

    // nullopt if the target is not a stream path.
    static std::optional<StreamTarget> parse_target(std::string_view target);

    AdmitResult admit(const StreamTarget& target);

    // Sends the initial frame then subscribes. False (and the connection is
    // closed) if the initial frame could not be queued.
    bool open(const ConnectionPtr& conn, const std::string& initial_frame);

    // "ping" or {"type":"ping"} gets {"type":"pong"}; anything else is ignored.
    void on_frame(const ConnectionPtr& conn, std::string_view text);

    // Unsubscribes the first time it is called for a given connection.
    void on_close(const ConnectionPtr& conn);

    static bool is_ping(std::string_view text);

private:
    std::shared_ptr<ICredentialVerifier> verifier_;
    std::shared_ptr<TopicSnapshotter> snap_;
    ConnectionRegistry& registry_;

    std::mutex open_m_;
    std::unordered_set<ConnectionId> open_;
};
