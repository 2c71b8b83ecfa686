#include "stream/connection_gateway.hpp"

#include <boost/url.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <iostream>
#include <utility>
#include <vector>

namespace urls = boost::urls;
using json = nlohmann::json;

namespace {
const std::string kPong = R"({"type":"pong"})";
}

ConnectionGateway::ConnectionGateway(std::shared_ptr<ICredentialVerifier> verifier,
                                     std::shared_ptr<TopicSnapshotter> snapshotter,
                                     ConnectionRegistry& registry)
    : verifier_(std::move(verifier)), snap_(std::move(snapshotter)), registry_(registry) {}

std::optional<StreamTarget> ConnectionGateway::parse_target(std::string_view target) {
    auto parsed = urls::parse_origin_form(target);
    if (!parsed) return std::nullopt;
    urls::url_view url = *parsed;

    std::vector<std::string> segs;
    for (auto s : url.segments()) segs.emplace_back(s);
    // api v1 ws watchlist {id} prices
    if (segs.size() != 6 || segs[0] != "api" || segs[1] != "v1" || segs[2] != "ws" ||
        segs[3] != "watchlist" || segs[5] != "prices") {
        return std::nullopt;
    }

    StreamTarget t;
    const std::string& id = segs[4];
    auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), t.topic);
    if (ec != std::errc{} || ptr != id.data() + id.size() || id.empty()) return std::nullopt;

    for (auto const& p : url.params()) {
        if (p.key == "token" && p.has_value) {
            t.token = std::string(p.value);
            break;
        }
    }
    return t;
}

AdmitResult ConnectionGateway::admit(const StreamTarget& target) {
    if (target.token.empty()) {
        return Rejection{close_code::policy, "Missing authentication token"};
    }

    VerifyResult vr = verifier_->verify(target.token);
    if (auto* err = std::get_if<VerifyError>(&vr)) {
        if (*err == VerifyError::Unavailable) {
            return Rejection{close_code::internal_error, "Session service unavailable"};
        }
        if (*err == VerifyError::Malformed) {
            return Rejection{close_code::policy, "Invalid session data"};
        }
        return Rejection{close_code::policy, "Invalid or expired session"};
    }
    const Principal who = std::get<Principal>(vr);

    try {
        auto user = snap_->data_access().find_user(who.user_id);
        if (!user) return Rejection{close_code::policy, "User not found"};
        if (!user->is_active) return Rejection{close_code::policy, "User account is inactive"};
    } catch (const DataAccessError& e) {
        std::cerr << "[gateway] user lookup failed: " << e.what() << std::endl;
        return Rejection{close_code::internal_error, "Database unavailable"};
    }

    SnapshotResult sr = snap_->snapshot(target.topic, who);
    if (auto* err = std::get_if<SnapshotError>(&sr)) {
        if (err->kind == SnapshotError::Kind::StoreFailure) {
            std::cerr << "[gateway] watchlist " << target.topic << ": " << err->message << std::endl;
            return Rejection{close_code::internal_error, "Database unavailable"};
        }
        return Rejection{close_code::policy, "Watchlist not found or access denied"};
    }

    return Admission{who, to_json(std::get<PriceUpdate>(sr))};
}

bool ConnectionGateway::open(const ConnectionPtr& conn, const std::string& initial_frame) {
    if (!conn->send(initial_frame)) {
        conn->close(close_code::internal_error, "send failed");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(open_m_);
        open_.insert(conn->id());
    }
    registry_.subscribe(conn->topic(), conn);
    std::cout << "[gateway] connection " << conn->id() << " user " << conn->principal().user_id
              << " subscribed to watchlist " << conn->topic() << std::endl;
    return true;
}

bool ConnectionGateway::is_ping(std::string_view text) {
    if (text == "ping") return true;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    auto it = j.find("type");
    return it != j.end() && it->is_string() && it->get<std::string>() == "ping";
}

void ConnectionGateway::on_frame(const ConnectionPtr& conn, std::string_view text) {
    if (is_ping(text)) registry_.send_to(conn, kPong);
}

void ConnectionGateway::on_close(const ConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lk(open_m_);
        if (open_.erase(conn->id()) == 0) return;
    }
    registry_.unsubscribe(conn->topic(), conn);
    std::cout << "[gateway] connection " << conn->id() << " left watchlist " << conn->topic()
              << std::endl;
}
