#include "access/data_access_pg.hpp"

#include <pqxx/pqxx>
#include <iostream>

namespace {

std::optional<double> opt_double(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<double>();
}

} // namespace

std::string PgDataAccess::with_connect_timeout(std::string s) {
    if (s.find("connect_timeout") != std::string::npos) return s;
    if (s.find("://") == std::string::npos) {
        if (!s.empty() && s.back() != ' ') s += ' ';
        return s + "connect_timeout=5";
    }
    s += (s.find('?') != std::string::npos) ? "&connect_timeout=5" : "?connect_timeout=5";
    return s;
}

PgDataAccess::PgDataAccess(const std::string& connection_string)
    : conn_str_(with_connect_timeout(connection_string)) {
    // Fail fast on a bad URL or unreachable server
    pqxx::connection first(conn_str_);
    std::cout << "[db] connected to " << first.dbname() << std::endl;
}

ResolveResult PgDataAccess::resolve_topic(TopicId topic, const Principal& who) {
    try {
        pqxx::connection conn(conn_str_);
        pqxx::read_transaction txn(conn);

        pqxx::result head = txn.exec(
            "SELECT id, user_id, is_public FROM watchlists WHERE id = $1",
            pqxx::params(topic));
        if (head.empty()) return ResolveError::NotFound;

        TopicView view;
        view.topic_id = head[0][0].as<TopicId>();
        view.owner = head[0][1].as<UserId>();
        view.is_public = head[0][2].as<bool>();
        if (view.owner != who.user_id && !view.is_public) return ResolveError::Unauthorized;

        pqxx::result rows = txn.exec(R"(
            SELECT c.ticker_symbol, c.company_name_jp, i.quantity, i.purchase_price
            FROM watchlist_items i
            JOIN companies c ON c.id = i.company_id
            WHERE i.watchlist_id = $1
            ORDER BY i.display_order, i.id
        )", pqxx::params(topic));

        view.items.reserve(rows.size());
        for (const auto& row : rows) {
            TopicItem it;
            it.symbol = row[0].as<std::string>();
            it.name = row[1].is_null() ? it.symbol : row[1].as<std::string>();
            it.quantity = opt_double(row[2]);
            it.purchase_price = opt_double(row[3]);
            view.items.push_back(std::move(it));
        }
        return view;
    } catch (const std::exception& e) {
        throw DataAccessError("resolve watchlist " + std::to_string(topic) + ": " + e.what());
    }
}

std::optional<UserRecord> PgDataAccess::find_user(UserId id) {
    try {
        pqxx::connection conn(conn_str_);
        pqxx::read_transaction txn(conn);
        pqxx::result r = txn.exec("SELECT id, is_active FROM users WHERE id = $1",
                                  pqxx::params(id));
        if (r.empty()) return std::nullopt;
        UserRecord u;
        u.id = r[0][0].as<UserId>();
        u.is_active = r[0][1].as<bool>();
        return u;
    } catch (const std::exception& e) {
        throw DataAccessError("find user " + std::to_string(id) + ": " + e.what());
    }
}

std::optional<UserId> PgDataAccess::topic_owner(TopicId topic) {
    try {
        pqxx::connection conn(conn_str_);
        pqxx::read_transaction txn(conn);
        pqxx::result r = txn.exec("SELECT user_id FROM watchlists WHERE id = $1",
                                  pqxx::params(topic));
        if (r.empty()) return std::nullopt;
        return r[0][0].as<UserId>();
    } catch (const std::exception& e) {
        throw DataAccessError("watchlist owner " + std::to_string(topic) + ": " + e.what());
    }
}

std::unique_ptr<IDataAccess> make_pg_data_access(const std::string& connection_string) {
    return std::make_unique<PgDataAccess>(connection_string);
}
