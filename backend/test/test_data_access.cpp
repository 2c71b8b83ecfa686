#include "../src/access/data_access.hpp"
#include "../src/access/data_access_pg.hpp"

#include <cassert>
#include <iostream>
#include <variant>

static void test_connect_timeout_uri_form() {
    assert(PgDataAccess::with_connect_timeout("postgresql://u:p@db:5432/app") ==
           "postgresql://u:p@db:5432/app?connect_timeout=5");
    assert(PgDataAccess::with_connect_timeout("postgresql://u@db/app?sslmode=require") ==
           "postgresql://u@db/app?sslmode=require&connect_timeout=5");
}

static void test_connect_timeout_keyword_form() {
    assert(PgDataAccess::with_connect_timeout("host=db dbname=app user=u") ==
           "host=db dbname=app user=u connect_timeout=5");
    assert(PgDataAccess::with_connect_timeout("host=db dbname=app ") ==
           "host=db dbname=app connect_timeout=5");
    assert(PgDataAccess::with_connect_timeout("") == "connect_timeout=5");
}

static void test_connect_timeout_kept() {
    const std::string kw = "host=db connect_timeout=2";
    assert(PgDataAccess::with_connect_timeout(kw) == kw);
    const std::string uri = "postgresql://db/app?connect_timeout=2";
    assert(PgDataAccess::with_connect_timeout(uri) == uri);
}

static void test_owner_and_visibility() {
    auto db = make_memory_data_access();
    seed_demo_data(*db);

    assert(db->topic_owner(2) == UserId{1});
    assert(!db->topic_owner(42));

    // public list: anyone; private: owner only
    assert(std::holds_alternative<TopicView>(db->resolve_topic(2, Principal{2})));
    assert(db->set_public(2, false));
    auto denied = db->resolve_topic(2, Principal{2});
    assert(std::get<ResolveError>(denied) == ResolveError::Unauthorized);
    assert(std::holds_alternative<TopicView>(db->resolve_topic(2, Principal{1})));
    assert(!db->set_public(42, true));

    db->set_failing(true);
    bool threw = false;
    try {
        (void)db->topic_owner(2);
    } catch (const DataAccessError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_connect_timeout_uri_form();
    test_connect_timeout_keyword_form();
    test_connect_timeout_kept();
    test_owner_and_visibility();
    std::cout << "OK\n";
    return 0;
}
