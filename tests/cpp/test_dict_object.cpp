#include "watcher_test_support.h"

#include <objwatch/runtime/runtime.h>

#include <catch2/catch_test_macros.hpp>

#include <limits>

TEST_CASE("Dict stores and retrieves values", "[dict]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();
    REQUIRE(d->empty());

    d->set_item("a", 1);
    d->set_item(2, "two");
    d->set_item(Value::tuple({1, "x"}), 3.5);

    REQUIRE(d->size() == 3);
    REQUIRE(d->contains("a"));
    REQUIRE(d->get_item(2) == Value("two"));
    REQUIRE(d->get_item(Value::tuple({1, "x"})) == Value(3.5));
    REQUIRE_FALSE(d->get("missing").has_value());
    REQUIRE(d->get("a") == Value(1));
}

TEST_CASE("Dict erase keeps the remaining items reachable", "[dict]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();
    for (int i = 0; i < 10; ++i) { d->set_item(i, i * 10); }

    d->del_item(0);
    d->del_item(5);
    REQUIRE(d->pop(9, -1) == Value(90));
    REQUIRE(d->pop(9, -1) == Value(-1));

    REQUIRE(d->size() == 7);
    for (int i : {1, 2, 3, 4, 6, 7, 8}) { REQUIRE(d->get_item(i) == Value(i * 10)); }
    REQUIRE(d->keys().size() == 7);
}

TEST_CASE("Dict errors", "[dict][errors]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();

    REQUIRE_THROWS_AS(d->get_item("missing"), KeyError);
    REQUIRE_THROWS_WITH(d->get_item("missing"), "'missing'");
    REQUIRE_THROWS_AS(d->del_item("missing"), KeyError);
    REQUIRE_THROWS_WITH(d->popitem(), "popitem(): dictionary is empty");

    auto key = runtime.new_dict();
    REQUIRE_THROWS_WITH(d->set_item(key, 1), "unhashable type: 'dict'");
    REQUIRE_THROWS_AS(d->set_item(Value::tuple({1, key}), 1), TypeError);
    REQUIRE(d->empty());
}

TEST_CASE("NaN keys are rejected", "[dict][errors]") {
    using namespace objwatch;
    using namespace objwatch::test;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    auto d = runtime.new_dict();
    w.watch_dict(w.add_dict_watcher(log.callback()), *d);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(d->set_item(nan, 1), TypeError);
    REQUIRE_THROWS_WITH(d->set_item(Value::tuple({1, nan}), 1), "unsupported key: nan");
    REQUIRE_THROWS_AS(d->setdefault(nan, 1), TypeError);
    REQUIRE_FALSE(d->contains(nan));
    REQUIRE(d->empty());
    REQUIRE(log.events.empty());

    // Other floats are ordinary keys
    d->set_item(1.5, "x");
    d->del_item(1.5);
    REQUIRE(d->empty());
}

TEST_CASE("Objects are keyed by identity", "[dict]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();
    auto t1 = runtime.new_type("A");
    auto t2 = runtime.new_type("A");

    d->set_item(t1, 1);
    d->set_item(t2, 2);
    REQUIRE(d->size() == 2);
    REQUIRE(d->get_item(t1) == Value(1));
}

TEST_CASE("Dict copy and update copy the items", "[dict]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();
    d->set_item("a", 1);
    d->set_item("b", 2);

    auto copy = d->copy();
    REQUIRE(copy->id() != d->id());
    REQUIRE(copy->get_item("b") == Value(2));

    copy->set_item("a", 100);
    REQUIRE(d->get_item("a") == Value(1));

    auto merged = runtime.new_dict();
    merged->set_item("z", 0);
    merged->update(*copy);
    REQUIRE(merged->size() == 3);
    REQUIRE(merged->get_item("a") == Value(100));
}

TEST_CASE("Dict values keep their objects alive", "[dict]") {
    using namespace objwatch;

    Runtime runtime;
    auto d = runtime.new_dict();
    const size_t before = runtime.heap().live_count();
    {
        auto inner = runtime.new_dict();
        d->set_item("inner", inner);
    }
    REQUIRE(runtime.heap().live_count() == before + 1);
    d->del_item("inner");
    REQUIRE(runtime.heap().live_count() == before);
}
