#include "watcher_test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using objwatch::test::DictEventLog;

TEST_CASE("Dict mutations report one event each", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    const int id = w.add_dict_watcher(log.callback());
    auto d = runtime.new_dict();
    w.watch_dict(id, *d);

    SECTION("insert") {
        d->set_item("foo", "bar");
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'"});
    }

    SECTION("overwrite") {
        d->set_item("foo", "bar");
        d->set_item("foo", "baz");
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'", "Modified:'foo':'baz'"});
    }

    SECTION("overwrite with the same value") {
        d->set_item("foo", "bar");
        d->set_item("foo", "bar");
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'"});
    }

    SECTION("delete") {
        d->set_item("foo", "bar");
        d->del_item("foo");
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'", "Deleted:'foo'"});
    }

    SECTION("pop") {
        d->set_item("foo", "bar");
        REQUIRE(d->pop("foo") == Value("bar"));
        REQUIRE_FALSE(d->pop("foo").has_value());
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'", "Deleted:'foo'"});
    }

    SECTION("popitem") {
        d->set_item("foo", "bar");
        auto [key, value] = d->popitem();
        REQUIRE(key == Value("foo"));
        REQUIRE(value == Value("bar"));
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'", "Deleted:'foo'"});
    }

    SECTION("setdefault") {
        REQUIRE(d->setdefault("foo", "bar") == Value("bar"));
        REQUIRE(d->setdefault("foo", "baz") == Value("bar"));
        REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'"});
    }

    SECTION("clear") {
        d->set_item("a", 1);
        d->set_item("b", 2);
        d->set_item("c", 3);
        log.events.clear();
        d->clear();
        REQUIRE(log.events == std::vector<std::string>{"Cleared"});
    }

    SECTION("clear on an empty dict") {
        d->clear();
        REQUIRE(log.events == std::vector<std::string>{"Cleared"});
    }

    SECTION("bulk copy into an empty dict") {
        auto source = runtime.new_dict();
        source->set_item("a", 1);
        source->set_item("b", 2);
        d->update(*source);
        REQUIRE(log.events == std::vector<std::string>{"Cloned"});
        REQUIRE(d->size() == 2);
        REQUIRE(d->get_item("b") == Value(2));
    }

    SECTION("update into a non-empty dict") {
        d->set_item("a", 1);
        auto source = runtime.new_dict();
        source->set_item("a", 10);
        source->set_item("b", 2);
        log.events.clear();
        d->update(*source);
        REQUIRE(log.events.size() == 2);
        REQUIRE(std::find(log.events.begin(), log.events.end(), "Modified:'a':10") != log.events.end());
        REQUIRE(std::find(log.events.begin(), log.events.end(), "New:'b':2") != log.events.end());
    }

    SECTION("update from an empty dict or itself") {
        auto source = runtime.new_dict();
        d->update(*source);
        d->set_item("a", 1);
        log.events.clear();
        d->update(*d);
        REQUIRE(log.events.empty());
    }

    SECTION("failed mutations report nothing") {
        REQUIRE_THROWS_AS(d->del_item("missing"), KeyError);
        REQUIRE_THROWS_AS(d->popitem(), KeyError);
        REQUIRE_THROWS_AS(d->set_item(runtime.new_dict(), 1), TypeError);
        REQUIRE(log.events.empty());
    }
}

TEST_CASE("Dict deallocation is the last event", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    const int id = w.add_dict_watcher(log.callback());

    auto d = runtime.new_dict();
    w.watch_dict(id, *d);
    d->set_item("foo", "bar");
    d.reset();

    REQUIRE(log.events == std::vector<std::string>{"New:'foo':'bar'", "Deallocated"});
}

TEST_CASE("An unwatched dict produces no events", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    const int id = w.add_dict_watcher(log.callback());

    auto watched_never_mutated = runtime.new_dict();
    w.watch_dict(id, *watched_never_mutated);

    auto unwatched = runtime.new_dict();
    unwatched->set_item("foo", "bar");
    unwatched->clear();

    REQUIRE(log.events.empty());
}

TEST_CASE("Unwatching stops delivery but keeps the watcher usable", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    const int id = w.add_dict_watcher(log.callback());
    auto d1 = runtime.new_dict();
    auto d2 = runtime.new_dict();

    w.watch_dict(id, *d1);
    d1->set_item("a", 1);
    w.unwatch_dict(id, *d1);
    d1->set_item("b", 2);

    w.watch_dict(id, *d2);
    d2->set_item("c", 3);

    REQUIRE(log.events == std::vector<std::string>{"New:'a':1", "New:'c':3"});
    REQUIRE(w.dict_registry().is_registered(id));
}

TEST_CASE("Two watchers on two dicts only see their own dict", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log1;
    DictEventLog log2;
    const int id1 = w.add_dict_watcher(log1.callback());
    const int id2 = w.add_dict_watcher(log2.callback());
    auto d1 = runtime.new_dict();
    auto d2 = runtime.new_dict();
    w.watch_dict(id1, *d1);
    w.watch_dict(id2, *d2);

    d1->set_item("a", 1);
    d2->set_item("b", 2);
    d1->set_item("c", 3);
    d2->del_item("b");

    REQUIRE(log1.events == std::vector<std::string>{"New:'a':1", "New:'c':3"});
    REQUIRE(log2.events == std::vector<std::string>{"New:'b':2", "Deleted:'b'"});
}

TEST_CASE("One dict watched by several slots reports to each in slot order", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    std::vector<int> order;
    const int id0 = w.add_dict_watcher([&order](DictEvent, const DictObject &, const Value *, const Value *) {
        order.push_back(0);
    });
    const int id1 = w.add_dict_watcher([&order](DictEvent, const DictObject &, const Value *, const Value *) {
        order.push_back(1);
    });
    auto d = runtime.new_dict();
    w.watch_dict(id1, *d);
    w.watch_dict(id0, *d);

    d->set_item("k", 1);
    REQUIRE(order == std::vector<int>{0, 1});
}

TEST_CASE("Callbacks observe the mutation already applied", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    std::vector<size_t> sizes;
    const int id = w.add_dict_watcher([&sizes](DictEvent, const DictObject &dict, const Value *, const Value *) {
        sizes.push_back(dict.size());
    });
    auto d = runtime.new_dict();
    w.watch_dict(id, *d);

    d->set_item("a", 1);
    d->set_item("b", 2);
    d->del_item("a");
    d->clear();

    REQUIRE(sizes == std::vector<size_t>{1, 2, 1, 0});
}

TEST_CASE("Callbacks may mutate the watched dict and manage watchers", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    int id = -1;
    id = w.add_dict_watcher([&](DictEvent event, const DictObject &dict, const Value *key, const Value *) {
        log.events.push_back(std::string(to_string(event)));
        // Mirror every new key into a second key once
        if (event == DictEvent::New && key != nullptr && key->is_string() && key->as_string() == "a") {
            const_cast<DictObject &>(dict).set_item("mirror", 1);
        }
        if (event == DictEvent::Cleared) { w.clear_dict_watcher(id); }
    });
    auto d = runtime.new_dict();
    w.watch_dict(id, *d);

    d->set_item("a", 1);
    REQUIRE(d->contains("mirror"));
    d->clear();
    d->set_item("after", 1);

    REQUIRE(log.events == std::vector<std::string>{"New", "New", "Cleared"});
    REQUIRE_FALSE(w.dict_registry().is_registered(id));
}

TEST_CASE("A copy starts unwatched", "[dict][watchers]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog log;
    const int id = w.add_dict_watcher(log.callback());
    auto d = runtime.new_dict();
    w.watch_dict(id, *d);
    d->set_item("a", 1);

    auto copy = d->copy();
    copy->set_item("b", 2);

    REQUIRE(copy->size() == 2);
    REQUIRE(copy->watcher_mask().none());
    REQUIRE(log.events == std::vector<std::string>{"New:'a':1"});
}
