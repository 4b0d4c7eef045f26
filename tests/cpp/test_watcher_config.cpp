#include "watcher_test_support.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Default configuration", "[config]") {
    using namespace objwatch;

    const WatcherConfig config;
    REQUIRE(config.max_watchers(ObjectKind::Dict) == 8);
    REQUIRE(config.max_watchers(ObjectKind::Function) == 8);
    REQUIRE_FALSE(config.clear_subscriptions_on_clear);
    REQUIRE(config.type_cache_size == 4096);
    REQUIRE_NOTHROW(config.validate());

    Runtime runtime;
    REQUIRE(runtime.type_cache().size() == 4096);
}

TEST_CASE("Out of range configuration is rejected", "[config][errors]") {
    using namespace objwatch;

    WatcherConfig too_many;
    too_many.type_max_watchers = 9;
    REQUIRE_THROWS_WITH(too_many.validate(), "type watcher capacity must be between 1 and 8, got 9");
    REQUIRE_THROWS_AS(Runtime(too_many), std::invalid_argument);

    WatcherConfig none;
    none.code_max_watchers = 0;
    REQUIRE_THROWS_AS(Runtime(none), std::invalid_argument);

    WatcherConfig odd_cache;
    odd_cache.type_cache_size = 1000;
    REQUIRE_THROWS_WITH(odd_cache.validate(), "type cache size must be a power of two, got 1000");
}

TEST_CASE("Registry capacity follows the configuration", "[config][registry]") {
    using namespace objwatch;
    using namespace objwatch::test;

    WatcherConfig config;
    config.dict_max_watchers = 2;
    Runtime runtime(config);
    auto &w = runtime.watchers();

    (void)w.add_dict_watcher(ignore_dict);
    (void)w.add_dict_watcher(ignore_dict);
    REQUIRE_THROWS_AS(w.add_dict_watcher(ignore_dict), WatcherCapacityExceeded);
    REQUIRE_THROWS_WITH(w.clear_dict_watcher(2), "Invalid dict watcher ID 2");
    REQUIRE(w.add_type_watcher(ignore_type) == 0);
}

TEST_CASE("Clearing a watcher leaves stale subscriptions by default", "[config][subscription]") {
    using namespace objwatch;
    using namespace objwatch::test;

    Runtime runtime;
    auto &w = runtime.watchers();
    auto d = runtime.new_dict();
    const int id = w.add_dict_watcher(ignore_dict);
    w.watch_dict(id, *d);
    w.clear_dict_watcher(id);

    REQUIRE(d->watcher_mask().test(id));
    REQUIRE_FALSE(w.is_watching(id, *d));
}

TEST_CASE("clear_subscriptions_on_clear scrubs the cleared slot", "[config][subscription]") {
    using namespace objwatch;
    using namespace objwatch::test;

    WatcherConfig config;
    config.clear_subscriptions_on_clear = true;
    Runtime runtime(config);
    auto &w = runtime.watchers();

    DictEventLog log;
    auto d = runtime.new_dict();
    const int old_id = w.add_dict_watcher(ignore_dict);
    w.watch_dict(old_id, *d);
    w.clear_dict_watcher(old_id);
    REQUIRE_FALSE(d->watcher_mask().test(old_id));

    // The next occupant of the slot starts without the old subscriptions
    REQUIRE(w.add_dict_watcher(log.callback()) == old_id);
    d->set_item("k", 1);
    REQUIRE(log.events.empty());

    // Opt-outs for interpreter-wide kinds are scrubbed too
    CodeEventLog code_log;
    auto code = runtime.new_code("f");
    const int code_id = w.add_code_watcher(ignore_code);
    w.unwatch_code(code_id, *code);
    w.clear_code_watcher(code_id);
    REQUIRE(w.add_code_watcher(code_log.callback()) == code_id);
    REQUIRE(w.is_watching(code_id, *code));
}
