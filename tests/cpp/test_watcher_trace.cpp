#include <objwatch/runtime/observers/watcher_trace.h>
#include <objwatch/runtime/runtime.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <iostream>
#include <sstream>

namespace objwatch::test {

    // Routes the trace to std::cout and captures it
    struct CaptureTrace {
        std::ostringstream buffer;
        std::streambuf *previous;

        CaptureTrace() : previous(std::cout.rdbuf(buffer.rdbuf())) { WatcherTrace::set_use_logger(false); }

        ~CaptureTrace() {
            std::cout.rdbuf(previous);
            WatcherTrace::set_use_logger(true);
        }

        [[nodiscard]] std::string str() const { return buffer.str(); }
    };

} // namespace objwatch::test

TEST_CASE("WatcherTrace logs the events of watched objects", "[trace][logging]") {
    using namespace objwatch;
    using Catch::Matchers::ContainsSubstring;

    Runtime runtime;
    test::CaptureTrace capture;
    {
        WatcherTrace trace(runtime.watchers());
        auto d = runtime.new_dict();
        auto c = runtime.new_type("Traced");
        trace.watch(*d);
        trace.watch(*c);

        d->set_item("k", 1);
        c->set_attribute("x", 1);
        auto f = runtime.new_function(runtime.new_code("traced_fn"));
        f->set_defaults(Value::tuple({1}));
    }

    const auto out = capture.str();
    REQUIRE_THAT(out, ContainsSubstring("[dict watcher] <dict at"));
    REQUIRE_THAT(out, ContainsSubstring("New key='k' value=1"));
    REQUIRE_THAT(out, ContainsSubstring("[type watcher] <class 'Traced'> Modified"));
    REQUIRE_THAT(out, ContainsSubstring("[code watcher] <code object traced_fn"));
    REQUIRE_THAT(out, ContainsSubstring("ModifiedDefaults value=(1,)"));
    REQUIRE_THAT(out, ContainsSubstring("Destroyed"));
}

TEST_CASE("WatcherTrace filters on the object's repr", "[trace][logging]") {
    using namespace objwatch;
    using Catch::Matchers::ContainsSubstring;

    Runtime runtime;
    test::CaptureTrace capture;
    {
        WatcherTrace trace(runtime.watchers(), std::string("Wanted"));
        auto wanted = runtime.new_type("Wanted");
        auto other = runtime.new_type("Other");
        trace.watch(*wanted);
        trace.watch(*other);
        wanted->set_attribute("x", 1);
        other->set_attribute("x", 1);
    }

    REQUIRE_THAT(capture.str(), ContainsSubstring("Wanted"));
    REQUIRE_THAT(capture.str(), !ContainsSubstring("Other"));
}

TEST_CASE("WatcherTrace only occupies the kinds it logs and releases them", "[trace]") {
    using namespace objwatch;

    Runtime runtime;
    auto &w = runtime.watchers();
    {
        WatcherTrace trace(w, std::nullopt, true, false, false, false);
        REQUIRE(trace.watcher_id(ObjectKind::Dict).has_value());
        REQUIRE_FALSE(trace.watcher_id(ObjectKind::Type).has_value());
        REQUIRE(w.dict_registry().size() == 1);
        REQUIRE(w.type_registry().size() == 0);

        auto t = runtime.new_type("T");
        REQUIRE_THROWS_AS(trace.watch(*t), std::invalid_argument);
    }
    REQUIRE(w.dict_registry().size() == 0);
}
