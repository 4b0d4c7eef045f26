#include "watcher_test_support.h"

#include <objwatch/runtime/runtime.h>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {
    std::vector<std::string> mro_names(const objwatch::TypeObject &type) {
        std::vector<std::string> names;
        for (const auto *t : type.mro()) { names.push_back(t->name()); }
        return names;
    }
} // namespace

TEST_CASE("Types default to the object base", "[type]") {
    using namespace objwatch;

    Runtime runtime;
    auto c = runtime.new_type("C");
    REQUIRE(c->bases().size() == 1);
    REQUIRE(c->bases().front() == runtime.object_type());
    REQUIRE(mro_names(*c) == std::vector<std::string>{"C", "object"});
    REQUIRE(c->repr() == "<class 'C'>");
}

TEST_CASE("MRO follows C3 linearisation", "[type]") {
    using namespace objwatch;

    Runtime runtime;
    auto a = runtime.new_type("A");
    auto b = runtime.new_type("B", {a});
    auto c = runtime.new_type("C", {a});
    auto d = runtime.new_type("D", {b, c});

    REQUIRE(mro_names(*d) == std::vector<std::string>{"D", "B", "C", "A", "object"});
    REQUIRE(d->is_subtype(*a));
    REQUIRE_FALSE(a->is_subtype(*d));

    REQUIRE_THROWS_AS(runtime.new_type("E", {a, b}), TypeError);
    REQUIRE_THROWS_AS(runtime.new_type("F", {a, a}), TypeError);
}

TEST_CASE("Attribute lookup walks the MRO and uses the cache", "[type]") {
    using namespace objwatch;

    Runtime runtime;
    auto base = runtime.new_type("Base");
    auto sub = runtime.new_type("Sub", {base});
    base->set_attribute("x", 1);
    sub->set_attribute("y", 2);

    REQUIRE(sub->get_attribute("x") == Value(1));
    const size_t hits = runtime.type_cache().hits();
    REQUIRE(sub->get_attribute("x") == Value(1));
    REQUIRE(runtime.type_cache().hits() == hits + 1);

    REQUIRE(sub->get_attribute("y") == Value(2));
    REQUIRE_FALSE(sub->lookup("z").has_value());

    // Overriding in the subclass shadows the base and invalidates the cached entry
    sub->set_attribute("x", 10);
    REQUIRE(sub->get_attribute("x") == Value(10));
    base->set_attribute("x", 100);
    REQUIRE(base->get_attribute("x") == Value(100));
    REQUIRE(sub->get_attribute("x") == Value(10));

    sub->del_attribute("x");
    REQUIRE(sub->get_attribute("x") == Value(100));
}

TEST_CASE("Cached lookups do not keep deleted attribute values alive", "[type][cache][lifetime]") {
    using namespace objwatch;
    using namespace objwatch::test;

    Runtime runtime;
    auto &w = runtime.watchers();
    DictEventLog dict_log;
    FunctionEventLog function_log;
    (void)w.add_function_watcher(function_log.callback());
    const int dict_id = w.add_dict_watcher(dict_log.callback());

    auto klass = runtime.new_type("C");
    auto f = runtime.new_function(runtime.new_code("f"));
    auto d = runtime.new_dict();
    w.watch_dict(dict_id, *d);
    klass->set_attribute("f", f);
    klass->set_attribute("d", d);
    klass->set_attribute("pair", Value::tuple({Value(d), 1}));

    // Looked up twice so the second read is served from the cache
    REQUIRE(klass->get_attribute("f").as<FunctionObject>() == f);
    REQUIRE(klass->get_attribute("f").as<FunctionObject>() == f);
    REQUIRE(klass->get_attribute("d").as<DictObject>() == d);
    REQUIRE(klass->get_attribute("pair").as_tuple().size() == 2);

    const size_t live = runtime.heap().live_count();
    klass->del_attribute("f");
    klass->del_attribute("d");
    klass->del_attribute("pair");
    f.reset();
    d.reset();

    REQUIRE(function_log.events().back() == FunctionEvent::Destroyed);
    REQUIRE(dict_log.events == std::vector<std::string>{"Deallocated"});
    // The function, its code object and the dict are gone
    REQUIRE(runtime.heap().live_count() == live - 3);
    REQUIRE_FALSE(klass->lookup("f").has_value());
}

TEST_CASE("Type attribute errors", "[type][errors]") {
    using namespace objwatch;

    Runtime runtime;
    auto c = runtime.new_type("C");
    REQUIRE_THROWS_AS(c->get_attribute("missing"), AttributeError);
    REQUIRE_THROWS_WITH(c->del_attribute("missing"), "type object 'C' has no attribute 'missing'");
}

TEST_CASE("Subclasses are tracked weakly", "[type]") {
    using namespace objwatch;

    Runtime runtime;
    auto base = runtime.new_type("Base");
    {
        auto sub = runtime.new_type("Sub", {base});
        REQUIRE(base->subclasses().size() == 1);
    }
    REQUIRE(base->subclasses().empty());
}

TEST_CASE("Version tags are unique and monotonic", "[type]") {
    using namespace objwatch;

    Runtime runtime;
    auto a = runtime.new_type("A");
    auto b = runtime.new_type("B", {a});
    REQUIRE(b->assign_version_tag());
    REQUIRE(a->has_valid_version_tag());
    REQUIRE(a->version_tag() != b->version_tag());

    const uint32_t old_tag = b->version_tag();
    b->modified();
    REQUIRE(b->version_tag() == 0);
    REQUIRE(b->assign_version_tag());
    REQUIRE(b->version_tag() > old_tag);
}
