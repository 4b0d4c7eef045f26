#include <objwatch/runtime/runtime.h>

#include <catch2/catch_test_macros.hpp>

#include <unordered_set>

TEST_CASE("Heap ids resolve to their objects while they are alive", "[heap]") {
    using namespace objwatch;

    Runtime runtime;
    auto &heap = runtime.heap();
    const size_t baseline = heap.live_count();

    auto d = runtime.new_dict();
    REQUIRE(d->id().valid());
    REQUIRE(heap.resolve(d->id()) == d.get());
    REQUIRE(heap.live_count() == baseline + 1);

    const ObjectId id = d->id();
    d.reset();
    REQUIRE(heap.resolve(id) == nullptr);
    REQUIRE(heap.live_count() == baseline);
}

TEST_CASE("Released slots are reused with a new generation", "[heap]") {
    using namespace objwatch;

    Runtime runtime;
    auto first = runtime.new_dict();
    const ObjectId first_id = first->id();
    first.reset();

    auto second = runtime.new_dict();
    REQUIRE(second->id().index() == first_id.index());
    REQUIRE(second->id().generation() != first_id.generation());
    REQUIRE(second->id() != first_id);
    REQUIRE(runtime.heap().resolve(first_id) == nullptr);
}

TEST_CASE("Heap reserve, bind and release", "[heap]") {
    using namespace objwatch;

    ObjectHeap heap;
    const ObjectId id = heap.reserve();
    REQUIRE(id.valid());
    REQUIRE(heap.live_count() == 1);
    REQUIRE(heap.resolve(id) == nullptr);

    heap.release(id);
    REQUIRE(heap.live_count() == 0);
    // Releasing twice, or an unknown id, is ignored
    heap.release(id);
    heap.release(ObjectId(99, 1));
    REQUIRE(heap.live_count() == 0);
    REQUIRE(heap.slot_count() == 1);

    REQUIRE_THROWS_AS(heap.bind(id, nullptr), std::invalid_argument);
}

TEST_CASE("for_each_live visits the live objects of one kind", "[heap]") {
    using namespace objwatch;

    Runtime runtime;
    auto d1 = runtime.new_dict();
    auto d2 = runtime.new_dict();
    auto t = runtime.new_type("T");
    {
        auto gone = runtime.new_dict();
    }

    std::unordered_set<ObjectId> dicts;
    runtime.heap().for_each_live(ObjectKind::Dict, [&dicts](Object &object) { dicts.insert(object.id()); });
    REQUIRE(dicts == std::unordered_set<ObjectId>{d1->id(), d2->id()});

    size_t types = 0;
    runtime.heap().for_each_live(ObjectKind::Type, [&types](Object &) { ++types; });
    // The runtime's object type plus T
    REQUIRE(types == 2);
}

TEST_CASE("ObjectId formatting and packing", "[heap]") {
    using namespace objwatch;

    const ObjectId id(3, 7);
    REQUIRE(fmt::format("{}", id) == "#3:7");
    REQUIRE(id.value() == ((uint64_t{7} << 32) | 3));
    REQUIRE_FALSE(ObjectId().valid());
}
