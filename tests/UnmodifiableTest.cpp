/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <unmod/Unmodifiable.hpp>
#include <unmod/Exception.hpp>

using unmod::Object;
using unmod::Value;

TEST_CASE("Read-only wrappers test", "[unmodifiable]") {

    spdlog::set_level(spdlog::level::from_str("critical"));

    SECTION("unmodifiableList picks the wrapper from the delegate type") {
        auto ral = unmod::unmodifiableList(Object::Make<unmod::ArrayList>(unmod::ArrayList{"a", "b"}));
        REQUIRE(ral.is<unmod::UnmodifiableRandomAccessList>());
        auto deq = unmod::unmodifiableList(Object::Make<unmod::ArrayDeque>());
        REQUIRE(deq.is<unmod::UnmodifiableRandomAccessList>());
        auto seq = unmod::unmodifiableList(Object::Make<unmod::LinkedList>(unmod::LinkedList{"a"}));
        REQUIRE(seq.is<unmod::UnmodifiableList>());
        REQUIRE_THROWS_AS(unmod::unmodifiableList(Object::Make<unmod::HashSet>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableList(Object{}), unmod::Exception);
    }

    SECTION("Factory functions reject wrongly-shaped delegates") {
        REQUIRE_THROWS_AS(unmod::unmodifiableCollection(Object::Make<unmod::HashMap>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableSet(Object::Make<unmod::ArrayList>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableSortedSet(Object::Make<unmod::HashSet>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableMap(Object::Make<unmod::TreeSet>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableSortedMap(Object::Make<unmod::HashMap>()), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::unmodifiableSortedMap(Object::Make<std::string>("x")), unmod::Exception);
        REQUIRE_NOTHROW(unmod::unmodifiableCollection(Object::Make<unmod::TreeSet>()));
        REQUIRE_NOTHROW(unmod::unmodifiableSet(Object::Make<unmod::TreeSet>()));
        REQUIRE_NOTHROW(unmod::unmodifiableMap(Object::Make<unmod::TreeMap>()));
    }

    SECTION("Lists forward reads to their delegate") {
        auto delegate = Object::Make<unmod::LinkedList>(unmod::LinkedList{"a", "b", "c"});
        auto obj = unmod::unmodifiableList(delegate);
        const auto& list = obj.as<unmod::UnmodifiableList>();
        REQUIRE(list.size() == 3);
        REQUIRE(!list.empty());
        REQUIRE(list.at(1) == Value{"b"});
        REQUIRE_THROWS_AS(list.at(3), unmod::Exception);
        REQUIRE(list.indexOf("c") == std::optional<std::size_t>{2});
        REQUIRE(!list.indexOf("z").has_value());
        REQUIRE(list.contains("a"));
        REQUIRE(!list.contains(1));
        REQUIRE(list.values() == std::vector<Value>{"a", "b", "c"});
        REQUIRE(list.toString() == R"(["a", "b", "c"])");
        REQUIRE(list.delegate().is<unmod::LinkedList>());
        REQUIRE(&list.delegate().as<unmod::LinkedList>() == &delegate.as<unmod::LinkedList>());
    }

    SECTION("Mutating operations throw") {
        auto list = unmod::UnmodifiableRandomAccessList{
            Object::Make<unmod::ArrayList>(unmod::ArrayList{1, 2})};
        REQUIRE_THROWS_AS(list.add(3), unmod::UnsupportedOperation);
        REQUIRE_THROWS_AS(list.remove(1), unmod::UnsupportedOperation);
        REQUIRE_THROWS_AS(list.set(0, 5), unmod::UnsupportedOperation);
        REQUIRE_THROWS_AS(list.clear(), unmod::UnsupportedOperation);
        REQUIRE(list.values() == std::vector<Value>{1, 2});

        auto map = unmod::UnmodifiableMap{
            Object::Make<unmod::HashMap>(unmod::HashMap{{1, "x"}})};
        REQUIRE_THROWS_AS(map.put(2, "y"), unmod::UnsupportedOperation);
        REQUIRE_THROWS_AS(map.remove(1), unmod::UnsupportedOperation);
        REQUIRE_THROWS_AS(map.clear(), unmod::UnsupportedOperation);
        REQUIRE(map.size() == 1);
    }

    SECTION("Sorted sets") {
        auto set = unmod::UnmodifiableSortedSet{
            Object::Make<unmod::TreeSet>(unmod::TreeSet{3, 1, 2})};
        REQUIRE(set.first() == Value{1});
        REQUIRE(set.last() == Value{3});
        REQUIRE(set.values() == std::vector<Value>{1, 2, 3});
        REQUIRE(set.contains(2));
        auto empty = unmod::UnmodifiableSortedSet{Object::Make<unmod::TreeSet>()};
        REQUIRE(empty.empty());
        REQUIRE_THROWS_AS(empty.first(), unmod::Exception);
        REQUIRE_THROWS_AS(empty.last(), unmod::Exception);
    }

    SECTION("Maps") {
        auto map = unmod::UnmodifiableSortedMap{
            Object::Make<unmod::TreeMap>(unmod::TreeMap{{2, "y"}, {1, "x"}})};
        REQUIRE(map.size() == 2);
        REQUIRE(map.containsKey(1));
        REQUIRE(!map.containsKey(3));
        REQUIRE(map.containsValue("y"));
        REQUIRE(!map.containsValue("z"));
        REQUIRE(map.get(2) == std::optional<Value>{"y"});
        REQUIRE(!map.get(5).has_value());
        REQUIRE(map.firstKey() == Value{1});
        REQUIRE(map.lastKey() == Value{2});
        auto entries = map.entries();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0] == std::make_pair(Value{1}, Value{"x"}));
        REQUIRE(entries[1] == std::make_pair(Value{2}, Value{"y"}));
        REQUIRE(map.toString() == R"({1="x", 2="y"})");

        auto empty = unmod::UnmodifiableSortedMap{Object::Make<unmod::TreeMap>()};
        REQUIRE_THROWS_AS(empty.firstKey(), unmod::Exception);
    }
}
