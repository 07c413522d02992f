/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <unmod/ObjectBuffer.hpp>
#include <unmod/Collections.hpp>
#include <unmod/Exception.hpp>
#include "TestUtil.hpp"

TEST_CASE("ObjectBuffer test", "[buffer]") {

    spdlog::set_level(spdlog::level::from_str("critical"));

    SECTION("Sizes come from the Engine configuration") {
        unmod::Engine engine{nlohmann::json::parse(R"({"buffer":{"initial_size":16,"max_size":32}})")};
        unmod::ObjectBuffer buffer{engine};
        REQUIRE(buffer.initialSize() == 16);
        REQUIRE(buffer.maxSize() == 32);
    }

    SECTION("Invalid sizes") {
        unmod::Engine engine;
        REQUIRE_THROWS_AS(unmod::ObjectBuffer(engine, 0, 10), unmod::Exception);
        REQUIRE_THROWS_AS(unmod::ObjectBuffer(engine, 20, 10), unmod::Exception);
    }

    SECTION("Writing more than the maximum size fails") {
        unmod::Engine engine;
        unmod::ObjectBuffer buffer{engine, 4, 8};
        auto small = unmod::Object::Make<std::string>("abc");
        REQUIRE(buffer.writeClassAndObject(small).size() == 5);
        auto large = unmod::Object::Make<unmod::ArrayList>(
            unmod::ArrayList{"one", "two", "three"});
        REQUIRE_THROWS_AS(buffer.writeClassAndObject(large), unmod::Exception);
        /* the buffer is still usable after a failure */
        REQUIRE(buffer.writeClassAndObject(small).size() == 5);
    }

    SECTION("Successive writes are independent") {
        unmod::Engine engine;
        unmod::ObjectBuffer buffer{engine};
        auto first = buffer.writeClassAndObject(unmod::Object::Make<int64_t>(int64_t{1}));
        auto second = buffer.writeClassAndObject(unmod::Object::Make<bool>(true));
        REQUIRE(first == bytes({0x02, 0x02}));
        REQUIRE(second == bytes({0x03, 0x01}));
        REQUIRE(buffer.readClassAndObject(view(first)).as<int64_t>() == 1);
        REQUIRE(buffer.readClassAndObject(view(second)).as<bool>());
    }

    SECTION("Objects without class id") {
        unmod::Engine engine;
        unmod::ObjectBuffer buffer{engine};
        auto data = buffer.writeObject(unmod::Object::Make<double>(0.25));
        REQUIRE(data.size() == 8);
        REQUIRE(buffer.readObject<double>(view(data)).as<double>() == 0.25);
        REQUIRE_THROWS_AS(buffer.readObject<std::string>(std::string_view{}), unmod::Exception);
    }
}
