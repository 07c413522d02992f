/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <unmod/BufferWrapperArchive.hpp>
#include <unmod/Exception.hpp>
#include "TestUtil.hpp"

#include <string>

TEST_CASE("BufferWrapperArchive test", "[archive]") {

    spdlog::set_level(spdlog::level::from_str("critical"));

    SECTION("Write then read") {
        std::vector<char> buffer;
        unmod::BufferWrapperOutputArchive out{buffer};
        out.write("hello", 5);
        out.write("world", 5);
        REQUIRE(buffer.size() == 10);

        unmod::BufferWrapperInputArchive in{view(buffer)};
        char word[5];
        in.read(word, 5);
        REQUIRE(std::string(word, 5) == "hello");
        REQUIRE(in.m_buffer.size() == 5);
        in.read(word, 5);
        REQUIRE(std::string(word, 5) == "world");
        REQUIRE(in.m_buffer.empty());
        REQUIRE_THROWS_AS(in.read(word, 1), unmod::Exception);
    }

    SECTION("Output archive respects its maximum size") {
        std::vector<char> buffer;
        unmod::BufferWrapperOutputArchive out{buffer, 8};
        out.write("12345678", 8);
        REQUIRE_THROWS_AS(out.write("9", 1), unmod::Exception);
        REQUIRE(buffer.size() == 8);
    }

    SECTION("Archives are one-directional") {
        std::vector<char> buffer = bytes({1, 2, 3});
        unmod::BufferWrapperOutputArchive out{buffer};
        char c;
        REQUIRE_THROWS_AS(out.read(&c, 1), unmod::Exception);
        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE_THROWS_AS(in.write(&c, 1), unmod::Exception);
    }
}
