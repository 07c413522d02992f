/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <unmod/Primitives.hpp>
#include <unmod/BufferWrapperArchive.hpp>
#include <unmod/Exception.hpp>
#include "TestUtil.hpp"

#include <limits>
#include <string>

TEST_CASE("Primitives test", "[primitives]") {

    spdlog::set_level(spdlog::level::from_str("critical"));

    std::vector<char> buffer;
    unmod::BufferWrapperOutputArchive out{buffer};

    SECTION("Positive-optimized varints") {
        REQUIRE(unmod::writeVarInt(out, 0, true) == 1);
        REQUIRE(unmod::writeVarInt(out, 127, true) == 1);
        REQUIRE(unmod::writeVarInt(out, 128, true) == 2);
        REQUIRE(unmod::writeVarInt(out, 300, true) == 2);
        REQUIRE(buffer == bytes({0x00, 0x7F, 0x80, 0x01, 0xAC, 0x02}));

        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readVarInt(in, true) == 0);
        REQUIRE(unmod::readVarInt(in, true) == 127);
        REQUIRE(unmod::readVarInt(in, true) == 128);
        REQUIRE(unmod::readVarInt(in, true) == 300);
        REQUIRE(in.m_buffer.empty());
    }

    SECTION("Negative values take 5 bytes when optimizing for positive values") {
        REQUIRE(unmod::writeVarInt(out, -1, true) == 5);
        REQUIRE(buffer == bytes({0xFF, 0xFF, 0xFF, 0xFF, 0x0F}));
        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readVarInt(in, true) == -1);
    }

    SECTION("Zig-zag varints") {
        REQUIRE(unmod::writeVarInt(out, 0, false) == 1);
        REQUIRE(unmod::writeVarInt(out, -1, false) == 1);
        REQUIRE(unmod::writeVarInt(out, 1, false) == 1);
        REQUIRE(unmod::writeVarInt(out, -64, false) == 1);
        REQUIRE(buffer == bytes({0x00, 0x01, 0x02, 0x7F}));
        unmod::writeVarInt(out, std::numeric_limits<int32_t>::min(), false);
        unmod::writeVarInt(out, std::numeric_limits<int32_t>::max(), false);

        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readVarInt(in, false) == 0);
        REQUIRE(unmod::readVarInt(in, false) == -1);
        REQUIRE(unmod::readVarInt(in, false) == 1);
        REQUIRE(unmod::readVarInt(in, false) == -64);
        REQUIRE(unmod::readVarInt(in, false) == std::numeric_limits<int32_t>::min());
        REQUIRE(unmod::readVarInt(in, false) == std::numeric_limits<int32_t>::max());
    }

    SECTION("Malformed and truncated varints") {
        auto tooLong = bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x01});
        unmod::BufferWrapperInputArchive in1{view(tooLong)};
        REQUIRE_THROWS_AS(unmod::readVarInt(in1, true), unmod::Exception);

        auto truncated = bytes({0x80});
        unmod::BufferWrapperInputArchive in2{view(truncated)};
        REQUIRE_THROWS_AS(unmod::readVarInt(in2, true), unmod::Exception);

        auto overflowing = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0x1F});
        unmod::BufferWrapperInputArchive in3{view(overflowing)};
        REQUIRE_THROWS_AS(unmod::readVarInt(in3, true), unmod::Exception);

        auto widest = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0x0F});
        unmod::BufferWrapperInputArchive in4{view(widest)};
        REQUIRE(unmod::readVarInt(in4, true) == -1);
    }

    SECTION("Varlongs") {
        REQUIRE(unmod::writeVarLong(out, 0) == 1);
        REQUIRE(unmod::writeVarLong(out, -1) == 1);
        REQUIRE(unmod::writeVarLong(out, 1) == 1);
        REQUIRE(buffer == bytes({0x00, 0x01, 0x02}));
        REQUIRE(unmod::writeVarLong(out, std::numeric_limits<int64_t>::max()) == 10);
        REQUIRE(unmod::writeVarLong(out, std::numeric_limits<int64_t>::min()) == 10);

        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readVarLong(in) == 0);
        REQUIRE(unmod::readVarLong(in) == -1);
        REQUIRE(unmod::readVarLong(in) == 1);
        REQUIRE(unmod::readVarLong(in) == std::numeric_limits<int64_t>::max());
        REQUIRE(unmod::readVarLong(in) == std::numeric_limits<int64_t>::min());
    }

    SECTION("Strings, booleans and doubles") {
        unmod::writeString(out, "abc");
        unmod::writeString(out, "");
        unmod::writeBoolean(out, true);
        unmod::writeDouble(out, 1.0);
        REQUIRE(buffer == bytes({0x03, 'a', 'b', 'c',
                                 0x00,
                                 0x01,
                                 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F}));

        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readString(in) == "abc");
        REQUIRE(unmod::readString(in).empty());
        REQUIRE(unmod::readBoolean(in));
        REQUIRE(unmod::readDouble(in) == 1.0);
    }

    SECTION("Truncated string") {
        auto truncated = bytes({0x05, 'a', 'b'});
        unmod::BufferWrapperInputArchive in{view(truncated)};
        REQUIRE_THROWS_AS(unmod::readString(in), unmod::Exception);

        auto huge = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0x07, 'x'});
        unmod::BufferWrapperInputArchive in2{view(huge)};
        REQUIRE_THROWS_AS(unmod::readString(in2), unmod::Exception);
    }

    SECTION("Strings longer than one read chunk") {
        std::string large(10000, 'z');
        large[4096] = 'a';
        unmod::writeString(out, large);
        unmod::BufferWrapperInputArchive in{view(buffer)};
        REQUIRE(unmod::readString(in) == large);
        REQUIRE(in.m_buffer.empty());
    }
}
