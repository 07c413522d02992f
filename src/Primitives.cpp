/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/Primitives.hpp"
#include "unmod/Exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace unmod {

std::size_t writeVarInt(Archive& archive, int32_t value, bool optimizePositive) {
    uint32_t v = static_cast<uint32_t>(value);
    if(!optimizePositive)
        v = (v << 1) ^ static_cast<uint32_t>(value >> 31);
    uint8_t bytes[5];
    std::size_t count = 0;
    while(v & ~0x7Fu) {
        bytes[count++] = static_cast<uint8_t>((v & 0x7F) | 0x80);
        v >>= 7;
    }
    bytes[count++] = static_cast<uint8_t>(v);
    archive.write(bytes, count);
    return count;
}

int32_t readVarInt(Archive& archive, bool optimizePositive) {
    uint32_t result = 0;
    for(unsigned shift = 0; shift < 35; shift += 7) {
        uint8_t b = 0;
        archive.read(&b, 1);
        if(shift == 28 && (b & 0x70))
            throw Exception{"Malformed varint: value does not fit in 32 bits"};
        result |= static_cast<uint32_t>(b & 0x7F) << shift;
        if(!(b & 0x80)) {
            if(!optimizePositive)
                result = (result >> 1) ^ (~(result & 1) + 1);
            return static_cast<int32_t>(result);
        }
    }
    throw Exception{"Malformed varint: more than 5 bytes"};
}

std::size_t writeVarLong(Archive& archive, int64_t value) {
    uint64_t v = (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
    uint8_t bytes[10];
    std::size_t count = 0;
    while(v & ~0x7Full) {
        bytes[count++] = static_cast<uint8_t>((v & 0x7F) | 0x80);
        v >>= 7;
    }
    bytes[count++] = static_cast<uint8_t>(v);
    archive.write(bytes, count);
    return count;
}

int64_t readVarLong(Archive& archive) {
    uint64_t result = 0;
    for(unsigned shift = 0; shift < 70; shift += 7) {
        uint8_t b = 0;
        archive.read(&b, 1);
        result |= static_cast<uint64_t>(b & 0x7F) << shift;
        if(!(b & 0x80))
            return static_cast<int64_t>((result >> 1) ^ (~(result & 1) + 1));
    }
    throw Exception{"Malformed varlong: more than 10 bytes"};
}

void writeString(Archive& archive, const std::string& str) {
    if(str.size() > static_cast<std::size_t>(INT32_MAX))
        throw Exception{fmt::format(
            "Cannot write a string of {} bytes", str.size())};
    writeVarInt(archive, static_cast<int32_t>(str.size()), true);
    archive.write(str.data(), str.size());
}

std::string readString(Archive& archive) {
    auto size = readVarInt(archive, true);
    if(size < 0)
        throw Exception{fmt::format("Invalid string length {}", size)};
    // grows with the bytes actually read, not with the declared length
    std::string str;
    char chunk[4096];
    auto remaining = static_cast<std::size_t>(size);
    while(remaining) {
        auto n = std::min(remaining, sizeof(chunk));
        archive.read(chunk, n);
        str.append(chunk, n);
        remaining -= n;
    }
    return str;
}

void writeBoolean(Archive& archive, bool b) {
    uint8_t byte = b ? 1 : 0;
    archive.write(&byte, 1);
}

bool readBoolean(Archive& archive) {
    uint8_t byte = 0;
    archive.read(&byte, 1);
    return byte != 0;
}

void writeDouble(Archive& archive, double d) {
    uint64_t bits = 0;
    std::memcpy(&bits, &d, sizeof(bits));
    uint8_t bytes[8];
    for(unsigned i = 0; i < 8; ++i)
        bytes[i] = static_cast<uint8_t>(bits >> (8*i));
    archive.write(bytes, 8);
}

double readDouble(Archive& archive) {
    uint8_t bytes[8];
    archive.read(bytes, 8);
    uint64_t bits = 0;
    for(unsigned i = 0; i < 8; ++i)
        bits |= static_cast<uint64_t>(bytes[i]) << (8*i);
    double d = 0;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

}
