/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_PRIMITIVES_HPP
#define UNMOD_PRIMITIVES_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Archive.hpp>

#include <cstdint>
#include <string>

namespace unmod {

/**
 * @brief Write a 32-bit integer using the compact variable-length
 * encoding: 7 bits per byte, least significant group first, high bit
 * set on every byte but the last.
 *
 * If optimizePositive is true, the value is written as an unsigned
 * number (negative values take 5 bytes). Otherwise it is zig-zag
 * encoded so that small negative values are also short.
 *
 * @param archive Archive to write into.
 * @param value Value to write.
 * @param optimizePositive Whether to optimize for non-negative values.
 *
 * @return the number of bytes written (1 to 5).
 */
std::size_t writeVarInt(Archive& archive, int32_t value, bool optimizePositive);

/**
 * @brief Read a 32-bit integer written by writeVarInt.
 * Throws an unmod::Exception if the encoding is longer than 5 bytes
 * or if the archive runs out of data.
 */
int32_t readVarInt(Archive& archive, bool optimizePositive);

/**
 * @brief 64-bit counterpart of writeVarInt, always zig-zag encoded.
 */
std::size_t writeVarLong(Archive& archive, int64_t value);

/**
 * @brief 64-bit counterpart of readVarInt.
 */
int64_t readVarLong(Archive& archive);

/**
 * @brief Write a string as its byte length (varint) followed by its bytes.
 */
void writeString(Archive& archive, const std::string& str);

/**
 * @brief Read a string written by writeString.
 */
std::string readString(Archive& archive);

/**
 * @brief Write a boolean as a single byte (0 or 1).
 */
void writeBoolean(Archive& archive, bool b);

/**
 * @brief Read a boolean. Any non-zero byte is true.
 */
bool readBoolean(Archive& archive);

/**
 * @brief Write a double as its 8-byte IEEE-754 representation,
 * least significant byte first.
 */
void writeDouble(Archive& archive, double d);

double readDouble(Archive& archive);

}

#endif
