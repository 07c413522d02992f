/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_DEFAULT_SERIALIZERS_H
#define UNMOD_DEFAULT_SERIALIZERS_H

#include "unmod/Serializer.hpp"
#include "unmod/Collections.hpp"
#include "unmod/Primitives.hpp"
#include "unmod/Exception.hpp"

#include <fmt/format.h>

#include <limits>
#include <memory>
#include <string>
#include <type_traits>

namespace unmod {

/**
 * @brief Serializer for the types that a Value can hold, when they
 * are serialized as top-level Objects (no kind byte is written).
 */
template<typename T>
class PrimitiveSerializer : public Serializer {

    public:

    void write(Archive& archive, const Object& object) const override {
        const auto& v = object.as<T>();
        if constexpr (std::is_same_v<T, std::string>) {
            writeString(archive, v);
        } else if constexpr (std::is_same_v<T, bool>) {
            writeBoolean(archive, v);
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(archive, v);
        } else {
            writeVarLong(archive, v);
        }
    }

    Object read(Archive& archive, std::type_index) const override {
        if constexpr (std::is_same_v<T, std::string>) {
            return Object::Make<T>(readString(archive));
        } else if constexpr (std::is_same_v<T, bool>) {
            return Object::Make<T>(readBoolean(archive));
        } else if constexpr (std::is_same_v<T, double>) {
            return Object::Make<T>(readDouble(archive));
        } else {
            return Object::Make<T>(readVarLong(archive));
        }
    }

    nlohmann::json metadata() const override {
        return nlohmann::json{{"type", "primitive"}};
    }
};

static inline int32_t checkedSize(std::size_t size) {
    if(size > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
        throw Exception{fmt::format("Container of {} elements is too large to serialize", size)};
    return static_cast<int32_t>(size);
}

static inline std::size_t readSize(Archive& archive) {
    auto size = readVarInt(archive, true);
    if(size < 0)
        throw Exception{fmt::format("Invalid container size {}", size)};
    return static_cast<std::size_t>(size);
}

/**
 * @brief Serializer for the collection delegates: the number of
 * elements followed by each element, in iteration order.
 */
template<typename C>
class CollectionSerializer : public Serializer {

    public:

    void write(Archive& archive, const Object& object) const override {
        const auto& collection = object.as<C>();
        writeVarInt(archive, checkedSize(collection.size()), true);
        for(const auto& v : collection)
            writeValue(archive, v);
    }

    Object read(Archive& archive, std::type_index) const override {
        auto size = readSize(archive);
        auto collection = std::make_shared<C>();
        for(std::size_t i = 0; i < size; ++i)
            collection->insert(collection->end(), readValue(archive));
        return Object{std::move(collection)};
    }

    nlohmann::json metadata() const override {
        return nlohmann::json{{"type", "collection"}};
    }
};

/**
 * @brief Serializer for the map delegates: the number of entries
 * followed by each key and value, in iteration order.
 */
template<typename M>
class MapSerializer : public Serializer {

    public:

    void write(Archive& archive, const Object& object) const override {
        const auto& map = object.as<M>();
        writeVarInt(archive, checkedSize(map.size()), true);
        for(const auto& [key, value] : map) {
            writeValue(archive, key);
            writeValue(archive, value);
        }
    }

    Object read(Archive& archive, std::type_index) const override {
        auto size = readSize(archive);
        auto map = std::make_shared<M>();
        for(std::size_t i = 0; i < size; ++i) {
            auto key = readValue(archive);
            auto value = readValue(archive);
            map->insert_or_assign(std::move(key), std::move(value));
        }
        return Object{std::move(map)};
    }

    nlohmann::json metadata() const override {
        return nlohmann::json{{"type", "map"}};
    }
};

}

#endif
