/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_VALUE_HPP
#define UNMOD_VALUE_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Archive.hpp>
#include <unmod/Exception.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace unmod {

/**
 * @brief A Value is the element type of the delegate containers
 * (elements, map keys and map values). It holds either nothing (null),
 * a boolean, a 64-bit signed integer, a double, or a string.
 *
 * Values are totally ordered (first by kind, then by content)
 * and hashable, so they can be stored in both std::set and
 * std::unordered_set.
 */
class Value {

    public:

    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string>;

    /**
     * @brief Kind of content, in the order of the Storage alternatives.
     * The numeric values are also the type bytes used on the wire.
     */
    enum class Kind : uint8_t {
        Null    = 0,
        Boolean = 1,
        Integer = 2,
        Double  = 3,
        String  = 4
    };

    Value() = default;
    Value(bool b) : m_content(b) {}
    Value(int i) : m_content(static_cast<int64_t>(i)) {}
    Value(int64_t i) : m_content(i) {}
    Value(double d) : m_content(d) {}
    Value(std::string s) : m_content(std::move(s)) {}
    Value(const char* s) : m_content(std::string{s}) {}

    Value(const Value&) = default;
    Value(Value&&) = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) = default;
    ~Value() = default;

    Kind kind() const {
        return static_cast<Kind>(m_content.index());
    }

    bool isNull() const {
        return std::holds_alternative<std::monostate>(m_content);
    }

    template<typename T>
    bool is() const {
        return std::holds_alternative<T>(m_content);
    }

    /**
     * @brief Access the content as a T.
     * Throws an unmod::Exception if the Value does not hold a T.
     */
    template<typename T>
    const T& get() const {
        auto ptr = std::get_if<T>(&m_content);
        if(!ptr) throw Exception{"Value does not hold the requested type"};
        return *ptr;
    }

    const Storage& content() const {
        return m_content;
    }

    /**
     * @brief Human-readable representation (strings are quoted).
     */
    std::string toString() const;

    bool operator==(const Value& other) const { return m_content == other.m_content; }
    bool operator!=(const Value& other) const { return m_content != other.m_content; }
    bool operator<(const Value& other) const  { return m_content < other.m_content; }
    bool operator<=(const Value& other) const { return m_content <= other.m_content; }
    bool operator>(const Value& other) const  { return m_content > other.m_content; }
    bool operator>=(const Value& other) const { return m_content >= other.m_content; }

    private:

    Storage m_content;
};

/**
 * @brief Write a Value as a kind byte followed by its payload.
 */
void writeValue(Archive& archive, const Value& value);

/**
 * @brief Read a Value written by writeValue.
 * Throws an unmod::Exception on an unknown kind byte.
 */
Value readValue(Archive& archive);

}

namespace std {

template<>
struct hash<unmod::Value> {
    std::size_t operator()(const unmod::Value& v) const {
        return std::hash<unmod::Value::Storage>{}(v.content());
    }
};

}

#endif
