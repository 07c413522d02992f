/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/Value.hpp"
#include "unmod/Primitives.hpp"
#include "unmod/Exception.hpp"

#include <fmt/format.h>

namespace unmod {

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}

std::string Value::toString() const {
    return std::visit(Overloaded{
        [](const std::monostate&) -> std::string { return "null"; },
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](int64_t i) -> std::string { return fmt::format("{}", i); },
        [](double d) -> std::string { return fmt::format("{}", d); },
        [](const std::string& s) -> std::string { return fmt::format("\"{}\"", s); }
    }, m_content);
}

void writeValue(Archive& archive, const Value& value) {
    auto kind = static_cast<uint8_t>(value.kind());
    archive.write(&kind, 1);
    std::visit(Overloaded{
        [](const std::monostate&) {},
        [&archive](bool b) { writeBoolean(archive, b); },
        [&archive](int64_t i) { writeVarLong(archive, i); },
        [&archive](double d) { writeDouble(archive, d); },
        [&archive](const std::string& s) { writeString(archive, s); }
    }, value.content());
}

Value readValue(Archive& archive) {
    uint8_t kind = 0;
    archive.read(&kind, 1);
    switch(static_cast<Value::Kind>(kind)) {
        case Value::Kind::Null:    return Value{};
        case Value::Kind::Boolean: return Value{readBoolean(archive)};
        case Value::Kind::Integer: return Value{readVarLong(archive)};
        case Value::Kind::Double:  return Value{readDouble(archive)};
        case Value::Kind::String:  return Value{readString(archive)};
    }
    throw Exception{fmt::format("Unknown Value kind byte {}", kind)};
}

}
