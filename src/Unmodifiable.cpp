/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/Unmodifiable.hpp"
#include "unmod/Exception.hpp"
#include "DelegateVisitor.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace unmod {

static void checkDelegate(const Object& delegate, bool accepted, const char* wrapper) {
    if(!delegate)
        throw Exception{fmt::format("Cannot create an {} from a null delegate", wrapper)};
    if(!accepted)
        throw Exception{fmt::format(
            "Cannot create an {} from a delegate of type {}",
            wrapper, delegate.type().name())};
}

[[noreturn]] static void unsupported(const char* operation) {
    throw UnsupportedOperation{fmt::format(
        "Operation {} is not supported by read-only collections", operation)};
}

template<typename C>
static bool containsValue(const C& c, const Value& value) {
    return std::find(c.begin(), c.end(), value) != c.end();
}

static bool containsValue(const HashSet& c, const Value& value) {
    return c.count(value) != 0;
}

static bool containsValue(const TreeSet& c, const Value& value) {
    return c.count(value) != 0;
}

// ------------------------------------------------------------------------
// CollectionWrapper
// ------------------------------------------------------------------------

std::size_t CollectionWrapper::size() const {
    return visitCollection(m_delegate, [](const auto& c) { return c.size(); });
}

bool CollectionWrapper::contains(const Value& value) const {
    return visitCollection(m_delegate, [&value](const auto& c) {
        return containsValue(c, value);
    });
}

void CollectionWrapper::forEach(const std::function<void(const Value&)>& func) const {
    visitCollection(m_delegate, [&func](const auto& c) {
        for(const auto& v : c) func(v);
    });
}

std::vector<Value> CollectionWrapper::values() const {
    return visitCollection(m_delegate, [](const auto& c) {
        return std::vector<Value>(c.begin(), c.end());
    });
}

std::string CollectionWrapper::toString() const {
    std::string result = "[";
    bool first = true;
    forEach([&](const Value& v) {
        if(!first) result += ", ";
        result += v.toString();
        first = false;
    });
    result += "]";
    return result;
}

bool CollectionWrapper::add(const Value&) {
    unsupported("add");
}

bool CollectionWrapper::remove(const Value&) {
    unsupported("remove");
}

void CollectionWrapper::clear() {
    unsupported("clear");
}

UnmodifiableCollection::UnmodifiableCollection(Object delegate)
: CollectionWrapper(std::move(delegate)) {
    checkDelegate(m_delegate, isCollectionDelegate(m_delegate), "UnmodifiableCollection");
}

// ------------------------------------------------------------------------
// Lists
// ------------------------------------------------------------------------

const Value& ListWrapper::at(std::size_t index) const {
    return visitCollection(m_delegate, [index](const auto& c) -> const Value& {
        if(index >= c.size())
            throw Exception{fmt::format(
                "Index {} out of range for a list of size {}", index, c.size())};
        return *std::next(c.begin(), static_cast<std::ptrdiff_t>(index));
    });
}

std::optional<std::size_t> ListWrapper::indexOf(const Value& value) const {
    return visitCollection(m_delegate, [&value](const auto& c) -> std::optional<std::size_t> {
        auto it = std::find(c.begin(), c.end(), value);
        if(it == c.end()) return std::nullopt;
        return static_cast<std::size_t>(std::distance(c.begin(), it));
    });
}

Value ListWrapper::set(std::size_t, const Value&) {
    unsupported("set");
}

UnmodifiableRandomAccessList::UnmodifiableRandomAccessList(Object delegate)
: ListWrapper(std::move(delegate)) {
    checkDelegate(m_delegate,
                  m_delegate.is<ArrayList>() || m_delegate.is<ArrayDeque>(),
                  "UnmodifiableRandomAccessList");
}

UnmodifiableList::UnmodifiableList(Object delegate)
: ListWrapper(std::move(delegate)) {
    checkDelegate(m_delegate, m_delegate.is<LinkedList>(), "UnmodifiableList");
}

// ------------------------------------------------------------------------
// Sets
// ------------------------------------------------------------------------

UnmodifiableSet::UnmodifiableSet(Object delegate)
: SetWrapper(std::move(delegate)) {
    checkDelegate(m_delegate,
                  m_delegate.is<HashSet>() || m_delegate.is<TreeSet>(),
                  "UnmodifiableSet");
}

UnmodifiableSortedSet::UnmodifiableSortedSet(Object delegate)
: SetWrapper(std::move(delegate)) {
    checkDelegate(m_delegate, m_delegate.is<TreeSet>(), "UnmodifiableSortedSet");
}

const Value& UnmodifiableSortedSet::first() const {
    const auto& set = m_delegate.as<TreeSet>();
    if(set.empty()) throw Exception{"first() called on an empty set"};
    return *set.begin();
}

const Value& UnmodifiableSortedSet::last() const {
    const auto& set = m_delegate.as<TreeSet>();
    if(set.empty()) throw Exception{"last() called on an empty set"};
    return *set.rbegin();
}

// ------------------------------------------------------------------------
// Maps
// ------------------------------------------------------------------------

std::size_t MapWrapper::size() const {
    return visitMap(m_delegate, [](const auto& m) { return m.size(); });
}

bool MapWrapper::containsKey(const Value& key) const {
    return visitMap(m_delegate, [&key](const auto& m) { return m.count(key) != 0; });
}

bool MapWrapper::containsValue(const Value& value) const {
    return visitMap(m_delegate, [&value](const auto& m) {
        return std::any_of(m.begin(), m.end(),
                           [&value](const auto& p) { return p.second == value; });
    });
}

std::optional<Value> MapWrapper::get(const Value& key) const {
    return visitMap(m_delegate, [&key](const auto& m) -> std::optional<Value> {
        auto it = m.find(key);
        if(it == m.end()) return std::nullopt;
        return it->second;
    });
}

void MapWrapper::forEach(const std::function<void(const Value&, const Value&)>& func) const {
    visitMap(m_delegate, [&func](const auto& m) {
        for(const auto& p : m) func(p.first, p.second);
    });
}

std::vector<std::pair<Value, Value>> MapWrapper::entries() const {
    return visitMap(m_delegate, [](const auto& m) {
        return std::vector<std::pair<Value, Value>>(m.begin(), m.end());
    });
}

std::string MapWrapper::toString() const {
    std::string result = "{";
    bool first = true;
    forEach([&](const Value& k, const Value& v) {
        if(!first) result += ", ";
        result += fmt::format("{}={}", k.toString(), v.toString());
        first = false;
    });
    result += "}";
    return result;
}

std::optional<Value> MapWrapper::put(const Value&, const Value&) {
    unsupported("put");
}

std::optional<Value> MapWrapper::remove(const Value&) {
    unsupported("remove");
}

void MapWrapper::clear() {
    unsupported("clear");
}

UnmodifiableMap::UnmodifiableMap(Object delegate)
: MapWrapper(std::move(delegate)) {
    checkDelegate(m_delegate, isMapDelegate(m_delegate), "UnmodifiableMap");
}

UnmodifiableSortedMap::UnmodifiableSortedMap(Object delegate)
: MapWrapper(std::move(delegate)) {
    checkDelegate(m_delegate, m_delegate.is<TreeMap>(), "UnmodifiableSortedMap");
}

const Value& UnmodifiableSortedMap::firstKey() const {
    const auto& map = m_delegate.as<TreeMap>();
    if(map.empty()) throw Exception{"firstKey() called on an empty map"};
    return map.begin()->first;
}

const Value& UnmodifiableSortedMap::lastKey() const {
    const auto& map = m_delegate.as<TreeMap>();
    if(map.empty()) throw Exception{"lastKey() called on an empty map"};
    return map.rbegin()->first;
}

// ------------------------------------------------------------------------
// Factory functions
// ------------------------------------------------------------------------

Object unmodifiableCollection(Object collection) {
    return Object::Make<UnmodifiableCollection>(std::move(collection));
}

Object unmodifiableList(Object list) {
    if(list.is<LinkedList>())
        return Object::Make<UnmodifiableList>(std::move(list));
    return Object::Make<UnmodifiableRandomAccessList>(std::move(list));
}

Object unmodifiableSet(Object set) {
    return Object::Make<UnmodifiableSet>(std::move(set));
}

Object unmodifiableSortedSet(Object set) {
    return Object::Make<UnmodifiableSortedSet>(std::move(set));
}

Object unmodifiableMap(Object map) {
    return Object::Make<UnmodifiableMap>(std::move(map));
}

Object unmodifiableSortedMap(Object map) {
    return Object::Make<UnmodifiableSortedMap>(std::move(map));
}

}
