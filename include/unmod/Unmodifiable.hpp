/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_UNMODIFIABLE_HPP
#define UNMOD_UNMODIFIABLE_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Collections.hpp>
#include <unmod/Exception.hpp>
#include <unmod/Object.hpp>
#include <unmod/Value.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unmod {

/**
 * @brief Common base of the read-only wrappers around a collection
 * (ArrayList, ArrayDeque, LinkedList, HashSet or TreeSet).
 *
 * A wrapper shares its delegate: copying a wrapper is cheap and
 * both copies see the same content. Read operations forward to the
 * delegate, mutating operations throw an unmod::UnsupportedOperation.
 */
class CollectionWrapper {

    public:

    /**
     * @brief Returns the delegate collection.
     */
    const Object& delegate() const {
        return m_delegate;
    }

    std::size_t size() const;

    bool empty() const {
        return size() == 0;
    }

    bool contains(const Value& value) const;

    /**
     * @brief Call the function on every element, in the
     * iteration order of the delegate.
     */
    void forEach(const std::function<void(const Value&)>& func) const;

    /**
     * @brief Copy of the elements, in the iteration order of the delegate.
     */
    std::vector<Value> values() const;

    std::string toString() const;

    bool add(const Value& value);
    bool remove(const Value& value);
    void clear();

    protected:

    explicit CollectionWrapper(Object delegate)
    : m_delegate(std::move(delegate)) {}

    Object m_delegate;
};

/**
 * @brief Read-only view over any collection delegate.
 */
class UnmodifiableCollection final : public CollectionWrapper {

    public:

    explicit UnmodifiableCollection(Object delegate);
};

/**
 * @brief Common base of the read-only list wrappers.
 */
class ListWrapper : public CollectionWrapper {

    public:

    /**
     * @brief Element at the given position.
     * Throws an unmod::Exception if index >= size().
     */
    const Value& at(std::size_t index) const;

    /**
     * @brief Position of the first element equal to value, if any.
     */
    std::optional<std::size_t> indexOf(const Value& value) const;

    Value set(std::size_t index, const Value& value);

    protected:

    using CollectionWrapper::CollectionWrapper;
};

/**
 * @brief Read-only view over a random-access list (ArrayList or ArrayDeque).
 */
class UnmodifiableRandomAccessList final : public ListWrapper {

    public:

    explicit UnmodifiableRandomAccessList(Object delegate);
};

/**
 * @brief Read-only view over a sequential-access list (LinkedList).
 */
class UnmodifiableList final : public ListWrapper {

    public:

    explicit UnmodifiableList(Object delegate);
};

/**
 * @brief Common base of the read-only set wrappers.
 */
class SetWrapper : public CollectionWrapper {

    protected:

    using CollectionWrapper::CollectionWrapper;
};

/**
 * @brief Read-only view over a set (HashSet or TreeSet).
 */
class UnmodifiableSet final : public SetWrapper {

    public:

    explicit UnmodifiableSet(Object delegate);
};

/**
 * @brief Read-only view over a sorted set (TreeSet).
 */
class UnmodifiableSortedSet final : public SetWrapper {

    public:

    explicit UnmodifiableSortedSet(Object delegate);

    /**
     * @brief Smallest element. Throws an unmod::Exception if empty.
     */
    const Value& first() const;

    /**
     * @brief Largest element. Throws an unmod::Exception if empty.
     */
    const Value& last() const;
};

/**
 * @brief Common base of the read-only wrappers around
 * a map (HashMap or TreeMap).
 */
class MapWrapper {

    public:

    /**
     * @brief Returns the delegate map.
     */
    const Object& delegate() const {
        return m_delegate;
    }

    std::size_t size() const;

    bool empty() const {
        return size() == 0;
    }

    bool containsKey(const Value& key) const;

    bool containsValue(const Value& value) const;

    /**
     * @brief Value associated with the key, if any.
     */
    std::optional<Value> get(const Value& key) const;

    /**
     * @brief Call the function on every entry, in the
     * iteration order of the delegate.
     */
    void forEach(const std::function<void(const Value&, const Value&)>& func) const;

    /**
     * @brief Copy of the entries, in the iteration order of the delegate.
     */
    std::vector<std::pair<Value, Value>> entries() const;

    std::string toString() const;

    std::optional<Value> put(const Value& key, const Value& value);
    std::optional<Value> remove(const Value& key);
    void clear();

    protected:

    explicit MapWrapper(Object delegate)
    : m_delegate(std::move(delegate)) {}

    Object m_delegate;
};

/**
 * @brief Read-only view over a map (HashMap or TreeMap).
 */
class UnmodifiableMap final : public MapWrapper {

    public:

    explicit UnmodifiableMap(Object delegate);
};

/**
 * @brief Read-only view over a sorted map (TreeMap).
 */
class UnmodifiableSortedMap final : public MapWrapper {

    public:

    explicit UnmodifiableSortedMap(Object delegate);

    /**
     * @brief Smallest key. Throws an unmod::Exception if empty.
     */
    const Value& firstKey() const;

    /**
     * @brief Largest key. Throws an unmod::Exception if empty.
     */
    const Value& lastKey() const;
};

/**
 * @brief Wrap any collection delegate into an UnmodifiableCollection.
 */
Object unmodifiableCollection(Object collection);

/**
 * @brief Wrap a list delegate, producing an UnmodifiableRandomAccessList
 * for ArrayList and ArrayDeque, and an UnmodifiableList for LinkedList.
 */
Object unmodifiableList(Object list);

/**
 * @brief Wrap a HashSet or TreeSet into an UnmodifiableSet.
 */
Object unmodifiableSet(Object set);

/**
 * @brief Wrap a TreeSet into an UnmodifiableSortedSet.
 */
Object unmodifiableSortedSet(Object set);

/**
 * @brief Wrap a HashMap or TreeMap into an UnmodifiableMap.
 */
Object unmodifiableMap(Object map);

/**
 * @brief Wrap a TreeMap into an UnmodifiableSortedMap.
 */
Object unmodifiableSortedMap(Object map);

}

#endif
