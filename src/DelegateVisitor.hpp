/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_DELEGATE_VISITOR_HPP
#define UNMOD_DELEGATE_VISITOR_HPP

#include "unmod/Collections.hpp"
#include "unmod/Exception.hpp"
#include "unmod/Object.hpp"

#include <fmt/format.h>

namespace unmod {

inline bool isCollectionDelegate(const Object& delegate) {
    return delegate.is<ArrayList>()
        || delegate.is<ArrayDeque>()
        || delegate.is<LinkedList>()
        || delegate.is<HashSet>()
        || delegate.is<TreeSet>();
}

inline bool isMapDelegate(const Object& delegate) {
    return delegate.is<HashMap>() || delegate.is<TreeMap>();
}

/**
 * @brief Call func with the concrete collection held by the delegate.
 * Throws an unmod::Exception if the delegate is not a collection.
 */
template<typename F>
decltype(auto) visitCollection(const Object& delegate, F&& func) {
    if(auto c = delegate.tryAs<ArrayList>())  return func(*c);
    if(auto c = delegate.tryAs<ArrayDeque>()) return func(*c);
    if(auto c = delegate.tryAs<LinkedList>()) return func(*c);
    if(auto c = delegate.tryAs<HashSet>())    return func(*c);
    if(auto c = delegate.tryAs<TreeSet>())    return func(*c);
    throw Exception{fmt::format(
        "Object of type {} is not a collection", delegate.type().name())};
}

/**
 * @brief Call func with the concrete map held by the delegate.
 * Throws an unmod::Exception if the delegate is not a map.
 */
template<typename F>
decltype(auto) visitMap(const Object& delegate, F&& func) {
    if(auto m = delegate.tryAs<HashMap>()) return func(*m);
    if(auto m = delegate.tryAs<TreeMap>()) return func(*m);
    throw Exception{fmt::format(
        "Object of type {} is not a map", delegate.type().name())};
}

}

#endif
