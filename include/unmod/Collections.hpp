/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_COLLECTIONS_HPP
#define UNMOD_COLLECTIONS_HPP

#include <unmod/Value.hpp>

#include <deque>
#include <list>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace unmod {

/* Mutable containers that the read-only wrappers delegate to. */

using ArrayList  = std::vector<Value>;
using ArrayDeque = std::deque<Value>;
using LinkedList = std::list<Value>;
using HashSet    = std::unordered_set<Value>;
using TreeSet    = std::set<Value>;
using HashMap    = std::unordered_map<Value, Value>;
using TreeMap    = std::map<Value, Value>;

}

#endif
