/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_FORWARD_DECL_HPP
#define UNMOD_FORWARD_DECL_HPP

namespace unmod {

class Archive;
struct BufferWrapperOutputArchive;
struct BufferWrapperInputArchive;
class DelegateAccessFailure;
class Engine;
class Exception;
class InvalidConfig;
class InvalidTag;
class Object;
class ObjectBuffer;
class Serializer;
class UnmodifiableCollection;
class UnmodifiableRandomAccessList;
class UnmodifiableList;
class UnmodifiableSet;
class UnmodifiableSortedSet;
class UnmodifiableMap;
class UnmodifiableSortedMap;
class UnmodifiableCollectionsSerializer;
class UnsupportedOperation;
class UnsupportedVariant;

}

#endif
