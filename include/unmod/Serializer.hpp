/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_SERIALIZER_HPP
#define UNMOD_SERIALIZER_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Archive.hpp>
#include <unmod/Object.hpp>

#include <nlohmann/json.hpp>

#include <typeindex>

namespace unmod {

/**
 * @brief The Serializer class is the interface for the handlers that
 * an Engine binds to concrete runtime types. Its write and read methods
 * should make use of the Archive's write and read methods respectively.
 * Errors should be handled by throwing an unmod::Exception.
 *
 * Serializers are shared by the Engine across calls and threads,
 * hence write and read are const and should not modify the Serializer.
 */
class Serializer {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~Serializer() = default;

    /**
     * @brief Serialize the Object into the Archive. The Engine
     * has already written the Object's class id, if needed.
     *
     * @param archive Archive into which to serialize the object.
     * @param object Object to serialize (never null).
     */
    virtual void write(Archive& archive, const Object& object) const = 0;

    /**
     * @brief Deserialize an Object from the Archive.
     *
     * @param archive Archive from which to deserialize the object.
     * @param type Type the caller expects.
     *
     * @return the deserialized Object.
     */
    virtual Object read(Archive& archive, std::type_index type) const = 0;

    /**
     * @brief Convert the Serializer into a JSON description of itself,
     * e.g. for logging the content of an Engine's registry.
     */
    virtual nlohmann::json metadata() const = 0;

};

}

#endif
