/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_OBJECT_BUFFER_HPP
#define UNMOD_OBJECT_BUFFER_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Engine.hpp>
#include <unmod/Object.hpp>

#include <string_view>
#include <typeindex>
#include <vector>

namespace unmod {

/**
 * @brief An ObjectBuffer serializes Objects to and from byte buffers
 * using an Engine. The internal buffer is reused across calls, starts
 * with a capacity of initialSize bytes and never grows beyond maxSize
 * bytes. An ObjectBuffer is not thread-safe.
 */
class ObjectBuffer {

    public:

    /**
     * @brief Constructor using the sizes from the Engine's
     * "buffer" configuration.
     */
    explicit ObjectBuffer(const Engine& engine);

    /**
     * @brief Constructor with explicit sizes.
     * Throws an unmod::Exception if initialSize is 0
     * or larger than maxSize.
     */
    ObjectBuffer(const Engine& engine, std::size_t initialSize, std::size_t maxSize);

    /**
     * @brief Serialize the Object with its class id.
     * Throws an unmod::Exception if the result exceeds maxSize bytes.
     */
    std::vector<char> writeClassAndObject(const Object& object);

    Object readClassAndObject(std::string_view bytes) const;

    /**
     * @brief Serialize the Object without its class id.
     */
    std::vector<char> writeObject(const Object& object);

    Object readObject(std::string_view bytes, std::type_index type) const;

    template<typename T>
    Object readObject(std::string_view bytes) const {
        return readObject(bytes, std::type_index{typeid(T)});
    }

    std::size_t initialSize() const {
        return m_initial_size;
    }

    std::size_t maxSize() const {
        return m_max_size;
    }

    private:

    const Engine&     m_engine;
    std::size_t       m_initial_size;
    std::size_t       m_max_size;
    std::vector<char> m_buffer;
};

}

#endif
