/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_OBJECT_HPP
#define UNMOD_OBJECT_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Exception.hpp>

#include <fmt/format.h>

#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace unmod {

/**
 * @brief An Object is a shared, immutable, type-erased handle to
 * an instance of any C++ type. It remembers the exact runtime type
 * it was created with, which the Engine uses to select a Serializer.
 *
 * A default-constructed Object is null.
 */
class Object {

    public:

    /**
     * @brief Constructor for a null Object.
     */
    Object() = default;

    /**
     * @brief Constructor from a shared pointer. The Object's type
     * is the static type T, not the dynamic type of *ptr.
     */
    template<typename T>
    Object(std::shared_ptr<T> ptr)
    : m_type(typeid(T))
    , m_ptr(std::const_pointer_cast<const T>(std::move(ptr))) {}

    /**
     * @brief Create an Object holding a T constructed from args.
     */
    template<typename T, typename ... Args>
    static Object Make(Args&&... args) {
        return Object{std::make_shared<const T>(std::forward<Args>(args)...)};
    }

    Object(const Object&) = default;
    Object(Object&&) = default;
    Object& operator=(const Object&) = default;
    Object& operator=(Object&&) = default;
    ~Object() = default;

    /**
     * @brief Exact runtime type of the Object (typeid(void) if null).
     */
    std::type_index type() const {
        return m_type;
    }

    /**
     * @brief Checks whether the Object holds exactly a T.
     */
    template<typename T>
    bool is() const {
        return m_ptr && m_type == std::type_index{typeid(T)};
    }

    /**
     * @brief Access the Object's content as a T.
     * Throws an unmod::Exception if the Object is null or not a T.
     */
    template<typename T>
    const T& as() const {
        if(!m_ptr)
            throw Exception{"Cannot access the content of a null Object"};
        if(!is<T>())
            throw Exception{fmt::format(
                "Object holds a {} and cannot be accessed as a {}",
                m_type.name(), typeid(T).name())};
        return *static_cast<const T*>(m_ptr.get());
    }

    /**
     * @brief Same as as() but returns nullptr instead of throwing.
     */
    template<typename T>
    const T* tryAs() const {
        return is<T>() ? static_cast<const T*>(m_ptr.get()) : nullptr;
    }

    /**
     * @brief Checks whether the Object is non-null.
     */
    operator bool() const {
        return static_cast<bool>(m_ptr);
    }

    private:

    std::type_index             m_type = typeid(void);
    std::shared_ptr<const void> m_ptr;
};

}

#endif
