/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_EXCEPTION_HPP
#define UNMOD_EXCEPTION_HPP

#include <unmod/ForwardDcl.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace unmod {

class Exception : public std::logic_error {

    public:

    Exception(const Exception&) = default;

    Exception(Exception&&) = default;

    Exception& operator=(const Exception&) = default;

    Exception& operator=(Exception&&) = default;

    Exception(const char* w)
    : std::logic_error(w) {}

    Exception(const std::string& w)
    : std::logic_error(w) {}
};

/**
 * @brief Raised when a mutating operation is called on
 * one of the read-only wrappers.
 */
class UnsupportedOperation : public Exception {

    public:

    template<typename ... Args>
    UnsupportedOperation(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief Raised when the JSON configuration passed to
 * an Engine does not validate against its schema.
 */
class InvalidConfig : public Exception {

    public:

    template<typename ... Args>
    InvalidConfig(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

}

#endif
