/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_CODEC_ERRORS_HPP
#define UNMOD_CODEC_ERRORS_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Exception.hpp>

#include <utility>

namespace unmod {

/**
 * @brief The UnsupportedVariant exception is raised when the
 * UnmodifiableCollectionsSerializer is asked to write an object
 * whose runtime type is not one of the read-only wrapper types.
 * This denotes a registration error.
 */
class UnsupportedVariant : public Exception {

    public:

    template<typename ... Args>
    UnsupportedVariant(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief The InvalidTag exception is raised when the variant tag
 * read from an archive does not correspond to any known variant,
 * either because the data is corrupted or because the writer used
 * a different version of the variant enumeration.
 */
class InvalidTag : public Exception {

    public:

    template<typename ... Args>
    InvalidTag(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief The DelegateAccessFailure exception is raised when the
 * delegate of a read-only wrapper cannot be obtained.
 */
class DelegateAccessFailure : public Exception {

    public:

    template<typename ... Args>
    DelegateAccessFailure(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

}

#endif
