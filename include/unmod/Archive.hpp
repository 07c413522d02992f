/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_ARCHIVE_HPP
#define UNMOD_ARCHIVE_HPP

#include <unmod/ForwardDcl.hpp>

#include <cstddef>
#include <cstdint>

namespace unmod {

/**
 * @brief The Archive class is the positioned byte stream that
 * serializers write into and read from. Implementations should
 * throw an unmod::Exception when a read goes past the end of the
 * available data or when a write cannot be honored.
 */
class Archive {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~Archive() = default;

    /**
     * @brief Read size bytes from the archive into the buffer.
     *
     * @param buffer Buffer.
     * @param size Number of bytes to read.
     */
    virtual void read(void* buffer, std::size_t size) = 0;

    /**
     * @brief Write size bytes from the buffer into the archive.
     *
     * @param buffer Buffer.
     * @param size Number of bytes to write.
     */
    virtual void write(const void* buffer, std::size_t size) = 0;

};

}

#endif
