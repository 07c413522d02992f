/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_BUFFER_WRAPPER_ARCHIVE_HPP
#define UNMOD_BUFFER_WRAPPER_ARCHIVE_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Archive.hpp>
#include <unmod/Exception.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <string_view>
#include <vector>

namespace unmod {

/**
 * @brief Archive appending to a caller-owned std::vector<char>.
 * The vector never grows beyond max_size bytes.
 */
struct BufferWrapperOutputArchive : public Archive {

    void read(void* buffer, std::size_t size) override {
        (void)buffer;
        (void)size;
        throw Exception("BufferWrapperOutputArchive error: archive is write-only");
    }

    void write(const void* data, std::size_t size) override {
        auto new_size = m_buffer.size() + size;
        if(new_size > m_max_size)
            throw Exception(
                    "BufferWrapperOutputArchive error: buffer would exceed its maximum size");
        if(m_buffer.capacity() < new_size) {
            m_buffer.reserve(std::min(2*new_size, m_max_size));
        }
        auto offset = m_buffer.size();
        m_buffer.resize(new_size);
        std::memcpy(m_buffer.data() + offset, data, size);
    }

    BufferWrapperOutputArchive(std::vector<char>& buf,
                               std::size_t max_size = std::numeric_limits<std::size_t>::max())
    : m_buffer(buf)
    , m_max_size(max_size) {}

    std::vector<char>& m_buffer;
    std::size_t        m_max_size;
};

/**
 * @brief Archive consuming a caller-owned contiguous buffer.
 * The remaining (not yet read) bytes are kept in m_buffer.
 */
struct BufferWrapperInputArchive : public Archive {

    void read(void* buffer, std::size_t size) override {
        if(size > m_buffer.size())
            throw Exception(
                    "BufferWrapperInputArchive error: trying to read more than the buffer size");
        std::memcpy(buffer, m_buffer.data(), size);
        m_buffer = std::string_view{m_buffer.data() + size, m_buffer.size() - size};
    }

    void write(const void* data, std::size_t size) override {
        (void)data;
        (void)size;
        throw Exception("BufferWrapperInputArchive error: archive is read-only");
    }

    BufferWrapperInputArchive(std::string_view buf)
    : m_buffer(buf) {}

    std::string_view m_buffer;
};

}

#endif
