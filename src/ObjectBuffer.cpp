/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/ObjectBuffer.hpp"
#include "unmod/BufferWrapperArchive.hpp"
#include "unmod/Exception.hpp"

#include <fmt/format.h>

namespace unmod {

ObjectBuffer::ObjectBuffer(const Engine& engine)
: ObjectBuffer(engine,
               engine.config()["buffer"]["initial_size"].get<std::size_t>(),
               engine.config()["buffer"]["max_size"].get<std::size_t>()) {}

ObjectBuffer::ObjectBuffer(const Engine& engine, std::size_t initialSize, std::size_t maxSize)
: m_engine(engine)
, m_initial_size(initialSize)
, m_max_size(maxSize) {
    if(initialSize == 0 || initialSize > maxSize)
        throw Exception{fmt::format(
            "Invalid ObjectBuffer sizes (initial={}, max={})", initialSize, maxSize)};
    m_buffer.reserve(m_initial_size);
}

std::vector<char> ObjectBuffer::writeClassAndObject(const Object& object) {
    m_buffer.clear();
    BufferWrapperOutputArchive archive{m_buffer, m_max_size};
    m_engine.writeClassAndObject(archive, object);
    return m_buffer;
}

Object ObjectBuffer::readClassAndObject(std::string_view bytes) const {
    BufferWrapperInputArchive archive{bytes};
    return m_engine.readClassAndObject(archive);
}

std::vector<char> ObjectBuffer::writeObject(const Object& object) {
    m_buffer.clear();
    BufferWrapperOutputArchive archive{m_buffer, m_max_size};
    m_engine.writeObject(archive, object);
    return m_buffer;
}

Object ObjectBuffer::readObject(std::string_view bytes, std::type_index type) const {
    BufferWrapperInputArchive archive{bytes};
    return m_engine.readObject(archive, type);
}

}
