/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_ENGINE_IMPL_H
#define UNMOD_ENGINE_IMPL_H

#include "unmod/Engine.hpp"
#include "unmod/Serializer.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace unmod {

struct Registration {
    int32_t                     id;
    std::type_index             type;
    std::string                 name;
    std::shared_ptr<Serializer> serializer;
};

class EngineImpl {

    public:

    explicit EngineImpl(nlohmann::json config)
    : m_config(std::move(config)) {}

    const Registration& find(std::type_index type) const;
    const Registration& find(int32_t id) const;

    nlohmann::json                              m_config;
    std::vector<Registration>                   m_registrations; /* indexed by class id */
    std::unordered_map<std::type_index, size_t> m_ids;
};

}

#endif
