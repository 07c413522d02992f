/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/Engine.hpp"
#include "unmod/Exception.hpp"
#include "unmod/Primitives.hpp"
#include "EngineImpl.hpp"
#include "DefaultSerializers.hpp"
#include "JsonUtil.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace unmod {

static constexpr const char* configSchema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "properties": {
        "register_defaults": {"type": "boolean"},
        "buffer": {
            "type": "object",
            "properties": {
                "initial_size": {"type": "integer", "minimum": 1},
                "max_size": {"type": "integer", "minimum": 1}
            },
            "additionalProperties": false
        }
    },
    "additionalProperties": false
}
)";

static nlohmann::json completeConfig(const nlohmann::json& config) {
    static const JsonValidator validator{"Engine", configSchema};
    validator.check(config);
    auto result = config;
    if(!result.contains("register_defaults"))
        result["register_defaults"] = true;
    auto& buffer = result["buffer"];
    if(!buffer.contains("initial_size"))
        buffer["initial_size"] = 256;
    if(!buffer.contains("max_size"))
        buffer["max_size"] = std::max<std::size_t>(
            16*1024*1024, buffer["initial_size"].get<std::size_t>());
    if(buffer["max_size"].get<std::size_t>() < buffer["initial_size"].get<std::size_t>()) {
        spdlog::error("[unmod] Engine buffer.max_size is smaller than buffer.initial_size");
        throw InvalidConfig{
            "Invalid Engine configuration: buffer.max_size should be at least buffer.initial_size"};
    }
    return result;
}

const Registration& EngineImpl::find(std::type_index type) const {
    auto it = m_ids.find(type);
    if(it == m_ids.end())
        throw Exception{fmt::format("Class is not registered: {}", type.name())};
    return m_registrations[it->second];
}

const Registration& EngineImpl::find(int32_t id) const {
    if(id < 0 || static_cast<std::size_t>(id) >= m_registrations.size())
        throw Exception{fmt::format("Encountered unregistered class id: {}", id)};
    return m_registrations[static_cast<std::size_t>(id)];
}

Engine::Engine()
: Engine(nlohmann::json::object()) {}

Engine::Engine(const nlohmann::json& config)
: self(std::make_unique<EngineImpl>(completeConfig(config))) {
    if(!self->m_config["register_defaults"].get<bool>()) return;
    registerClass<std::string>("string", std::make_shared<PrimitiveSerializer<std::string>>());
    registerClass<int64_t>("long", std::make_shared<PrimitiveSerializer<int64_t>>());
    registerClass<bool>("boolean", std::make_shared<PrimitiveSerializer<bool>>());
    registerClass<double>("double", std::make_shared<PrimitiveSerializer<double>>());
    registerClass<ArrayList>("ArrayList", std::make_shared<CollectionSerializer<ArrayList>>());
    registerClass<ArrayDeque>("ArrayDeque", std::make_shared<CollectionSerializer<ArrayDeque>>());
    registerClass<LinkedList>("LinkedList", std::make_shared<CollectionSerializer<LinkedList>>());
    registerClass<HashSet>("HashSet", std::make_shared<CollectionSerializer<HashSet>>());
    registerClass<TreeSet>("TreeSet", std::make_shared<CollectionSerializer<TreeSet>>());
    registerClass<HashMap>("HashMap", std::make_shared<MapSerializer<HashMap>>());
    registerClass<TreeMap>("TreeMap", std::make_shared<MapSerializer<TreeMap>>());
}

Engine::~Engine() = default;

const nlohmann::json& Engine::config() const {
    return self->m_config;
}

int32_t Engine::registerClass(std::type_index type,
                              std::string name,
                              std::shared_ptr<Serializer> serializer) {
    if(!serializer)
        throw Exception{fmt::format("Cannot register class {} with a null serializer", name)};
    auto it = self->m_ids.find(type);
    if(it != self->m_ids.end()) {
        auto& registration = self->m_registrations[it->second];
        spdlog::trace("[unmod] Replacing serializer for class {} (id={})",
                      registration.name, registration.id);
        registration.name       = std::move(name);
        registration.serializer = std::move(serializer);
        return registration.id;
    }
    auto index = self->m_registrations.size();
    auto id = static_cast<int32_t>(index);
    spdlog::trace("[unmod] Registering class {} with id={}", name, id);
    self->m_registrations.push_back(
        Registration{id, type, std::move(name), std::move(serializer)});
    self->m_ids.emplace(type, index);
    return id;
}

bool Engine::isRegistered(std::type_index type) const {
    return self->m_ids.count(type) != 0;
}

int32_t Engine::classId(std::type_index type) const {
    return self->find(type).id;
}

const std::shared_ptr<Serializer>& Engine::serializer(std::type_index type) const {
    return self->find(type).serializer;
}

std::size_t Engine::numRegistrations() const {
    return self->m_registrations.size();
}

nlohmann::json Engine::registrations() const {
    auto result = nlohmann::json::array();
    for(const auto& r : self->m_registrations) {
        result.push_back({
            {"id", r.id},
            {"name", r.name},
            {"serializer", r.serializer->metadata()}
        });
    }
    return result;
}

void Engine::writeClassAndObject(Archive& archive, const Object& object) const {
    if(!object) {
        writeVarInt(archive, 0, true);
        return;
    }
    const auto& registration = self->find(object.type());
    writeVarInt(archive, registration.id + 1, true);
    registration.serializer->write(archive, object);
}

Object Engine::readClassAndObject(Archive& archive) const {
    auto id = readVarInt(archive, true);
    if(id == 0) return Object{};
    if(id < 0)
        throw Exception{fmt::format("Encountered unregistered class id: {}", id)};
    const auto& registration = self->find(id - 1);
    return registration.serializer->read(archive, registration.type);
}

void Engine::writeObject(Archive& archive, const Object& object) const {
    if(!object)
        throw Exception{"Cannot write a null Object without its class id"};
    self->find(object.type()).serializer->write(archive, object);
}

Object Engine::readObject(Archive& archive, std::type_index type) const {
    return self->find(type).serializer->read(archive, type);
}

}
