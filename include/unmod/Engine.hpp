/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_ENGINE_HPP
#define UNMOD_ENGINE_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/Archive.hpp>
#include <unmod/Exception.hpp>
#include <unmod/Object.hpp>
#include <unmod/Serializer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace unmod {

class EngineImpl;

/**
 * @brief The Engine is the registry binding concrete runtime types
 * to Serializers, and the entry point for serializing Objects
 * together with their runtime type.
 *
 * Registration is expected to happen once, before the Engine is used.
 * After that the Engine is only read, and concurrent calls to its
 * const methods are safe as long as each call uses its own Archive.
 *
 * Serializers may keep a reference to the Engine, hence the Engine
 * can be neither copied nor moved.
 */
class Engine {

    public:

    /**
     * @brief Constructor with the default configuration.
     */
    Engine();

    /**
     * @brief Constructor from a JSON configuration of the form
     * {"register_defaults": true,
     *  "buffer": {"initial_size": 256, "max_size": 16777216}}.
     * All the fields are optional. Throws an unmod::InvalidConfig
     * if the configuration does not validate.
     *
     * @param config JSON configuration.
     */
    explicit Engine(const nlohmann::json& config);

    Engine(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine& operator=(Engine&&) = delete;

    /**
     * @brief Destructor.
     */
    ~Engine();

    /**
     * @brief Effective configuration, with defaults filled in.
     */
    const nlohmann::json& config() const;

    /**
     * @brief Bind a Serializer to a concrete type. Class ids are
     * assigned in registration order. Registering an already
     * registered type keeps its class id and replaces its Serializer.
     *
     * @param type Type to register.
     * @param name Name of the type (used in logs and error messages).
     * @param serializer Serializer for the type.
     *
     * @return the class id of the type.
     */
    int32_t registerClass(std::type_index type,
                          std::string name,
                          std::shared_ptr<Serializer> serializer);

    template<typename T>
    int32_t registerClass(std::string name, std::shared_ptr<Serializer> serializer) {
        return registerClass(std::type_index{typeid(T)}, std::move(name), std::move(serializer));
    }

    /**
     * @brief Checks whether a Serializer is bound to the type.
     */
    bool isRegistered(std::type_index type) const;

    /**
     * @brief Class id of a registered type.
     * Throws an unmod::Exception if the type is not registered.
     */
    int32_t classId(std::type_index type) const;

    /**
     * @brief Serializer bound to a registered type.
     * Throws an unmod::Exception if the type is not registered.
     */
    const std::shared_ptr<Serializer>& serializer(std::type_index type) const;

    /**
     * @brief Number of registered types.
     */
    std::size_t numRegistrations() const;

    /**
     * @brief JSON array describing the registry, ordered by class id.
     */
    nlohmann::json registrations() const;

    /**
     * @brief Write the Object's class id followed by the Object itself.
     * A null Object is written as class id 0 and nothing else.
     * Throws an unmod::Exception if the Object's type is not registered.
     */
    void writeClassAndObject(Archive& archive, const Object& object) const;

    /**
     * @brief Read an Object written by writeClassAndObject.
     * Throws an unmod::Exception if the class id is unknown.
     */
    Object readClassAndObject(Archive& archive) const;

    /**
     * @brief Write the (non-null) Object without its class id.
     */
    void writeObject(Archive& archive, const Object& object) const;

    /**
     * @brief Read an Object written by writeObject, whose type the
     * caller knows.
     */
    Object readObject(Archive& archive, std::type_index type) const;

    template<typename T>
    Object readObject(Archive& archive) const {
        return readObject(archive, std::type_index{typeid(T)});
    }

    private:

    std::unique_ptr<EngineImpl> self;
};

}

#endif
