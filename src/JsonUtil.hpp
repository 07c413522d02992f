/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_JSON_UTIL_H
#define UNMOD_JSON_UTIL_H

#include "unmod/Exception.hpp"
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <vector>
#include <string>

namespace unmod {

/**
 * @brief Validates JSON configurations against a schema and reports
 * every violation, not only the first one.
 */
class JsonValidator {

    public:

    using ErrorList = std::vector<std::string>;

    JsonValidator(const char* owner, const char* schema)
    : m_owner(owner) {
        m_validator.set_root_schema(nlohmann::json::parse(schema));
    }

    ErrorList validate(const nlohmann::json& json) const {
        ErrorCollector collector;
        m_validator.validate(json, collector);
        return std::move(collector.m_errors);
    }

    /**
     * @brief Logs each violation and throws InvalidConfig
     * carrying the first one.
     */
    void check(const nlohmann::json& json) const {
        auto errors = validate(json);
        if(errors.empty()) return;
        spdlog::error("[unmod] Error(s) while validating JSON config for {}:", m_owner);
        for(auto& error : errors)
            spdlog::error("[unmod] \t{}", error);
        throw InvalidConfig{fmt::format(
            "Invalid {} configuration: {}", m_owner, errors.front())};
    }

    private:

    struct ErrorCollector : public nlohmann::json_schema::basic_error_handler {

        ErrorList m_errors;

        void error(const nlohmann::json::json_pointer& pointer,
                   const nlohmann::json& instance,
                   const std::string& message) override {
            nlohmann::json_schema::basic_error_handler::error(pointer, instance, message);
            m_errors.push_back(fmt::format(
                "'{}' - '{}': {}", pointer.to_string(), instance.dump(), message));
        }
    };

    const char*                            m_owner;
    nlohmann::json_schema::json_validator  m_validator;
};

}

#endif
