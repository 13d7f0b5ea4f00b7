/**
 * @file ITemplateRepository.hpp
 * @brief Interface for persisting custom template presets.
 */

#pragma once

#include <vector>
#include <optional>
#include <string>
#include "domain/TemplateConfig.hpp"

namespace docforge::domain {

class ITemplateRepository {
public:
    virtual ~ITemplateRepository() = default;

    // Create or overwrite the record stored under config.name
    virtual bool save(const TemplateConfig& config) = 0;

    // Load by name; nullopt when missing or unreadable
    virtual std::optional<TemplateConfig> findByName(const std::string& name) = 0;

    // Names of all stored records, sorted
    virtual std::vector<std::string> listNames() = 0;

    virtual bool remove(const std::string& name) = 0;
};

} // namespace docforge::domain
