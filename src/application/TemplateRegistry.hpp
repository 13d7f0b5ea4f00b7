/**
 * @file TemplateRegistry.hpp
 * @brief Built-in and persisted custom template presets.
 */

#pragma once

#include "domain/ITemplateRepository.hpp"
#include "domain/TemplateConfig.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docforge::application {

/**
 * @class TemplateRegistry
 * @brief Looks up templates by name. Built-ins live in memory and can be neither
 * overwritten nor deleted; custom presets are delegated to the repository.
 */
class TemplateRegistry {
public:
    explicit TemplateRegistry(std::shared_ptr<domain::ITemplateRepository> repository);

    std::optional<domain::TemplateConfig> get(const std::string& name) const;

    /** @brief Built-ins first (fixed order), then custom presets sorted by name. */
    std::vector<domain::TemplateSummary> list() const;

    /** @brief Persists a custom preset, overwriting silently. */
    bool create(const std::string& name, domain::TemplateConfig config);

    /** @brief False when the name is unknown or refers to a built-in. */
    bool remove(const std::string& name);

    bool isBuiltIn(const std::string& name) const;

    static bool IsValidName(const std::string& name);

    /** @brief "technical_report" -> "Technical Report" */
    static std::string DisplayName(const std::string& name);

    /** @brief Shared defaults every built-in starts from. */
    static domain::TemplateConfig BaseTemplate();

private:
    void loadBuiltIns();

    std::shared_ptr<domain::ITemplateRepository> m_repository;
    std::vector<std::string> m_builtInOrder;
    std::map<std::string, domain::TemplateConfig> m_builtIns;
};

} // namespace docforge::application
