/**
 * @file TemplateRepositoryFs.hpp
 * @brief File system implementation of the template repository: one JSON record per name.
 */

#pragma once

#include "domain/ITemplateRepository.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace docforge::infrastructure {

class TemplateRepositoryFs : public domain::ITemplateRepository {
public:
    explicit TemplateRepositoryFs(std::string templatesDir);

    bool save(const domain::TemplateConfig& config) override;
    std::optional<domain::TemplateConfig> findByName(const std::string& name) override;
    std::vector<std::string> listNames() override;
    bool remove(const std::string& name) override;

    /** @brief Record layout: name, description, category, pdf_styles, word_styles, metadata. */
    static nlohmann::json ToJson(const domain::TemplateConfig& config);

    /** @brief Missing keys keep the defaults of TemplateConfig. Throws nlohmann::json::exception on type mismatch. */
    static domain::TemplateConfig FromJson(const nlohmann::json& j);

private:
    std::string pathFor(const std::string& name) const;

    std::string m_templatesDir;
};

} // namespace docforge::infrastructure
