#pragma once

#include "../core/pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace fluttersec {
namespace format {

class HtmlFormatter {
public:
    explicit HtmlFormatter(size_t priority_limit = 5);

    std::string format(const core::AuditReport& report) const;

    // Values are HTML-escaped; markdown fields are pre-rendered.
    nlohmann::json prepareTemplateData(const core::AuditReport& report) const;

private:
    size_t priority_limit_;

    nlohmann::json findingData(const common::Finding& finding) const;
    const char* getHtmlTemplate() const;
};

}}
