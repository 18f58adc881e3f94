#pragma once

#include "detector.hpp"
#include <filesystem>
#include <optional>

namespace fluttersec {
namespace detect {

// Reports bundled asset files whose extension or name marks them as
// likely to hold keys, databases or credentials.
class AssetExposureDetector : public Detector {
public:
    std::string name() const override { return "assets"; }
    std::vector<common::Finding> scan(const ScanContext& ctx) const override;

    // "extension", "filename", or nullopt when the file is not sensitive.
    static std::optional<std::string> classify(const std::string& filename, const DetectionRules& rules);
    static common::Severity severityFor(const std::string& filename, const DetectionRules& rules);

private:
    static common::Remediation remediation(const std::string& filename, const DetectionRules& rules);
};

}}
