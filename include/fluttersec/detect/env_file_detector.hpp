#pragma once

#include "detector.hpp"
#include <filesystem>

namespace fluttersec {
namespace detect {

// Reports bundled .env and config files, one finding per file.
class EnvFileDetector : public Detector {
public:
    std::string name() const override { return "env_files"; }
    std::vector<common::Finding> scan(const ScanContext& ctx) const override;

    // Keys of `key=value` lines whose name contains a sensitive token.
    static std::vector<std::string> extractSensitiveKeys(const std::string& content,
                                                         const std::vector<std::string>& tokens);

private:
    static common::Finding makeFinding(const std::string& filename, const std::string& rel_path,
                                       const std::vector<std::string>& keys);
    static common::Remediation remediation(const std::string& filename);
};

}}
