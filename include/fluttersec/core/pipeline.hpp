#pragma once

#include "../common/cancellation.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../detect/detection_rules.hpp"
#include "../detect/detector_registry.hpp"
#include "../extract/package_extractor.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fluttersec {
namespace core {

struct PipelineOptions {
    std::string work_dir;
    bool keep_work_dir = false;
    bool parallel_detectors = false;
    extract::ExtractionLimits limits{};
    detect::DetectionRules rules;

    static PipelineOptions fromConfig(const common::GlobalConfig& config);
};

struct AuditReport {
    common::AnalysisResult result;
    common::AttackSimulationOutcome simulation;
};

// Extraction, detection, scoring and attack simulation for one package.
// The working directory is released on every exit path.
class AuditPipeline {
public:
    explicit AuditPipeline(PipelineOptions options, common::CancellationToken cancel = {});
    AuditPipeline(PipelineOptions options, detect::DetectorRegistry registry,
                  common::CancellationToken cancel = {});

    // Throws PipelineError for the fatal conditions in PipelineErrorCode.
    AuditReport run(const std::string& package_path) const;

    // Platform from the file extension; UNSUPPORTED_FORMAT otherwise.
    static common::Platform detectPlatform(const std::filesystem::path& package);

    std::vector<common::Finding> runDetectors(const extract::PackageLayout& layout) const;

    const detect::DetectorRegistry& registry() const { return registry_; }

private:
    PipelineOptions options_;
    detect::DetectorRegistry registry_;
    common::CancellationToken cancel_;
};

}}
