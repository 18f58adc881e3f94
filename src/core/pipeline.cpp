#include "fluttersec/core/pipeline.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/analysis/security_scorer.hpp"
#include "fluttersec/analysis/attack_simulator.hpp"
#include "fluttersec/common/logger.hpp"
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>

namespace fs = std::filesystem;

namespace fluttersec {
namespace core {

PipelineOptions PipelineOptions::fromConfig(const common::GlobalConfig& config) {
    PipelineOptions options;
    options.work_dir = config.scan.work_dir;
    options.parallel_detectors = config.scan.parallel_detectors;
    options.limits = extract::ExtractionLimits::fromConfig(config.scan);
    options.rules = detect::DetectionRules::fromConfig(config);
    return options;
}

AuditPipeline::AuditPipeline(PipelineOptions options, common::CancellationToken cancel)
    : options_(std::move(options)), cancel_(std::move(cancel)) {
    registry_.registerDefaults();
}

AuditPipeline::AuditPipeline(PipelineOptions options, detect::DetectorRegistry registry,
                             common::CancellationToken cancel)
    : options_(std::move(options)), registry_(std::move(registry)), cancel_(std::move(cancel)) {}

common::Platform AuditPipeline::detectPlatform(const fs::path& package) {
    std::string ext = package.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".apk") return common::Platform::ANDROID;
    if (ext == ".ipa") return common::Platform::IOS;

    common::ErrorContext ctx;
    ctx.component = "Pipeline";
    ctx.with("path", package.string()).with("extension", ext.empty() ? "<none>" : ext);
    throw PipelineError(PipelineErrorCode::UNSUPPORTED_FORMAT,
                        "Unsupported file format: " + (ext.empty() ? std::string("<none>") : ext) +
                        " (expected .apk or .ipa)", ctx);
}

AuditReport AuditPipeline::run(const std::string& package_path) const {
    auto start = std::chrono::steady_clock::now();
    fs::path package(package_path);

    common::Platform platform = detectPlatform(package);

    std::error_code ec;
    if (!fs::is_regular_file(package, ec)) {
        common::ErrorContext ctx;
        ctx.component = "Pipeline";
        ctx.with("path", package_path);
        throw PipelineError(PipelineErrorCode::FILE_NOT_FOUND, "File not found: " + package_path, ctx);
    }

    auto extractor = extract::PackageExtractor::create(platform, package, options_.limits, cancel_);
    auto work_dir = extract::WorkDirectory::create(options_.work_dir, extractor->label());
    if (options_.keep_work_dir) {
        work_dir.keep();
    }

    extractor->extract(work_dir);

    AuditReport report;
    auto& result = report.result;
    auto meta = extractor->metadata();

    result.app_name = meta.app_name;
    result.package_name = meta.package_name;
    result.platform = platform;
    result.file_path = package_path;
    result.is_flutter = extractor->detectFlutter();
    result.timestamp = std::chrono::system_clock::now();

    if (!result.is_flutter) {
        common::Logger::instance().warn("[Pipeline] Flutter runtime not detected, results may be incomplete | package={}",
                                       package_path);
    }

    result.findings = runDetectors(extractor->layout());

    analysis::SecurityScorer::apply(result);

    analysis::AttackSimulator simulator;
    report.simulation = simulator.simulate(result.findings);
    result.time_to_compromise_minutes = report.simulation.time_to_compromise_minutes;
    result.attacker = report.simulation.selected;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    common::Logger::instance().info(
        "[Pipeline] Complete | app={} | platform={} | findings={} | score={} | grade={} | attacker={} | time_ms={}",
        result.app_name, common::to_string(platform), result.findings.size(), result.security_score,
        result.grade, common::to_string(report.simulation.selected), elapsed.count());

    return report;
}

std::vector<common::Finding> AuditPipeline::runDetectors(const extract::PackageLayout& layout) const {
    auto detectors = registry_.createAll();
    std::vector<std::vector<common::Finding>> slots(detectors.size());
    detect::ScanContext ctx{layout, options_.rules, cancel_};

    auto run_one = [&](size_t i) {
        const auto& detector = detectors[i];
        try {
            slots[i] = detector->scan(ctx);
            common::Logger::instance().debug("[Pipeline] Detector finished | name={} | findings={}",
                                            detector->name(), slots[i].size());
        } catch (const PipelineError&) {
            throw;
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Pipeline] Detector failed | name={} | error={}",
                                            detector->name(), e.what());
            slots[i].clear();
        }
    };

    if (options_.parallel_detectors && detectors.size() > 1) {
        tbb::parallel_for(size_t(0), detectors.size(), run_one);
    } else {
        for (size_t i = 0; i < detectors.size(); ++i) {
            run_one(i);
        }
    }

    if (cancel_.isCancelled()) {
        common::ErrorContext err;
        err.component = "Pipeline";
        throw PipelineError(PipelineErrorCode::CANCELLED, "", err);
    }

    std::vector<common::Finding> findings;
    for (auto& slot : slots) {
        std::move(slot.begin(), slot.end(), std::back_inserter(findings));
    }
    return findings;
}

}}
