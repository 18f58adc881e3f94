#include <gtest/gtest.h>
#include "fluttersec/core/pipeline.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/detect/env_file_detector.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace fluttersec;
using core::AuditPipeline;
using core::PipelineError;
using core::PipelineErrorCode;
using core::PipelineOptions;
using common::Severity;

namespace {

class ThrowingDetector : public detect::Detector {
public:
    std::string name() const override { return "throwing"; }
    std::vector<common::Finding> scan(const detect::ScanContext&) const override {
        throw std::runtime_error("detector exploded");
    }
};

class CancellingDetector : public detect::Detector {
public:
    explicit CancellingDetector(common::CancellationToken token) : token_(token) {}
    std::string name() const override { return "cancelling"; }
    std::vector<common::Finding> scan(const detect::ScanContext& ctx) const override {
        token_.cancel();
        checkCancelled(ctx);
        return {};
    }

private:
    mutable common::CancellationToken token_;
};

class PipelineTest : public ::testing::Test {
protected:
    test::TempDir tmp;

    PipelineOptions options() const {
        auto opts = PipelineOptions::fromConfig(common::Config::createDefaultConfig());
        opts.work_dir = (tmp / "work").string();
        return opts;
    }

    fs::path writeShopApk(bool with_env) {
        auto entries = test::flutterApkEntries({
            "https://api.shop-backend.io/v2/orders",
            "apiKey=live_0123456789",
        });
        if (with_env) {
            entries.emplace_back("assets/flutter_assets/.env", "API_KEY=abc\nAPI_URL=https://api.shop-backend.io\n");
            entries.emplace_back("assets/flutter_assets/data/cache.db", "SQLite format 3");
        }
        auto path = tmp / "shop.apk";
        test::writeZip(path, entries);
        return path;
    }

    PipelineErrorCode runError(const AuditPipeline& pipeline, const std::string& path) {
        try {
            pipeline.run(path);
        } catch (const PipelineError& e) {
            return e.code();
        }
        ADD_FAILURE() << "pipeline succeeded unexpectedly";
        return PipelineErrorCode::FILE_NOT_FOUND;
    }
};

}

TEST_F(PipelineTest, DetectsPlatformFromExtension) {
    EXPECT_EQ(AuditPipeline::detectPlatform("app.apk"), common::Platform::ANDROID);
    EXPECT_EQ(AuditPipeline::detectPlatform("App.IPA"), common::Platform::IOS);
    EXPECT_THROW(AuditPipeline::detectPlatform("app.zip"), PipelineError);
    EXPECT_THROW(AuditPipeline::detectPlatform("app"), PipelineError);
}

TEST_F(PipelineTest, AuditsFlutterApk) {
    auto apk = writeShopApk(true);
    AuditPipeline pipeline(options());

    auto report = pipeline.run(apk.string());
    const auto& result = report.result;

    EXPECT_EQ(result.app_name, "Shop");
    EXPECT_EQ(result.package_name, "com.example.shop");
    EXPECT_EQ(result.platform, common::Platform::ANDROID);
    EXPECT_EQ(result.file_path, apk.string());
    EXPECT_TRUE(result.is_flutter);

    ASSERT_GE(result.findings.size(), 4u);
    EXPECT_EQ(result.findings[0].title, ".env File Exposed");
    EXPECT_EQ(result.findings[1].title, "Sensitive File Exposed: cache.db");

    auto counts = result.countBySeverity();
    EXPECT_GE(counts[Severity::CRITICAL], 2u);
    EXPECT_GE(counts[Severity::HIGH], 1u);

    EXPECT_LT(result.security_score, 60);
    EXPECT_EQ(result.attack_surface_score, std::min<int>(10, 2 * counts[Severity::CRITICAL] + counts[Severity::HIGH]));

    EXPECT_EQ(report.simulation.selected, common::AttackerLevel::BEGINNER);
    EXPECT_EQ(result.time_to_compromise_minutes, 2);
    ASSERT_TRUE(result.attacker.has_value());
    EXPECT_EQ(*result.attacker, common::AttackerLevel::BEGINNER);

    EXPECT_FALSE(fs::exists(tmp / "work"));
}

TEST_F(PipelineTest, CleanApkScoresHigh) {
    auto path = tmp / "clean.apk";
    auto entries = test::flutterApkEntries({"plain dart identifier"});
    test::writeZip(path, entries);

    AuditPipeline pipeline(options());
    auto report = pipeline.run(path.string());

    EXPECT_TRUE(report.result.findings.empty());
    EXPECT_EQ(report.result.security_score, 100);
    EXPECT_EQ(report.result.grade, "A");
    EXPECT_FALSE(report.simulation.compromised);
    EXPECT_EQ(report.result.time_to_compromise_minutes, 0);
}

TEST_F(PipelineTest, ParallelDetectorsKeepOrder) {
    auto apk = writeShopApk(true);

    auto sequential_opts = options();
    auto parallel_opts = options();
    parallel_opts.parallel_detectors = true;

    auto sequential = AuditPipeline(sequential_opts).run(apk.string());
    auto parallel = AuditPipeline(parallel_opts).run(apk.string());

    ASSERT_EQ(sequential.result.findings.size(), parallel.result.findings.size());
    for (size_t i = 0; i < sequential.result.findings.size(); ++i) {
        EXPECT_EQ(sequential.result.findings[i].title, parallel.result.findings[i].title);
        EXPECT_EQ(sequential.result.findings[i].severity, parallel.result.findings[i].severity);
    }
    EXPECT_EQ(sequential.result.security_score, parallel.result.security_score);
}

TEST_F(PipelineTest, FailingDetectorDoesNotAbortAudit) {
    auto apk = writeShopApk(true);

    detect::DetectorRegistry registry;
    registry.add([] { return std::make_unique<ThrowingDetector>(); });
    registry.add([] { return std::make_unique<detect::EnvFileDetector>(); });

    AuditPipeline pipeline(options(), std::move(registry));
    auto report = pipeline.run(apk.string());

    ASSERT_EQ(report.result.findings.size(), 1u);
    EXPECT_EQ(report.result.findings[0].title, ".env File Exposed");
}

TEST_F(PipelineTest, CancellationAbortsAndCleansUp) {
    auto apk = writeShopApk(true);
    common::CancellationToken cancel;

    detect::DetectorRegistry registry;
    registry.add([cancel] { return std::make_unique<CancellingDetector>(cancel); });

    AuditPipeline pipeline(options(), std::move(registry), cancel);
    EXPECT_EQ(runError(pipeline, apk.string()), PipelineErrorCode::CANCELLED);
    EXPECT_FALSE(fs::exists(tmp / "work"));
}

TEST_F(PipelineTest, ReportsMissingFile) {
    AuditPipeline pipeline(options());
    EXPECT_EQ(runError(pipeline, (tmp / "missing.apk").string()), PipelineErrorCode::FILE_NOT_FOUND);
}

TEST_F(PipelineTest, ReportsUnsupportedFormat) {
    auto path = tmp / "archive.zip";
    test::writeZip(path, {{"a.txt", "a"}});
    AuditPipeline pipeline(options());
    EXPECT_EQ(runError(pipeline, path.string()), PipelineErrorCode::UNSUPPORTED_FORMAT);
}

TEST_F(PipelineTest, InvalidArchiveLeavesNoWorkDirectory) {
    auto path = tmp / "corrupt.apk";
    test::writeFile(path, "PK\x03\x04 truncated garbage");

    AuditPipeline pipeline(options());
    EXPECT_EQ(runError(pipeline, path.string()), PipelineErrorCode::INVALID_ARCHIVE);
    EXPECT_FALSE(fs::exists(tmp / "work"));
}

TEST_F(PipelineTest, DefaultTempWorkDirectoryIsRemoved) {
    auto apk = writeShopApk(false);
    auto before = test::listWorkDirs("apk");

    auto opts = options();
    opts.work_dir.clear();
    AuditPipeline(opts).run(apk.string());

    auto after = test::listWorkDirs("apk");
    std::sort(before.begin(), before.end());
    std::sort(after.begin(), after.end());
    EXPECT_EQ(before, after);
}

TEST_F(PipelineTest, KeepWorkDirLeavesExtraction) {
    auto apk = writeShopApk(false);
    auto opts = options();
    opts.keep_work_dir = true;

    AuditPipeline(opts).run(apk.string());
    EXPECT_TRUE(fs::exists(tmp / "work/lib/arm64-v8a/libapp.so"));
}
