#include <gtest/gtest.h>
#include "fluttersec/extract/package_extractor.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "test_helpers.hpp"
#include <algorithm>

namespace fs = std::filesystem;
using namespace fluttersec;
using extract::ExtractionLimits;
using extract::PackageExtractor;
using extract::WorkDirectory;
using core::PipelineError;
using core::PipelineErrorCode;

namespace {

PipelineErrorCode extractError(PackageExtractor& extractor, const WorkDirectory& dir) {
    try {
        extractor.extract(dir);
    } catch (const PipelineError& e) {
        return e.code();
    }
    ADD_FAILURE() << "extraction succeeded unexpectedly";
    return PipelineErrorCode::FILE_NOT_FOUND;
}

}

TEST(SafeEntryPathTest, RejectsTraversalAndAbsolutePaths) {
    EXPECT_TRUE(extract::isSafeEntryPath("assets/flutter_assets/.env"));
    EXPECT_TRUE(extract::isSafeEntryPath("Payload/Runner.app/Info.plist"));
    EXPECT_TRUE(extract::isSafeEntryPath("a/./b"));

    EXPECT_FALSE(extract::isSafeEntryPath(""));
    EXPECT_FALSE(extract::isSafeEntryPath("/etc/passwd"));
    EXPECT_FALSE(extract::isSafeEntryPath("../evil.txt"));
    EXPECT_FALSE(extract::isSafeEntryPath("assets/../../evil.txt"));
    EXPECT_FALSE(extract::isSafeEntryPath("\\windows\\evil"));
}

TEST(PackageExtractorTest, ExtractsApkAndReadsManifest) {
    test::TempDir tmp;
    auto apk = tmp / "shop.apk";
    test::writeZip(apk, test::flutterApkEntries({"https://api.example.com/v1"}));

    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());

    auto stats = extractor->extract(dir);
    EXPECT_EQ(extractor->packagePath(), apk);
    EXPECT_EQ(extractor->root(), dir.path());
    EXPECT_EQ(stats.files, 6u);
    EXPECT_EQ(stats.skipped, 0u);
    EXPECT_TRUE(extractor->detectFlutter());

    auto meta = extractor->metadata();
    EXPECT_EQ(meta.package_name, "com.example.shop");
    EXPECT_EQ(meta.version, "2.1.0");
    EXPECT_EQ(meta.app_name, "Shop");

    auto files = extractor->listFiles();
    EXPECT_NE(std::find(files.begin(), files.end(), "lib/arm64-v8a/libapp.so"), files.end());
    EXPECT_EQ(std::find(files.begin(), files.end(), WorkDirectory::MARKER_FILE), files.end());
}

TEST(PackageExtractorTest, MetadataFallsBackToFileStem) {
    test::TempDir tmp;
    auto apk = tmp / "mystery-app.apk";
    test::writeZip(apk, {{"classes.dex", "dex\n035"}});

    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    extractor->extract(dir);

    auto meta = extractor->metadata();
    EXPECT_EQ(meta.app_name, "mystery-app");
    EXPECT_EQ(meta.package_name, "unknown");
    EXPECT_FALSE(extractor->detectFlutter());
}

TEST(PackageExtractorTest, SkipsTraversalEntries) {
    test::TempDir tmp;
    auto apk = tmp / "evil.apk";
    test::writeZip(apk, {
        {"classes.dex", "dex\n035"},
        {"../escaped.txt", "gotcha"},
        {"assets/../../escaped2.txt", "gotcha"},
    });

    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, ExtractionLimits{});
    auto work = tmp / "work";
    auto dir = WorkDirectory::create(work.string(), extractor->label());

    auto stats = extractor->extract(dir);
    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(stats.skipped, 2u);
    EXPECT_FALSE(fs::exists(tmp / "escaped.txt"));
    EXPECT_FALSE(fs::exists(tmp.path().parent_path() / "escaped2.txt"));
}

TEST(PackageExtractorTest, RejectsNonZipFile) {
    test::TempDir tmp;
    auto apk = tmp / "broken.apk";
    test::writeFile(apk, "this is definitely not a zip archive");

    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::INVALID_ARCHIVE);
}

TEST(PackageExtractorTest, MissingFileIsReported) {
    test::TempDir tmp;
    auto extractor = PackageExtractor::create(common::Platform::ANDROID, tmp / "absent.apk",
                                              ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::FILE_NOT_FOUND);
}

TEST(PackageExtractorTest, EntryLimitIsEnforced) {
    test::TempDir tmp;
    auto apk = tmp / "many.apk";
    test::ZipEntries entries;
    for (int i = 0; i < 10; ++i) {
        entries.emplace_back("res/file" + std::to_string(i) + ".txt", "x");
    }
    test::writeZip(apk, entries);

    ExtractionLimits limits;
    limits.max_entries = 5;
    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, limits);
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::INVALID_ARCHIVE);
}

TEST(PackageExtractorTest, TotalSizeLimitIsEnforced) {
    test::TempDir tmp;
    auto apk = tmp / "big.apk";
    test::writeZip(apk, {{"assets/blob.bin", std::string(8192, 'A')}});

    ExtractionLimits limits;
    limits.max_total_bytes = 1024;
    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, limits);
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::INVALID_ARCHIVE);
}

TEST(PackageExtractorTest, CancelledBeforeFirstEntry) {
    test::TempDir tmp;
    auto apk = tmp / "shop.apk";
    test::writeZip(apk, test::flutterApkEntries({}));

    common::CancellationToken cancel;
    cancel.cancel();
    auto extractor = PackageExtractor::create(common::Platform::ANDROID, apk, ExtractionLimits{}, cancel);
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::CANCELLED);
}

TEST(IpaExtractorTest, RequiresPayloadDirectory) {
    test::TempDir tmp;
    auto ipa = tmp / "app.ipa";
    test::writeZip(ipa, {{"Runner.app/Info.plist", "<plist/>"}});

    auto extractor = PackageExtractor::create(common::Platform::IOS, ipa, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::INVALID_STRUCTURE);
}

TEST(IpaExtractorTest, RequiresAppBundle) {
    test::TempDir tmp;
    auto ipa = tmp / "app.ipa";
    test::writeZip(ipa, {{"Payload/readme.txt", "nothing here"}});

    auto extractor = PackageExtractor::create(common::Platform::IOS, ipa, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    EXPECT_EQ(extractError(*extractor, dir), PipelineErrorCode::INVALID_STRUCTURE);
}

TEST(IpaExtractorTest, ReadsInfoPlist) {
    test::TempDir tmp;
    auto ipa = tmp / "wallet.ipa";
    auto plist = test::buildBinaryPlist({
        {"CFBundleIdentifier", "com.example.wallet"},
        {"CFBundleShortVersionString", "3.4.1"},
        {"CFBundleName", "Wallet"},
    });
    test::writeZip(ipa, {
        {"Payload/Runner.app/Info.plist", std::string(plist.begin(), plist.end())},
        {"Payload/Runner.app/Frameworks/App.framework/App", "dart"},
        {"Payload/Runner.app/Frameworks/Flutter.framework/Flutter", "engine"},
    });

    auto extractor = PackageExtractor::create(common::Platform::IOS, ipa, ExtractionLimits{});
    auto dir = WorkDirectory::create((tmp / "work").string(), extractor->label());
    extractor->extract(dir);

    auto meta = extractor->metadata();
    EXPECT_EQ(meta.package_name, "com.example.wallet");
    EXPECT_EQ(meta.version, "3.4.1");
    EXPECT_EQ(meta.app_name, "Wallet");
    EXPECT_TRUE(extractor->detectFlutter());
}
