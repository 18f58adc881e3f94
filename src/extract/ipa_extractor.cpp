#include "fluttersec/extract/ipa_extractor.hpp"
#include "fluttersec/extract/plist_parser.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/common/logger.hpp"

namespace fs = std::filesystem;

namespace fluttersec {
namespace extract {

using core::PipelineError;
using core::PipelineErrorCode;

void IpaExtractor::validateLayout() const {
    std::error_code ec;
    common::ErrorContext ctx;
    ctx.component = "Extractor";
    ctx.with("package", package_.string());

    if (!fs::is_directory(root_ / "Payload", ec)) {
        throw PipelineError(PipelineErrorCode::INVALID_STRUCTURE,
                            "Invalid IPA structure: Payload directory not found", ctx);
    }

    if (!layout().appBundleDir()) {
        throw PipelineError(PipelineErrorCode::INVALID_STRUCTURE,
                            "Invalid IPA structure: no .app bundle in Payload", ctx);
    }
}

void IpaExtractor::readMetadata(PackageMetadata& meta) const {
    auto plist_path = layout().manifestFile();
    if (!plist_path) {
        common::Logger::instance().debug("[Extractor] Info.plist not found");
        return;
    }

    auto plist = PlistParser::parseFile(*plist_path);
    if (!plist) {
        common::Logger::instance().debug("[Extractor] Info.plist unreadable | path={}", plist_path->string());
        return;
    }

    auto lookup = [&](const char* key) -> std::string {
        auto it = plist->find(key);
        return it != plist->end() ? it->second : std::string();
    };

    meta.package_name = lookup("CFBundleIdentifier");
    meta.version = lookup("CFBundleShortVersionString");
    meta.app_name = lookup("CFBundleDisplayName");
    if (meta.app_name.empty()) {
        meta.app_name = lookup("CFBundleName");
    }
}

}}
