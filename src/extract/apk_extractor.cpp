#include "fluttersec/extract/apk_extractor.hpp"
#include "fluttersec/extract/manifest_parser.hpp"
#include "fluttersec/common/logger.hpp"

namespace fluttersec {
namespace extract {

void ApkExtractor::readMetadata(PackageMetadata& meta) const {
    auto manifest_path = layout().manifestFile();
    if (!manifest_path) {
        common::Logger::instance().debug("[Extractor] AndroidManifest.xml not found");
        return;
    }

    auto info = ManifestParser::parseFile(*manifest_path);
    if (!info) {
        common::Logger::instance().debug("[Extractor] AndroidManifest.xml unreadable | path={}",
                                        manifest_path->string());
        return;
    }

    meta.package_name = info->package_name;
    meta.version = info->version_name;
    if (info->label) {
        meta.app_name = *info->label;
    }
}

}}
