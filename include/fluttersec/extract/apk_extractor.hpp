#pragma once

#include "package_extractor.hpp"

namespace fluttersec {
namespace extract {

class ApkExtractor : public PackageExtractor {
public:
    using PackageExtractor::PackageExtractor;

    common::Platform platform() const override { return common::Platform::ANDROID; }
    std::string label() const override { return "apk"; }

protected:
    void readMetadata(PackageMetadata& meta) const override;
};

}}
