#pragma once

#include "package_extractor.hpp"

namespace fluttersec {
namespace extract {

class IpaExtractor : public PackageExtractor {
public:
    using PackageExtractor::PackageExtractor;

    common::Platform platform() const override { return common::Platform::IOS; }
    std::string label() const override { return "ipa"; }

protected:
    // Requires Payload/ and at least one *.app bundle inside it.
    void validateLayout() const override;
    void readMetadata(PackageMetadata& meta) const override;
};

}}
