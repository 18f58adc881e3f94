#pragma once

#include "detection_rules.hpp"
#include "../extract/package_layout.hpp"
#include "../common/cancellation.hpp"
#include "../common/types.hpp"
#include <string>
#include <vector>

namespace fluttersec {
namespace detect {

struct ScanContext {
    const extract::PackageLayout& layout;
    const DetectionRules& rules;
    common::CancellationToken cancel;
};

// A stateless pass over an extracted package tree. Implementations must not
// modify the tree and must not depend on other detectors.
class Detector {
public:
    virtual ~Detector() = default;
    virtual std::string name() const = 0;
    virtual std::vector<common::Finding> scan(const ScanContext& ctx) const = 0;

    // Throws core::PipelineError(CANCELLED) once the token is set.
    static void checkCancelled(const ScanContext& ctx);
};

}}
