#include "fluttersec/detect/detector.hpp"
#include "fluttersec/core/error_codes.hpp"

namespace fluttersec {
namespace detect {

void Detector::checkCancelled(const ScanContext& ctx) {
    if (ctx.cancel.isCancelled()) {
        common::ErrorContext err;
        err.component = "Detector";
        throw core::PipelineError(core::PipelineErrorCode::CANCELLED, "", err);
    }
}

}}
