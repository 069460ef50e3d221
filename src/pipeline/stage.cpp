// =============================================================================
// refdb - Pipeline Stage Implementation
// =============================================================================

#include "refdb/pipeline/stage.h"

#include "refdb/common/logger.h"

namespace refdb::pipeline {

VoidResult PassThroughStage::run(RunContext& /*context*/) {
    REFDB_LOG_INFO("Stage {} has no local implementation, passing through", name_);
    return makeVoidSuccess();
}

}  // namespace refdb::pipeline
