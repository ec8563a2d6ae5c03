#include "model_routing_middleware.h"
#include "routing/model_router.h"
#include "core/log_manager.h"

Result<SemanticRequest> ModelRoutingMiddleware::onRequest(SemanticRequest request) {
    auto spec = model_router::resolve(request.target.logicalModel, m_allowlist);
    if (!spec) {
        LOG_WARNING(QStringLiteral("Rejected model '%1'").arg(request.target.logicalModel));
        return std::unexpected(spec.error());
    }

    request.target.resolved = *spec;
    LOG_DEBUG(QStringLiteral("Model %1 -> base=%2 effort=%3")
        .arg(request.target.logicalModel, spec->baseModel,
             spec->effort == ReasoningEffort::None
                 ? QStringLiteral("none") : reasoningEffortName(spec->effort)));
    return request;
}
