#pragma once
#include "pipeline/middleware.h"
#include <QStringList>

// Resolves the client's model id against the allowlist and records the
// backend base model and reasoning effort on the request.
class ModelRoutingMiddleware : public IPipelineMiddleware {
public:
    explicit ModelRoutingMiddleware(const QStringList& allowlist)
        : m_allowlist(allowlist) {}
    QString name() const override { return "model_routing"; }
    Result<SemanticRequest> onRequest(SemanticRequest request) override;

private:
    QStringList m_allowlist;
};
