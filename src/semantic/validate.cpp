#include "validate.h"

namespace Validate {

VoidResult request(const SemanticRequest& req) {
    if (req.target.logicalModel.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            "empty_model", "Request must name a model", "model"));
    if (req.messages.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            "empty_messages", "Request must contain at least one message", "messages"));
    for (const InteractionItem& item : req.messages) {
        if (!isKnownRole(item.role))
            return std::unexpected(DomainFailure::invalidInput(
                "invalid_role",
                QStringLiteral("Unsupported message role '%1'").arg(item.role),
                "messages"));
    }
    return {};
}

bool isKnownRole(const QString& role) {
    return role == QLatin1String("system")
        || role == QLatin1String("user")
        || role == QLatin1String("assistant")
        || role == QLatin1String("tool");
}

}
