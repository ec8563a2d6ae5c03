#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return 400;
    case ErrorKind::Unauthorized:  return 401;
    case ErrorKind::Forbidden:     return 403;
    case ErrorKind::RateLimited:   return 429;
    case ErrorKind::BadGateway:    return 502;
    case ErrorKind::Unavailable:   return 503;
    case ErrorKind::Timeout:       return 504;
    case ErrorKind::Internal:
    default:                       return 500;
    }
}

QString DomainFailure::errorType() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return QStringLiteral("invalid_request_error");
    case ErrorKind::Unauthorized:
    case ErrorKind::Forbidden:     return QStringLiteral("authentication_error");
    case ErrorKind::RateLimited:   return QStringLiteral("rate_limit_error");
    case ErrorKind::BadGateway:
    case ErrorKind::Unavailable:
    case ErrorKind::Timeout:       return QStringLiteral("upstream_error");
    case ErrorKind::Internal:
    default:                       return QStringLiteral("proxy_error");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["message"] = message;
    err["type"] = errorType();
    if (!param.isEmpty())
        err["param"] = param;
    err["code"] = code;
    QJsonObject root;
    root["error"] = err;
    return root;
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg,
                                          const QString& param) {
    return {ErrorKind::InvalidInput, code, msg, param};
}

DomainFailure DomainFailure::modelNotAllowed(const QString& model, const QStringList& allowed) {
    return {ErrorKind::InvalidInput, "model_not_allowed",
            QStringLiteral("Model '%1' is not allowed by this proxy. Allowed models: %2")
                .arg(model, allowed.join(QStringLiteral(", "))),
            "model"};
}

DomainFailure DomainFailure::malformedUpstream(const QString& msg) {
    return {ErrorKind::BadGateway, "malformed_upstream", msg, {}};
}

DomainFailure DomainFailure::upstreamFailed(const QString& msg) {
    return {ErrorKind::BadGateway, "upstream_failed", msg, {}};
}

DomainFailure DomainFailure::upstreamAuthRejected(int httpStatus, const QString& msg) {
    const ErrorKind kind = httpStatus == 403 ? ErrorKind::Forbidden : ErrorKind::Unauthorized;
    return {kind, "upstream_auth_rejected", msg, {}};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, {}};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, {}};
}

DomainFailure DomainFailure::rateLimited(const QString& msg) {
    return {ErrorKind::RateLimited, "rate_limited", msg, {}};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal_error", msg, {}};
}
