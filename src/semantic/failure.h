#pragma once
#include "types.h"
#include <QString>
#include <QStringList>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    QString     param;

    int httpStatus() const;
    QString errorType() const;
    QJsonObject toJson() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg,
                                      const QString& param = QString());
    static DomainFailure modelNotAllowed(const QString& model, const QStringList& allowed);
    static DomainFailure malformedUpstream(const QString& msg);
    static DomainFailure upstreamFailed(const QString& msg);
    static DomainFailure upstreamAuthRejected(int httpStatus, const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure rateLimited(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
