#pragma once
#include "segment.h"
#include "constraints.h"
#include "target.h"
#include <QJsonArray>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <optional>

// Content is always the normalized part list; bare strings are wrapped into
// a single text segment when the request is decoded.
struct InteractionItem {
    QString role;
    QList<Segment> content;
};

struct SemanticRequest {
    QString requestId;
    TargetSpec target;
    QList<InteractionItem> messages;
    ConstraintSet constraints;
    QJsonArray tools;
    std::optional<QJsonValue> toolChoice;
    bool stream = false;
    QMap<QString, QString> metadata;
};
