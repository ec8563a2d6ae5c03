#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

// One content part of a message. Parts the bridge does not interpret keep
// the client's JSON object verbatim in `raw`.
struct Segment {
    SegmentKind kind = SegmentKind::Text;
    QString text;
    QJsonObject raw;

    static Segment fromText(const QString& text) {
        return Segment{SegmentKind::Text, text, {}};
    }
    static Segment fromOpaque(const QJsonObject& part) {
        return Segment{SegmentKind::Opaque, {}, part};
    }
};
