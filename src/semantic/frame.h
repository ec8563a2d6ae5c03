#pragma once
#include "segment.h"
#include "failure.h"
#include "response.h"
#include "types.h"
#include <QList>
#include <optional>

struct StreamFrame {
    FrameType type = FrameType::Delta;
    QString responseId;
    QString model;
    QList<Segment> deltaSegments;
    StopCause stopCause = StopCause::Completed;
    std::optional<UsageEntry> usage;
    DomainFailure failure;
    bool isFinal = false;

    QString text() const {
        QString out;
        for (const Segment& seg : deltaSegments) {
            if (seg.kind == SegmentKind::Text)
                out += seg.text;
        }
        return out;
    }
};
