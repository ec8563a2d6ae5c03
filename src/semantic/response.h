#pragma once
#include "segment.h"
#include "types.h"
#include <QList>
#include <QString>
#include <optional>

struct UsageEntry {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
};

struct Candidate {
    int index = 0;
    QString role;
    QList<Segment> output;
    StopCause stopCause = StopCause::Completed;
};

struct SemanticResponse {
    QString responseId;
    QString modelUsed;
    QList<Candidate> candidates;
    std::optional<UsageEntry> usage;
};
