#pragma once
#include "types.h"
#include <QString>

struct ModelSpec {
    QString baseModel;
    ReasoningEffort effort = ReasoningEffort::None;

    bool operator==(const ModelSpec&) const = default;
};

struct TargetSpec {
    QString logicalModel;   // as requested by the client, suffix included
    ModelSpec resolved;     // filled in by model routing
};

inline QString reasoningEffortName(ReasoningEffort effort)
{
    switch (effort) {
    case ReasoningEffort::Low:    return QStringLiteral("low");
    case ReasoningEffort::Medium: return QStringLiteral("medium");
    case ReasoningEffort::High:   return QStringLiteral("high");
    case ReasoningEffort::XHigh:  return QStringLiteral("xhigh");
    case ReasoningEffort::None:   break;
    }
    return QString();
}
