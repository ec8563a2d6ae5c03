#pragma once
#include "semantic/response.h"
#include "semantic/frame.h"
#include "semantic/failure.h"
#include "semantic/ports.h"
#include <QList>

// Folds decoded backend frames into one response. Used when a
// single-shot request is answered with a complete event stream.
class StreamAggregator {
public:
    // Convenience: aggregate a complete list of frames in one call
    Result<SemanticResponse> aggregate(const QList<StreamFrame>& frames);

    // Incremental API
    void addFrame(const StreamFrame& frame);
    Result<SemanticResponse> finalize();
    void reset();

private:
    QString m_responseId;
    QString m_modelUsed;
    QString m_deltaText;
    QString m_itemText;
    bool m_sawFrame = false;
    StopCause m_stopCause = StopCause::Completed;
    std::optional<UsageEntry> m_usage;
    DomainFailure m_lastFailure;
    bool m_hasFailed = false;
};
