#include "debug_middleware.h"
#include "core/log_manager.h"

QString DebugMiddleware::preview(const QString& text, int maxChars) {
    QString flat = text;
    flat.replace(QLatin1Char('\n'), QLatin1Char(' '));
    if (flat.size() <= maxChars)
        return flat;
    return flat.left(maxChars) + QStringLiteral("...");
}

Result<SemanticRequest> DebugMiddleware::onRequest(SemanticRequest request) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Request %1: model=%2, messages=%3, tools=%4, stream=%5")
            .arg(request.requestId, request.target.logicalModel)
            .arg(request.messages.size())
            .arg(request.tools.size())
            .arg(request.stream ? QStringLiteral("true") : QStringLiteral("false")));
        for (int i = 0; i < request.messages.size(); ++i) {
            const InteractionItem& item = request.messages.at(i);
            QString text;
            for (const Segment& seg : item.content) {
                if (seg.kind == SegmentKind::Text)
                    text += seg.text;
            }
            LOG_DEBUG(QStringLiteral("[Debug]   #%1 %2: %3")
                .arg(i).arg(item.role, preview(text)));
        }
    }
    return request;
}

Result<SemanticResponse> DebugMiddleware::onResponse(SemanticResponse response) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Response: id=%1, candidates=%2, tokens=%3")
            .arg(response.responseId)
            .arg(response.candidates.size())
            .arg(response.usage ? response.usage->totalTokens : 0));
    }
    return response;
}

Result<StreamFrame> DebugMiddleware::onFrame(StreamFrame frame) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Frame: type=%1, final=%2, text=%3")
            .arg(static_cast<int>(frame.type))
            .arg(frame.isFinal)
            .arg(preview(frame.text(), 40)));
    }
    return frame;
}
