#include "codex.h"
#include "semantic/features/sse_parser.h"
#include "semantic/features/stream_aggregator.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QUuid>

namespace {

QString joinText(const QList<Segment>& segments)
{
    QString text;
    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::Text)
            text += seg.text;
    }
    return text;
}

bool looksLikeEventStream(const QByteArray& body)
{
    const QByteArray head = body.trimmed();
    return head.startsWith("event:") || head.startsWith("data:") || head.startsWith(':');
}

} // namespace

QString CodexOutbound::adapterId() const
{
    return QStringLiteral("codex");
}

QString CodexOutbound::defaultInstructions()
{
    return QStringLiteral("You are a helpful AI assistant. Provide clear, accurate, and "
                          "concise responses to user questions and requests.");
}

QString CodexOutbound::defaultBackendUrl()
{
    return QStringLiteral("https://chatgpt.com/backend-api/codex/responses");
}

Result<ProviderRequest> CodexOutbound::buildRequest(const SemanticRequest& request)
{
    if (request.target.resolved.baseModel.isEmpty()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Codex request built before model routing")));
    }

    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = request.metadata.value(QStringLiteral("backend_url"));
    if (pr.url.isEmpty())
        pr.url = defaultBackendUrl();

    // The backend always answers with an event stream.
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");
    pr.headers[QStringLiteral("OpenAI-Beta")] = QStringLiteral("responses=experimental");
    pr.headers[QStringLiteral("originator")] = QStringLiteral("codex_cli_rs");
    pr.headers[QStringLiteral("session_id")] =
        QUuid::createUuid().toString(QUuid::WithoutBraces);

    pr.stream = request.stream;
    pr.body = QJsonDocument(buildBody(request)).toJson(QJsonDocument::Compact);
    return pr;
}

QJsonObject CodexOutbound::buildBody(const SemanticRequest& request)
{
    QList<InteractionItem> items = request.messages;
    QString instructions = defaultInstructions();
    if (!items.isEmpty() && items.first().role == QStringLiteral("system")) {
        instructions = joinText(items.first().content);
        items.removeFirst();
    }

    QJsonObject body;
    body[QStringLiteral("model")] = request.target.resolved.baseModel;
    body[QStringLiteral("instructions")] = instructions;
    body[QStringLiteral("input")] = buildInput(items);
    body[QStringLiteral("tools")] = request.tools;
    if (request.toolChoice.has_value())
        body[QStringLiteral("tool_choice")] = *request.toolChoice;
    else if (!request.tools.isEmpty())
        body[QStringLiteral("tool_choice")] = QStringLiteral("auto");
    body[QStringLiteral("parallel_tool_calls")] = false;
    body[QStringLiteral("store")] = false;
    body[QStringLiteral("stream")] = request.stream;
    body[QStringLiteral("include")] = QJsonArray();

    if (request.target.resolved.effort != ReasoningEffort::None) {
        QJsonObject reasoning;
        reasoning[QStringLiteral("effort")] =
            reasoningEffortName(request.target.resolved.effort);
        body[QStringLiteral("reasoning")] = reasoning;
    }

    return body;
}

QJsonArray CodexOutbound::buildInput(const QList<InteractionItem>& items)
{
    QJsonArray input;
    for (const InteractionItem& item : items) {
        QJsonArray content;
        for (const Segment& seg : item.content) {
            if (seg.kind == SegmentKind::Text) {
                QJsonObject part;
                part[QStringLiteral("type")] = QStringLiteral("input_text");
                part[QStringLiteral("text")] = seg.text;
                content.append(part);
            } else {
                content.append(seg.raw);
            }
        }

        QJsonObject msg;
        msg[QStringLiteral("type")] = QStringLiteral("message");
        msg[QStringLiteral("role")] = item.role;
        msg[QStringLiteral("content")] = content;
        input.append(msg);
    }
    return input;
}

Result<SemanticResponse> CodexOutbound::parseResponse(const ProviderResponse& response)
{
    if (response.statusCode >= 400)
        return std::unexpected(mapFailure(response.statusCode, response.body));

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject())
        return parseJsonResponse(doc.object());

    if (looksLikeEventStream(response.body))
        return parseEventStreamBody(response.body);

    return std::unexpected(DomainFailure::malformedUpstream(
        QStringLiteral("Backend response is neither JSON nor an event stream")));
}

Result<SemanticResponse> CodexOutbound::parseJsonResponse(const QJsonObject& root) const
{
    const QJsonObject resp = root.contains(QStringLiteral("response"))
        ? root.value(QStringLiteral("response")).toObject() : root;

    const QJsonValue reported = root.value(QStringLiteral("error"));
    if (reported.isObject()) {
        return std::unexpected(DomainFailure::upstreamFailed(backendErrorMessage(
            reported.toObject(), QStringLiteral("Backend reported an error"))));
    }

    if (!resp.contains(QStringLiteral("output")) && !resp.contains(QStringLiteral("status"))) {
        return std::unexpected(DomainFailure::malformedUpstream(
            QStringLiteral("Backend JSON response carries no output")));
    }

    const QString status = resp.value(QStringLiteral("status")).toString();
    if (status == QStringLiteral("failed")) {
        return std::unexpected(DomainFailure::upstreamFailed(backendErrorMessage(
            resp.value(QStringLiteral("error")).toObject(),
            QStringLiteral("Backend reported the response as failed"))));
    }

    QString text;
    const QJsonArray output = resp.value(QStringLiteral("output")).toArray();
    for (const QJsonValue& item : output)
        text += collectItemText(item.toObject());

    Candidate candidate;
    candidate.index = 0;
    candidate.role = QStringLiteral("assistant");
    candidate.stopCause = status == QStringLiteral("incomplete")
        ? StopCause::Length : StopCause::Completed;
    candidate.output.append(Segment::fromText(text));

    SemanticResponse sr;
    sr.responseId = resp.value(QStringLiteral("id")).toString();
    sr.modelUsed = resp.value(QStringLiteral("model")).toString();
    sr.usage = parseUsage(resp.value(QStringLiteral("usage")).toObject());
    sr.candidates.append(candidate);
    return sr;
}

Result<SemanticResponse> CodexOutbound::parseEventStreamBody(const QByteArray& body)
{
    SseParser parser;
    QList<SseEvent> events = parser.feed(body);
    events.append(parser.flush());

    StreamAggregator aggregator;
    for (const SseEvent& event : events) {
        if (event.foreign) {
            return std::unexpected(DomainFailure::malformedUpstream(
                QStringLiteral("Backend event stream contains a non-SSE block")));
        }
        if (event.data.isEmpty() || event.data == "[DONE]")
            continue;

        Result<StreamFrame> frame = parseChunk(ProviderChunk{event.type, event.data});
        if (!frame)
            return std::unexpected(frame.error());
        aggregator.addFrame(*frame);
    }
    return aggregator.finalize();
}

Result<StreamFrame> CodexOutbound::parseChunk(const ProviderChunk& chunk)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(chunk.data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::malformedUpstream(
            QStringLiteral("Backend event is not JSON: %1")
                .arg(QString::fromUtf8(chunk.data.left(120)))));
    }

    const QJsonObject root = doc.object();
    QString type = root.value(QStringLiteral("type")).toString();
    if (type.isEmpty())
        type = chunk.type;

    StreamFrame frame;
    const QJsonObject resp = root.value(QStringLiteral("response")).toObject();
    frame.responseId = resp.value(QStringLiteral("id")).toString();
    frame.model = resp.value(QStringLiteral("model")).toString();

    if (type == QStringLiteral("response.created")) {
        frame.type = FrameType::Started;
    } else if (type == QStringLiteral("response.output_text.delta")) {
        frame.type = FrameType::Delta;
        frame.deltaSegments.append(
            Segment::fromText(root.value(QStringLiteral("delta")).toString()));
    } else if (type == QStringLiteral("response.output_item.done")) {
        frame.type = FrameType::ItemCompleted;
        const QString text = collectItemText(root.value(QStringLiteral("item")).toObject());
        if (!text.isEmpty())
            frame.deltaSegments.append(Segment::fromText(text));
    } else if (type == QStringLiteral("response.completed")
               || type == QStringLiteral("response.incomplete")) {
        frame.type = FrameType::Finished;
        frame.isFinal = true;
        frame.stopCause = type == QStringLiteral("response.incomplete")
            ? StopCause::Length : StopCause::Completed;
        frame.usage = parseUsage(resp.value(QStringLiteral("usage")).toObject());
    } else if (type == QStringLiteral("response.failed")) {
        frame.type = FrameType::Failed;
        frame.isFinal = true;
        frame.failure = DomainFailure::upstreamFailed(backendErrorMessage(
            resp.value(QStringLiteral("error")).toObject(),
            QStringLiteral("Backend reported the response as failed")));
    } else if (type == QStringLiteral("error")) {
        frame.type = FrameType::Failed;
        frame.isFinal = true;
        frame.failure = DomainFailure::upstreamFailed(backendErrorMessage(
            root.contains(QStringLiteral("error"))
                ? root.value(QStringLiteral("error")).toObject() : root,
            QStringLiteral("Backend sent an error event")));
    } else {
        frame.type = FrameType::Ignored;
    }

    return frame;
}

DomainFailure CodexOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    QString message;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject root = doc.object();
        message = backendErrorMessage(root.value(QStringLiteral("error")).toObject(), QString());
        if (message.isEmpty())
            message = root.value(QStringLiteral("detail")).toString();
    }
    if (message.isEmpty())
        message = QStringLiteral("Codex backend error (HTTP %1)").arg(httpStatus);

    // Challenge pages come back as 403 too; only a non-HTML 401/403 is an
    // auth rejection.
    if (body.trimmed().startsWith('<')) {
        return DomainFailure::malformedUpstream(
            QStringLiteral("Backend returned an HTML page (HTTP %1)").arg(httpStatus));
    }

    if (httpStatus == 401 || httpStatus == 403)
        return DomainFailure::upstreamAuthRejected(httpStatus, message);

    switch (httpStatus) {
    case 429: return DomainFailure::rateLimited(message);
    case 504: return DomainFailure::timeout(message);
    default:
        break;
    }
    if (httpStatus >= 500)
        return DomainFailure::unavailable(message);

    return DomainFailure::invalidInput(
        QStringLiteral("codex.http_%1").arg(httpStatus), message);
}

// ---------------------------------------------------------------------------
// Protected helpers
// ---------------------------------------------------------------------------

QString CodexOutbound::collectItemText(const QJsonObject& item)
{
    if (item.value(QStringLiteral("type")).toString() != QStringLiteral("message"))
        return QString();

    QString text;
    const QJsonArray content = item.value(QStringLiteral("content")).toArray();
    for (const QJsonValue& pv : content) {
        const QJsonObject part = pv.toObject();
        const QString type = part.value(QStringLiteral("type")).toString();
        if (type == QStringLiteral("output_text") || type == QStringLiteral("text"))
            text += part.value(QStringLiteral("text")).toString();
    }
    return text;
}

std::optional<UsageEntry> CodexOutbound::parseUsage(const QJsonObject& usage)
{
    if (usage.isEmpty())
        return std::nullopt;

    UsageEntry entry;
    entry.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
    entry.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
    entry.totalTokens = usage.contains(QStringLiteral("total_tokens"))
        ? usage.value(QStringLiteral("total_tokens")).toInt()
        : entry.promptTokens + entry.completionTokens;
    return entry;
}

QString CodexOutbound::backendErrorMessage(const QJsonObject& error, const QString& fallback)
{
    const QString message = error.value(QStringLiteral("message")).toString();
    if (message.isEmpty())
        return fallback;
    const QString code = error.value(QStringLiteral("code")).toString();
    return code.isEmpty() ? message : QStringLiteral("%1 (%2)").arg(message, code);
}
