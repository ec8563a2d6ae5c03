#include "adapters/inbound/openai_chat.h"
#include "semantic/validate.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

namespace {

QJsonObject usageToJson(const UsageEntry& usage)
{
    QJsonObject obj;
    obj[QStringLiteral("prompt_tokens")] = usage.promptTokens;
    obj[QStringLiteral("completion_tokens")] = usage.completionTokens;
    obj[QStringLiteral("total_tokens")] = usage.totalTokens;
    return obj;
}

QString joinText(const QList<Segment>& segments)
{
    QString text;
    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::Text)
            text += seg.text;
    }
    return text;
}

} // namespace

QString OpenAIChatAdapter::protocol() const
{
    return QStringLiteral("openai");
}

QString OpenAIChatAdapter::generateChatId()
{
    return QStringLiteral("chatcmpl-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString OpenAIChatAdapter::stopCauseToFinishReason(StopCause cause)
{
    switch (cause) {
    case StopCause::Completed: return QStringLiteral("stop");
    case StopCause::Length:    return QStringLiteral("length");
    }
    return QStringLiteral("stop");
}

Result<MessageContent> OpenAIChatAdapter::readContentField(const QJsonValue& content)
{
    if (content.isString())
        return PlainText{content.toString()};
    if (content.isArray())
        return PartList{content.toArray()};
    // Assistant turns that only carried tool calls send null content.
    if (content.isNull() || content.isUndefined())
        return PlainText{};
    return std::unexpected(DomainFailure::invalidInput(
        QStringLiteral("invalid_content"),
        QStringLiteral("Message content must be a string or an array of parts"),
        QStringLiteral("messages")));
}

QList<Segment> OpenAIChatAdapter::toPartList(const MessageContent& content)
{
    QList<Segment> segments;
    if (const PlainText* plain = std::get_if<PlainText>(&content)) {
        segments.append(Segment::fromText(plain->text));
        return segments;
    }

    const QJsonArray& parts = std::get<PartList>(content).parts;
    for (const QJsonValue& pv : parts) {
        if (pv.isString()) {
            segments.append(Segment::fromText(pv.toString()));
            continue;
        }
        const QJsonObject p = pv.toObject();
        if (p[QStringLiteral("type")].toString() == QStringLiteral("text"))
            segments.append(Segment::fromText(p[QStringLiteral("text")].toString()));
        else
            segments.append(Segment::fromOpaque(p));
    }
    return segments;
}

Result<SemanticRequest> OpenAIChatAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("Request body is not valid JSON: %1").arg(parseErr.errorString())));
    }

    const QJsonObject root = doc.object();
    SemanticRequest req;
    req.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);

    const QJsonValue model = root[QStringLiteral("model")];
    if (!model.isString()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("empty_model"), QStringLiteral("'model' must be a string"),
            QStringLiteral("model")));
    }
    req.target.logicalModel = model.toString();

    // Parse messages
    const QJsonValue msgsVal = root[QStringLiteral("messages")];
    if (!msgsVal.isArray()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("empty_messages"), QStringLiteral("'messages' must be an array"),
            QStringLiteral("messages")));
    }
    for (const QJsonValue& mv : msgsVal.toArray()) {
        if (!mv.isObject()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_message"),
                QStringLiteral("Each message must be an object"),
                QStringLiteral("messages")));
        }
        const QJsonObject m = mv.toObject();
        auto content = readContentField(m[QStringLiteral("content")]);
        if (!content)
            return std::unexpected(content.error());

        InteractionItem item;
        item.role = m[QStringLiteral("role")].toString();
        item.content = toPartList(*content);
        req.messages.append(item);
    }

    // Sampling parameters are type-checked only; the backend does not take them.
    if (root.contains(QStringLiteral("temperature"))) {
        const QJsonValue t = root[QStringLiteral("temperature")];
        if (!t.isDouble() && !t.isNull()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_temperature"),
                QStringLiteral("'temperature' must be a number"),
                QStringLiteral("temperature")));
        }
        if (t.isDouble())
            req.constraints.temperature = t.toDouble();
    }
    if (root.contains(QStringLiteral("max_tokens"))) {
        const QJsonValue mt = root[QStringLiteral("max_tokens")];
        if (!mt.isDouble() && !mt.isNull()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_max_tokens"),
                QStringLiteral("'max_tokens' must be an integer"),
                QStringLiteral("max_tokens")));
        }
        if (mt.isDouble())
            req.constraints.maxTokens = mt.toInt();
    }

    // Tools pass through untouched
    if (root.contains(QStringLiteral("tools"))) {
        const QJsonValue tools = root[QStringLiteral("tools")];
        if (!tools.isArray() && !tools.isNull()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_tools"),
                QStringLiteral("'tools' must be an array"),
                QStringLiteral("tools")));
        }
        req.tools = tools.toArray();
    }
    if (root.contains(QStringLiteral("tool_choice"))
        && !root[QStringLiteral("tool_choice")].isNull()) {
        req.toolChoice = root[QStringLiteral("tool_choice")];
    }

    // Stream flag
    if (root.contains(QStringLiteral("stream"))) {
        const QJsonValue s = root[QStringLiteral("stream")];
        if (!s.isBool() && !s.isNull()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_stream"),
                QStringLiteral("'stream' must be a boolean"),
                QStringLiteral("stream")));
        }
        req.stream = s.toBool();
    }

    // Copy incoming metadata
    for (auto it = metadata.constBegin(); it != metadata.constEnd(); ++it)
        req.metadata[it.key()] = it.value();

    if (auto valid = Validate::request(req); !valid)
        return std::unexpected(valid.error());

    return req;
}

Result<QByteArray> OpenAIChatAdapter::encodeResponse(const SemanticResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? generateChatId() : response.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion");
    root[QStringLiteral("created")] = static_cast<qint64>(QDateTime::currentSecsSinceEpoch());
    root[QStringLiteral("model")] = response.modelUsed;

    QJsonArray choices;
    for (const Candidate& cand : response.candidates) {
        QJsonObject choice;
        choice[QStringLiteral("index")] = cand.index;

        QJsonObject message;
        message[QStringLiteral("role")] = QStringLiteral("assistant");
        message[QStringLiteral("content")] = joinText(cand.output);

        choice[QStringLiteral("message")] = message;
        choice[QStringLiteral("finish_reason")] = stopCauseToFinishReason(cand.stopCause);
        choices.append(choice);
    }
    root[QStringLiteral("choices")] = choices;

    if (response.usage)
        root[QStringLiteral("usage")] = usageToJson(*response.usage);

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Result<QByteArray> OpenAIChatAdapter::encodeStreamFrame(const StreamFrame& frame)
{
    QJsonObject root;
    root[QStringLiteral("id")] = frame.responseId.isEmpty()
        ? generateChatId() : frame.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
    root[QStringLiteral("created")] = static_cast<qint64>(QDateTime::currentSecsSinceEpoch());
    root[QStringLiteral("model")] = frame.model;

    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;

    switch (frame.type) {
    case FrameType::Started: {
        QJsonObject delta;
        delta[QStringLiteral("role")] = QStringLiteral("assistant");
        delta[QStringLiteral("content")] = QStringLiteral("");
        choice[QStringLiteral("delta")] = delta;
        choice[QStringLiteral("finish_reason")] = QJsonValue::Null;
        break;
    }
    case FrameType::Delta: {
        QJsonObject delta;
        delta[QStringLiteral("content")] = frame.text();
        choice[QStringLiteral("delta")] = delta;
        choice[QStringLiteral("finish_reason")] = QJsonValue::Null;
        break;
    }
    case FrameType::Finished: {
        choice[QStringLiteral("delta")] = QJsonObject();
        choice[QStringLiteral("finish_reason")] = stopCauseToFinishReason(frame.stopCause);
        if (frame.usage)
            root[QStringLiteral("usage")] = usageToJson(*frame.usage);
        break;
    }
    case FrameType::Failed: {
        QJsonObject delta;
        delta[QStringLiteral("content")] =
            QStringLiteral("[error] %1").arg(frame.failure.message);
        choice[QStringLiteral("delta")] = delta;
        choice[QStringLiteral("finish_reason")] = QStringLiteral("stop");
        root[QStringLiteral("error")] = frame.failure.toJson()[QStringLiteral("error")];
        break;
    }
    case FrameType::ItemCompleted:
    case FrameType::Ignored:
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Frame type has no chat-completion chunk form")));
    }

    QJsonArray choices;
    choices.append(choice);
    root[QStringLiteral("choices")] = choices;

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Result<QByteArray> OpenAIChatAdapter::encodeFailure(const DomainFailure& failure)
{
    return QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact);
}
