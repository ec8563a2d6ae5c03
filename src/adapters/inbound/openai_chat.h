#pragma once
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonValue>
#include <variant>

// Chat-completion message content as sent by clients: a bare string or an
// array of typed parts. Resolved to a part list once, at decode time.
struct PlainText {
    QString text;
};

struct PartList {
    QJsonArray parts;
};

using MessageContent = std::variant<PlainText, PartList>;

class OpenAIChatAdapter : public IInboundAdapter {
public:
    OpenAIChatAdapter() = default;

    QString protocol() const override;
    Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;
    Result<QByteArray> encodeResponse(
        const SemanticResponse& response) override;
    Result<QByteArray> encodeStreamFrame(
        const StreamFrame& frame) override;
    Result<QByteArray> encodeFailure(
        const DomainFailure& failure) override;

    static Result<MessageContent> readContentField(const QJsonValue& content);
    static QList<Segment> toPartList(const MessageContent& content);
    static QString stopCauseToFinishReason(StopCause cause);
    static QString generateChatId();
};
