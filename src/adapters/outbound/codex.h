#pragma once
#include "semantic/ports.h"
#include <QJsonObject>

// Codex "Responses" backend of the ChatGPT web service.
class CodexOutbound : public IOutboundAdapter {
public:
    CodexOutbound() = default;
    ~CodexOutbound() override = default;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;
    Result<SemanticResponse> parseResponse(const ProviderResponse& response) override;
    Result<StreamFrame> parseChunk(const ProviderChunk& chunk) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;

    // Pure request conversion: instructions, input items, tools and the
    // optional reasoning block.
    static QJsonObject buildBody(const SemanticRequest& request);

    static QString defaultInstructions();
    static QString defaultBackendUrl();

protected:
    Result<SemanticResponse> parseJsonResponse(const QJsonObject& root) const;
    Result<SemanticResponse> parseEventStreamBody(const QByteArray& body);
    static QJsonArray buildInput(const QList<InteractionItem>& items);
    static QString collectItemText(const QJsonObject& item);
    static std::optional<UsageEntry> parseUsage(const QJsonObject& usage);
    static QString backendErrorMessage(const QJsonObject& error, const QString& fallback);
};
