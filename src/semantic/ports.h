#pragma once
#include "request.h"
#include "response.h"
#include "frame.h"
#include "failure.h"
#include <expected>
#include <functional>
#include <QByteArray>
#include <QIODevice>
#include <QMap>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
};

struct ProviderChunk {
    QString type;
    QByteArray data;
};

class IInboundAdapter {
public:
    virtual ~IInboundAdapter() = default;
    virtual QString protocol() const = 0;
    virtual Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) = 0;
    virtual Result<QByteArray> encodeResponse(
        const SemanticResponse& response) = 0;
    virtual Result<QByteArray> encodeStreamFrame(
        const StreamFrame& frame) = 0;
    virtual Result<QByteArray> encodeFailure(
        const DomainFailure& failure) = 0;
};

class IOutboundAdapter {
public:
    virtual ~IOutboundAdapter() = default;
    virtual QString adapterId() const = 0;
    virtual Result<ProviderRequest> buildRequest(
        const SemanticRequest& request) = 0;
    virtual Result<SemanticResponse> parseResponse(
        const ProviderResponse& response) = 0;
    virtual Result<StreamFrame> parseChunk(
        const ProviderChunk& chunk) = 0;
    virtual DomainFailure mapFailure(int httpStatus, const QByteArray& body) = 0;
};

// The authenticated backend dispatcher. Implementations attach credentials;
// callers only see requests and responses.
class IExecutor {
public:
    using ResponseHandler = std::function<void(Result<ProviderResponse>)>;

    virtual ~IExecutor() = default;

    // Completes asynchronously. Non-2xx statuses are delivered as a
    // ProviderResponse; only transport failures arrive as errors.
    virtual void execute(const ProviderRequest& request, ResponseHandler done) = 0;

    // Returns the live upstream body. HTTP-level failures surface through
    // the stream session once the status line is known.
    virtual Result<QIODevice*> connectStream(const ProviderRequest& request) = 0;
};
