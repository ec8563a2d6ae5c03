#pragma once
#include "semantic/ports.h"
#include "config/config_types.h"
#include "config/credential_store.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>

class QtExecutor : public IExecutor {
public:
    QtExecutor(const BackendCredentials& credentials, const BackendOptions& options);
    ~QtExecutor() override;

    void execute(const ProviderRequest& request, ResponseHandler done) override;
    Result<QIODevice*> connectStream(const ProviderRequest& request) override;

private:
    QNetworkAccessManager m_nam;
    BackendCredentials m_credentials;
    BackendOptions m_options;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(const ProviderRequest& request);
    std::optional<DomainFailure> checkConnectionError(QNetworkReply* reply) const;
};
