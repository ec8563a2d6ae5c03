#include <QCoreApplication>
#include <QCommandLineParser>
#include <QProcessEnvironment>

#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/codex.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/translator.h"
#include "pipeline/middlewares/model_routing_middleware.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "proxy/proxy_server.h"
#include "routing/model_router.h"
#include "config/config_store.h"
#include "config/credential_store.h"
#include "core/log_manager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("codex-bridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Serves the chat-completions API on top of the ChatGPT Codex backend."));
    parser.addHelpOption();
    parser.addVersionOption();
    ConfigStore::addCommandLineOptions(parser);
    parser.process(app);

    // --- 2. Config: defaults < file < environment < flags ---
    ConfigStore configStore;
    if (parser.isSet(QStringLiteral("config"))) {
        if (auto loaded = configStore.loadFile(parser.value(QStringLiteral("config"))); !loaded) {
            LOG_ERROR(loaded.error().message);
            return 1;
        }
    }
    if (auto env = configStore.applyEnvironment(QProcessEnvironment::systemEnvironment()); !env) {
        LOG_ERROR(env.error().message);
        return 1;
    }
    if (auto flags = configStore.applyCommandLine(parser); !flags) {
        LOG_ERROR(flags.error().message);
        return 1;
    }
    const BridgeConfig config = configStore.finalize();

    // --- 3. Log ---
    LogManager::instance().setMinimumLevel(
        config.runtime.debugMode ? LogManager::Debug : LogManager::Info);
    if (!LogManager::instance().initialize(config.runtime.logDir)) {
        LOG_WARNING(QStringLiteral("Continuing with stderr logging only"));
    }
    LOG_INFO(QStringLiteral("codex-bridge v%1 starting").arg(app.applicationVersion()));

    // --- 4. Credentials ---
    auto credentials = CredentialStore::load(config.runtime.authPath);
    if (!credentials) {
        LOG_ERROR(credentials.error().message);
        LOG_ERROR(QStringLiteral("Run 'codex login' first or pass --auth-path"));
        return 1;
    }
    if (credentials->usesAccessToken()) {
        LOG_DEBUG(QStringLiteral("Access token %1, account %2")
                      .arg(CredentialStore::redact(credentials->accessToken),
                           credentials->accountId));
    }

    // --- 5. Executor + adapters ---
    QtExecutor executor(*credentials, config.backend);
    OpenAIChatAdapter inbound;
    CodexOutbound outbound;

    // --- 6. Translator ---
    Translator translator(&inbound, &outbound, &executor);
    translator.addMiddleware(std::make_unique<ModelRoutingMiddleware>(
        config.allowedModels));
    translator.addMiddleware(std::make_unique<DebugMiddleware>(
        config.runtime.debugMode));

    // --- 7. Proxy server ---
    ProxyServer server(config, &translator);
    if (!server.start()) {
        return 1;
    }

    LOG_INFO(QStringLiteral("Backend: %1").arg(config.backend.url));
    LOG_INFO(QStringLiteral("Allowed models: %1").arg(config.allowedModels.join(QStringLiteral(", "))));
    LOG_INFO(QStringLiteral("Advertised model ids: %1")
                 .arg(model_router::listAvailable(config.allowedModels).size()));
    LOG_INFO(QStringLiteral("Endpoints: GET /health, GET /v1/models, POST /v1/chat/completions"));

    return app.exec();
}
