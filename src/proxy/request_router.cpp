#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    addRoute(QStringLiteral("GET"), {QStringLiteral("/health"), RouteKind::Health});
    addRoute(QStringLiteral("GET"), {QStringLiteral("/models"), RouteKind::Models});
    addRoute(QStringLiteral("GET"), {QStringLiteral("/v1/models"), RouteKind::Models});
    addRoute(QStringLiteral("POST"), {QStringLiteral("/v1/chat/completions"),
                                      RouteKind::ChatCompletions});
    addRoute(QStringLiteral("POST"), {QStringLiteral("/chat/completions"),
                                      RouteKind::ChatCompletions});

    // CORS preflight for any path
    addRoute(QStringLiteral("OPTIONS"), {QStringLiteral("*"), RouteKind::Preflight});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const QString& method, const Route& route)
{
    InternalRoute entry;
    entry.route = route;
    entry.method = method.trimmed().toUpper();

    // Handle wildcard paths: "/some/prefix/*"
    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    QString normalizedPath = stripQuery(path);
    if (normalizedPath.size() > 1 && normalizedPath.endsWith(QLatin1Char('/')))
        normalizedPath.chop(1);

    for (const InternalRoute& entry : m_routes) {
        // Method check: entry.method must match, or "*" matches any method
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod) {
            continue;
        }

        // Path check: wildcard routes use startsWith; exact routes require equality
        if (entry.wildcard) {
            if (normalizedPath.startsWith(entry.pathPrefix)) {
                return entry.route;
            }
        } else {
            if (normalizedPath == entry.pathPrefix) {
                return entry.route;
            }
        }
    }

    return std::nullopt;
}

QString RequestRouter::stripQuery(const QString& path)
{
    const int q = path.indexOf(QLatin1Char('?'));
    return q < 0 ? path : path.left(q);
}
