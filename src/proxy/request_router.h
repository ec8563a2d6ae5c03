#pragma once
#include <QString>
#include <QList>
#include <optional>

enum class RouteKind {
    Health,
    Models,
    ChatCompletions,
    Preflight
};

struct Route {
    QString pathPattern;
    RouteKind kind = RouteKind::Health;
};

class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const QString& method, const Route& route);
    std::optional<Route> match(const QString& method, const QString& path) const;

    static QString stripQuery(const QString& path);

private:
    struct InternalRoute {
        QString method = QStringLiteral("POST"); // HTTP method ("POST", "GET", or "*" for any)
        QString pathPrefix;  // URL path prefix for matching
        bool wildcard = false; // true if pathPattern ends with "*"
        Route route;
    };
    QList<InternalRoute> m_routes;
};
