#include "model_router.h"

#include <QJsonArray>

namespace model_router {

namespace {

struct SuffixRule {
    const char* suffix;
    ReasoningEffort effort;
};

// Longest match first; the extra forms are aliases of xhigh.
const SuffixRule kSuffixes[] = {
    {"-extra-high", ReasoningEffort::XHigh},
    {"-extra_high", ReasoningEffort::XHigh},
    {"-xhigh",      ReasoningEffort::XHigh},
    {"-high",       ReasoningEffort::High},
    {"-medium",     ReasoningEffort::Medium},
    {"-low",        ReasoningEffort::Low},
};

constexpr ReasoningEffort kAdvertised[] = {
    ReasoningEffort::Low,
    ReasoningEffort::Medium,
    ReasoningEffort::High,
    ReasoningEffort::XHigh,
};

} // namespace

Result<ModelSpec> resolve(const QString& requested, const QStringList& allowlist)
{
    for (const SuffixRule& rule : kSuffixes) {
        const QLatin1StringView suffix(rule.suffix);
        if (!requested.endsWith(suffix))
            continue;
        const QString base = requested.chopped(suffix.size());
        if (!base.isEmpty() && allowlist.contains(base))
            return ModelSpec{base, rule.effort};
    }

    if (allowlist.contains(requested))
        return ModelSpec{requested, ReasoningEffort::None};

    return std::unexpected(DomainFailure::modelNotAllowed(requested, allowlist));
}

QStringList listAvailable(const QStringList& allowlist)
{
    QStringList ids;
    ids.reserve(allowlist.size() * 5);
    for (const QString& base : allowlist) {
        ids.append(base);
        for (ReasoningEffort effort : kAdvertised)
            ids.append(base + QLatin1Char('-') + reasoningEffortName(effort));
    }
    return ids;
}

QJsonObject buildModelList(const QStringList& allowlist, qint64 created)
{
    QJsonArray data;
    for (const QString& id : listAvailable(allowlist)) {
        QJsonObject model;
        model[QStringLiteral("id")] = id;
        model[QStringLiteral("object")] = QStringLiteral("model");
        model[QStringLiteral("created")] = created;
        model[QStringLiteral("owned_by")] = QStringLiteral("openai");
        data.append(model);
    }

    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    root[QStringLiteral("data")] = data;
    return root;
}

} // namespace model_router
