#pragma once

#include "semantic/ports.h"
#include "semantic/target.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace model_router {

// Splits a client model id into an allowlisted base model and an optional
// reasoning-effort suffix. A suffix is only stripped when what remains is
// allowlisted, so base names that merely end like a suffix stay intact.
Result<ModelSpec> resolve(const QString& requested, const QStringList& allowlist);

// base, base-low, base-medium, base-high, base-xhigh for every base model in
// configured order. Alias suffixes are accepted but never advertised.
QStringList listAvailable(const QStringList& allowlist);

// {object: "list", data: [{id, object: "model", created, owned_by}]}
QJsonObject buildModelList(const QStringList& allowlist, qint64 created);

} // namespace model_router
