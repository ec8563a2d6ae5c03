#pragma once
#include "request.h"
#include "ports.h"

namespace Validate {
    VoidResult request(const SemanticRequest& req);
    bool isKnownRole(const QString& role);
}
