#pragma once
#include <optional>

struct ConstraintSet {
    std::optional<double> temperature;
    std::optional<int> maxTokens;
};
