#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// A dynamically typed argument or return value as a host hands it over.
using CallValue = std::variant<double, std::int64_t, std::string, bool>;

struct BatchResult
{
    std::string function;
    double value;
};

enum class FormulaPolicy
{
    Permissive, // plain formulas, IEEE infinities/NaNs propagate
    Strict      // validated formulas, invalid inputs throw
};
