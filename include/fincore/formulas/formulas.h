#pragma once

#include <cstdint>

// --- Plain Formulas ---
// Rates are percentages (5.0 means 5%). Nothing is validated: invalid inputs
// propagate as IEEE-754 infinities or NaNs.

// principal * (1 + r/n)^(n*t)
double calculate_compound_interest(double principal, double rate, std::uint32_t times_per_year, std::uint32_t years);

// amount / (1 + r)^t
double calculate_inflation_impact(double amount, double inflation_rate, std::uint32_t years);

// --- Validated Formulas ---
// Same formulas. Throw FinanceException(FinanceErrc::InvalidInput) for non-finite
// inputs, zero compounding periods, a non-positive base or a non-finite result.
double checked_compound_interest(double principal, double rate, std::uint32_t times_per_year, std::uint32_t years);
double checked_inflation_impact(double amount, double inflation_rate, std::uint32_t years);
