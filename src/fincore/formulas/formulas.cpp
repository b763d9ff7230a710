#include "include/fincore/formulas/formulas.h"
#include "include/fincore/core/FinanceException.h"
#include <cmath>
#include <string>

double calculate_compound_interest(double principal, double rate, std::uint32_t times_per_year, std::uint32_t years)
{
    const double r = rate / 100.0;
    const double n = static_cast<double>(times_per_year);
    const double t = static_cast<double>(years);
    const double body = 1.0 + (r / n);
    const double exponent = n * t;
    return principal * std::pow(body, exponent);
}

double calculate_inflation_impact(double amount, double inflation_rate, std::uint32_t years)
{
    const double r = inflation_rate / 100.0;
    const double t = static_cast<double>(years);
    const double denominator = std::pow(1.0 + r, t);
    return amount / denominator;
}

static void require_finite(double value, const char *name)
{
    if (!std::isfinite(value))
    {
        throw FinanceException(FinanceErrc::InvalidInput, std::string("Input '") + name + "' must be a finite number.");
    }
}

double checked_compound_interest(double principal, double rate, std::uint32_t times_per_year, std::uint32_t years)
{
    require_finite(principal, "principal");
    require_finite(rate, "rate");
    if (times_per_year == 0)
    {
        throw FinanceException(FinanceErrc::InvalidInput, "Input 'times_per_year' must be at least 1.");
    }
    if (1.0 + (rate / 100.0) / static_cast<double>(times_per_year) <= 0.0)
    {
        throw FinanceException(FinanceErrc::InvalidInput, "Input 'rate' leaves a non-positive growth factor per compounding period.");
    }

    const double result = calculate_compound_interest(principal, rate, times_per_year, years);
    if (!std::isfinite(result))
    {
        throw FinanceException(FinanceErrc::InvalidInput, "Compound interest result overflowed.");
    }
    return result;
}

double checked_inflation_impact(double amount, double inflation_rate, std::uint32_t years)
{
    require_finite(amount, "amount");
    require_finite(inflation_rate, "inflation_rate");
    if (1.0 + inflation_rate / 100.0 <= 0.0)
    {
        throw FinanceException(FinanceErrc::InvalidInput, "Inflation rate must be greater than -100%.");
    }

    const double result = calculate_inflation_impact(amount, inflation_rate, years);
    if (!std::isfinite(result))
    {
        throw FinanceException(FinanceErrc::InvalidInput, "Inflation impact result is not finite.");
    }
    return result;
}
