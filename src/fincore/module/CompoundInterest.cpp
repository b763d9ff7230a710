#include "include/fincore/module/CompoundInterest.h"
#include "include/fincore/module/finance_core_registration.h"
#include "include/fincore/module/FunctionRegistry.h"
#include "include/fincore/module/arguments.h"
#include "include/fincore/formulas/formulas.h"

void register_compound_interest_operation(FunctionRegistry &registry, FormulaPolicy policy)
{
    registry.register_function("calculate_compound_interest", [policy]
                               { return std::make_unique<CompoundInterestOperation>(policy); });
}

CompoundInterestOperation::CompoundInterestOperation(FormulaPolicy policy)
    : m_policy(policy) {}

CallValue CompoundInterestOperation::execute(const std::vector<CallValue> &args) const
{
    static const std::string name = "calculate_compound_interest";
    require_argument_count(args, 4, name);

    const double principal = real_argument(args[0], name, "principal");
    const double rate = real_argument(args[1], name, "rate");
    const std::uint32_t times_per_year = unsigned_argument(args[2], name, "times_per_year");
    const std::uint32_t years = unsigned_argument(args[3], name, "years");

    if (m_policy == FormulaPolicy::Strict)
    {
        return checked_compound_interest(principal, rate, times_per_year, years);
    }
    return calculate_compound_interest(principal, rate, times_per_year, years);
}
