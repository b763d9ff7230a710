#include "include/fincore/module/InflationImpact.h"
#include "include/fincore/module/finance_core_registration.h"
#include "include/fincore/module/FunctionRegistry.h"
#include "include/fincore/module/arguments.h"
#include "include/fincore/formulas/formulas.h"

void register_inflation_impact_operation(FunctionRegistry &registry, FormulaPolicy policy)
{
    registry.register_function("calculate_inflation_impact", [policy]
                               { return std::make_unique<InflationImpactOperation>(policy); });
}

InflationImpactOperation::InflationImpactOperation(FormulaPolicy policy)
    : m_policy(policy) {}

CallValue InflationImpactOperation::execute(const std::vector<CallValue> &args) const
{
    static const std::string name = "calculate_inflation_impact";
    require_argument_count(args, 3, name);

    const double amount = real_argument(args[0], name, "amount");
    const double inflation_rate = real_argument(args[1], name, "inflation_rate");
    const std::uint32_t years = unsigned_argument(args[2], name, "years");

    if (m_policy == FormulaPolicy::Strict)
    {
        return checked_inflation_impact(amount, inflation_rate, years);
    }
    return calculate_inflation_impact(amount, inflation_rate, years);
}
