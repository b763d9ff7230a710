#include "include/fincore/module/finance_core.h"
#include "include/fincore/module/finance_core_registration.h"
#include "include/fincore/module/FunctionRegistry.h"

void register_finance_core_functions(FunctionRegistry &registry, FormulaPolicy policy)
{
    register_compound_interest_operation(registry, policy);
    register_inflation_impact_operation(registry, policy);
}
