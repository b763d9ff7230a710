#pragma once

// INTERNAL header: the per-operation registration functions called by
// register_finance_core_functions().

#include "include/fincore/core/datastructures.h"

class FunctionRegistry;

void register_compound_interest_operation(FunctionRegistry &registry, FormulaPolicy policy);
void register_inflation_impact_operation(FunctionRegistry &registry, FormulaPolicy policy);
