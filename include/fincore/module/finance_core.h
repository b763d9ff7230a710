#pragma once

#include "include/fincore/core/datastructures.h"

// Forward declare the FunctionRegistry to avoid including its full header.
class FunctionRegistry;

// Registers every function of the 'finance_core' module surface.
void register_finance_core_functions(FunctionRegistry &registry, FormulaPolicy policy = FormulaPolicy::Permissive);
