#pragma once

#include "include/fincore/core/datastructures.h"
#include <cstdint>
#include <string>
#include <vector>

// Conversion of host arguments to the native parameter types. Failures throw
// FinanceException with FinanceErrc::MismatchedArgumentType naming the function
// and the parameter.

void require_argument_count(const std::vector<CallValue> &args, size_t expected, const std::string &function_name);

// Accepts a double or an integer.
double real_argument(const CallValue &arg, const std::string &function_name, const std::string &param_name);

// Accepts an integer in [0, 2^32-1] only.
std::uint32_t unsigned_argument(const CallValue &arg, const std::string &function_name, const std::string &param_name);

// "float", "int", "str" or "bool", for error messages.
std::string call_value_type_name(const CallValue &value);
