#pragma once

#include "include/fincore/core/datastructures.h"
#include "include/fincore/module/FunctionRegistry.h"
#include <memory>
#include <string>
#include <vector>

// The named module surface a host imports: functions are looked up and called by name.
class FinanceModule
{
public:
    explicit FinanceModule(FormulaPolicy policy = FormulaPolicy::Permissive);

    const std::string &name() const;
    FormulaPolicy policy() const;

    bool has_function(const std::string &function_name) const;
    std::vector<std::string> function_names() const;

    // Builds a fresh operation for the function. Throws UnknownFunction.
    std::unique_ptr<IExecutable> make_function(const std::string &function_name) const;

    CallValue call(const std::string &function_name, const std::vector<CallValue> &args) const;

private:
    std::string m_name;
    FormulaPolicy m_policy;
    FunctionRegistry m_registry;
};
