#include "include/fincore/module/FinanceModule.h"
#include "include/fincore/module/finance_core.h"
#include "include/fincore/core/FinanceException.h"

FinanceModule::FinanceModule(FormulaPolicy policy)
    : m_name("finance_core"), m_policy(policy)
{
    register_finance_core_functions(m_registry, m_policy);
}

const std::string &FinanceModule::name() const
{
    return m_name;
}

FormulaPolicy FinanceModule::policy() const
{
    return m_policy;
}

bool FinanceModule::has_function(const std::string &function_name) const
{
    return m_registry.contains(function_name);
}

std::vector<std::string> FinanceModule::function_names() const
{
    return m_registry.names();
}

std::unique_ptr<IExecutable> FinanceModule::make_function(const std::string &function_name) const
{
    return m_registry.create(function_name);
}

CallValue FinanceModule::call(const std::string &function_name, const std::vector<CallValue> &args) const
{
    auto logic = make_function(function_name);
    try
    {
        return logic->execute(args);
    }
    catch (const FinanceException &e)
    {
        // Re-throw exception, adding our contextual information.
        throw FinanceException(e.code(), "In function '" + function_name + "': " + e.what());
    }
    catch (const std::exception &e)
    {
        throw FinanceException(FinanceErrc::UnknownError, "In function '" + function_name + "': " + e.what());
    }
}
