#include "include/fincore/module/FunctionRegistry.h"
#include "include/fincore/core/FinanceException.h"
#include <algorithm>
#include <stdexcept>

void FunctionRegistry::register_function(const std::string &name, FactoryFunc factory)
{
    if (!factory)
    {
        throw std::runtime_error("Developer error: Function '" + name + "' was registered without a factory.");
    }
    if (!m_factory_map.emplace(name, std::move(factory)).second)
    {
        throw std::runtime_error("Developer error: Function '" + name + "' is already registered.");
    }
}

bool FunctionRegistry::contains(const std::string &name) const
{
    return m_factory_map.find(name) != m_factory_map.end();
}

size_t FunctionRegistry::size() const
{
    return m_factory_map.size();
}

std::unique_ptr<IExecutable> FunctionRegistry::create(const std::string &name) const
{
    auto factory_it = m_factory_map.find(name);
    if (factory_it == m_factory_map.end())
    {
        throw FinanceException(FinanceErrc::UnknownFunction, "Unknown function: " + name);
    }
    return factory_it->second();
}

std::vector<std::string> FunctionRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(m_factory_map.size());
    for (const auto &entry : m_factory_map)
    {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}
