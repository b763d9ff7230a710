#pragma once

#include "include/fincore/core/IExecutable.h"
#include <string>
#include <unordered_map>
#include <functional>
#include <memory>
#include <vector>

// Maps the function names of a module surface to factories of their operations.
class FunctionRegistry
{
public:
    using FactoryFunc = std::function<std::unique_ptr<IExecutable>()>;

    // Registering a name twice is a developer error (std::runtime_error).
    void register_function(const std::string &name, FactoryFunc factory);

    bool contains(const std::string &name) const;
    size_t size() const;

    // Builds a fresh operation. Throws FinanceException(UnknownFunction).
    std::unique_ptr<IExecutable> create(const std::string &name) const;

    // Registered names, sorted.
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, FactoryFunc> m_factory_map;
};
