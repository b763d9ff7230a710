#include "include/fincore/module/arguments.h"
#include "include/fincore/core/FinanceException.h"
#include <limits>
#include <type_traits>

std::string call_value_type_name(const CallValue &value)
{
    return std::visit(
        [](auto &&v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>)
            {
                return "float";
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return "int";
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                return "str";
            }
            else
            {
                return "bool";
            }
        },
        value);
}

void require_argument_count(const std::vector<CallValue> &args, size_t expected, const std::string &function_name)
{
    if (args.size() != expected)
    {
        throw FinanceException(FinanceErrc::IncorrectArgumentCount,
                               "Function '" + function_name + "' requires " + std::to_string(expected) +
                                   " arguments, but got " + std::to_string(args.size()) + ".");
    }
}

double real_argument(const CallValue &arg, const std::string &function_name, const std::string &param_name)
{
    if (const auto *d = std::get_if<double>(&arg))
    {
        return *d;
    }
    if (const auto *i = std::get_if<std::int64_t>(&arg))
    {
        return static_cast<double>(*i);
    }
    throw FinanceException(FinanceErrc::MismatchedArgumentType,
                           "Argument '" + param_name + "' of '" + function_name + "' must be a number, but got " + call_value_type_name(arg) + ".");
}

std::uint32_t unsigned_argument(const CallValue &arg, const std::string &function_name, const std::string &param_name)
{
    const auto *i = std::get_if<std::int64_t>(&arg);
    if (i == nullptr)
    {
        throw FinanceException(FinanceErrc::MismatchedArgumentType,
                               "Argument '" + param_name + "' of '" + function_name + "' must be an integer, but got " + call_value_type_name(arg) + ".");
    }
    if (*i < 0 || *i > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        throw FinanceException(FinanceErrc::MismatchedArgumentType,
                               "Argument '" + param_name + "' of '" + function_name + "' must fit an unsigned 32-bit integer, but got " + std::to_string(*i) + ".");
    }
    return static_cast<std::uint32_t>(*i);
}
