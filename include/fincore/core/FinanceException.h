#pragma once

#include "Errors.h"
#include <stdexcept>
#include <string>

class FinanceException : public std::runtime_error
{
public:
    FinanceException(FinanceErrc code, const std::string &message, int call_index = -1)
        : std::runtime_error(format_message(call_index, message)),
          m_code(code),
          m_call_index(call_index)
    {
    }

    FinanceErrc code() const noexcept { return m_code; }
    int call_index() const noexcept { return m_call_index; }

private:
    FinanceErrc m_code;
    int m_call_index;

    static std::string format_message(int call_index, const std::string &message)
    {
        if (call_index >= 0)
        {
            return "Call #" + std::to_string(call_index) + ": " + message;
        }
        return message;
    }
};
