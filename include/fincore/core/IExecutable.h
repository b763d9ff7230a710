#pragma once
#include "datastructures.h"
#include <vector>

class IExecutable
{
public:
    virtual ~IExecutable() = default;
    virtual CallValue execute(const std::vector<CallValue> &args) const = 0;
};
