#pragma once
#include "include/fincore/core/IExecutable.h"

// calculate_compound_interest(principal: float, rate: float, times_per_year: int, years: int) -> float
class CompoundInterestOperation : public IExecutable
{
public:
    explicit CompoundInterestOperation(FormulaPolicy policy);
    CallValue execute(const std::vector<CallValue> &args) const override;

private:
    FormulaPolicy m_policy;
};
