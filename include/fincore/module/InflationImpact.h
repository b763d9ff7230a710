#pragma once
#include "include/fincore/core/IExecutable.h"

// calculate_inflation_impact(amount: float, inflation_rate: float, years: int) -> float
class InflationImpactOperation : public IExecutable
{
public:
    explicit InflationImpactOperation(FormulaPolicy policy);
    CallValue execute(const std::vector<CallValue> &args) const override;

private:
    FormulaPolicy m_policy;
};
