#pragma once

#include "include/fincore/core/datastructures.h"
#include "include/fincore/core/IExecutable.h"
#include "include/fincore/module/FinanceModule.h"
#include <nlohmann/json.hpp>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// Loads a JSON batch file of 'finance_core' calls and evaluates them.
class BatchEvaluator
{
public:
    explicit BatchEvaluator(const std::string &json_batch_path, bool quiet = false);

    std::vector<BatchResult> run();

    std::string get_output_file_path() const;
    FormulaPolicy get_policy() const;
    size_t num_calls() const;

private:
    struct PlannedCall
    {
        std::string function_name;
        std::shared_ptr<const IExecutable> logic;
        std::vector<CallValue> args;
    };

    void parse_and_build(const std::string &path);
    // Appends the planned calls of one 'calls' entry; a csv_source yields one per row.
    void plan_call(const nlohmann::json &call_json, int call_index);
    void run_batch(size_t begin, size_t end, std::vector<BatchResult> &results, std::exception_ptr &out_exception) const;

    bool m_quiet;
    FormulaPolicy m_policy;
    std::string m_output_file_path;
    std::unique_ptr<FinanceModule> m_module;
    std::vector<PlannedCall> m_calls;
};
