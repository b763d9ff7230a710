#include "include/fincore/batch/BatchEvaluator.h"
#include "include/fincore/core/FinanceException.h"
#include "include/fincore/io/io.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <thread>

using json = nlohmann::json;

BatchEvaluator::BatchEvaluator(const std::string &json_batch_path, bool quiet)
    : m_quiet(quiet), m_policy(FormulaPolicy::Permissive)
{
    parse_and_build(json_batch_path);
}

std::string BatchEvaluator::get_output_file_path() const
{
    return m_output_file_path;
}

FormulaPolicy BatchEvaluator::get_policy() const
{
    return m_policy;
}

size_t BatchEvaluator::num_calls() const
{
    return m_calls.size();
}

static CallValue call_value_from_json(const json &value_json, int call_index)
{
    if (value_json.is_number_integer())
    {
        return value_json.get<std::int64_t>();
    }
    if (value_json.is_number())
    {
        return value_json.get<double>();
    }
    if (value_json.is_boolean())
    {
        return value_json.get<bool>();
    }
    if (value_json.is_string())
    {
        return value_json.get<std::string>();
    }
    throw FinanceException(FinanceErrc::BatchConfigError, "Invalid argument type in 'args': " + value_json.dump(), call_index);
}

void BatchEvaluator::parse_and_build(const std::string &path)
{
    std::ifstream file_stream(path);
    if (!file_stream.is_open())
    {
        throw FinanceException(FinanceErrc::BatchFileNotFound, "Failed to open batch file: " + path);
    }
    json batch_json;
    try
    {
        batch_json = json::parse(file_stream);
    }
    catch (const json::parse_error &e)
    {
        throw FinanceException(FinanceErrc::BatchParseError, "Failed to parse JSON batch file: " + std::string(e.what()));
    }

    try
    {
        if (batch_json.contains("batch_config"))
        {
            const auto &config = batch_json.at("batch_config");
            if (config.value("strict_validation", false))
            {
                m_policy = FormulaPolicy::Strict;
            }
            if (config.contains("output_file"))
            {
                if (!config.at("output_file").is_string())
                {
                    throw FinanceException(FinanceErrc::BatchConfigError, "'output_file' must be a string.");
                }
                m_output_file_path = config.at("output_file").get<std::string>();
            }
        }
        m_module = std::make_unique<FinanceModule>(m_policy);

        const auto &calls_json = batch_json.at("calls");
        if (!calls_json.is_array())
        {
            throw FinanceException(FinanceErrc::BatchConfigError, "'calls' must be an array.");
        }

        int call_index = 0;
        for (const auto &call_json : calls_json)
        {
            try
            {
                plan_call(call_json, call_index);
            }
            catch (const FinanceException &e)
            {
                if (e.call_index() >= 0)
                {
                    throw;
                }
                throw FinanceException(e.code(), e.what(), call_index);
            }
            catch (const json::out_of_range &e)
            {
                throw FinanceException(FinanceErrc::BatchConfigError, "Missing required key in call: " + std::string(e.what()), call_index);
            }
            catch (const json::type_error &e)
            {
                throw FinanceException(FinanceErrc::BatchConfigError, "Incorrect type for key in call: " + std::string(e.what()), call_index);
            }
            ++call_index;
        }
    }
    catch (const json::out_of_range &e)
    {
        throw FinanceException(FinanceErrc::BatchConfigError, "Missing required key in batch file: " + std::string(e.what()));
    }
    catch (const json::type_error &e)
    {
        throw FinanceException(FinanceErrc::BatchConfigError, "Incorrect type for key in batch file: " + std::string(e.what()));
    }

    if (!m_quiet)
    {
        std::cout << "Loaded " << m_calls.size() << " calls from " << path << "." << std::endl;
    }
}

void BatchEvaluator::plan_call(const json &call_json, int call_index)
{
    const std::string function_name = call_json.at("function");
    std::shared_ptr<const IExecutable> logic = m_module->make_function(function_name);

    const bool has_args = call_json.contains("args");
    const bool has_csv = call_json.contains("csv_source");
    if (has_args == has_csv)
    {
        throw FinanceException(FinanceErrc::BatchConfigError, "Call to '" + function_name + "' needs exactly one of 'args' or 'csv_source'.");
    }

    if (has_args)
    {
        const auto &args_json = call_json.at("args");
        if (!args_json.is_array())
        {
            throw FinanceException(FinanceErrc::BatchConfigError, "'args' of call to '" + function_name + "' must be an array.");
        }
        PlannedCall planned{function_name, logic, {}};
        for (const auto &arg_json : args_json)
        {
            planned.args.push_back(call_value_from_json(arg_json, call_index));
        }
        m_calls.push_back(std::move(planned));
    }
    else
    {
        const auto &source = call_json.at("csv_source");
        const std::string csv_path = source.at("path");
        const auto columns = source.at("columns").get<std::vector<std::string>>();
        for (auto &row_args : read_csv_arguments(csv_path, columns))
        {
            m_calls.push_back(PlannedCall{function_name, logic, std::move(row_args)});
        }
    }
}

void BatchEvaluator::run_batch(size_t begin, size_t end, std::vector<BatchResult> &results, std::exception_ptr &out_exception) const
{
    try
    {
        for (size_t i = begin; i < end; ++i)
        {
            const auto &call = m_calls[i];
            try
            {
                const CallValue value = call.logic->execute(call.args);
                results[i] = BatchResult{call.function_name, std::get<double>(value)};
            }
            catch (const FinanceException &e)
            {
                throw FinanceException(e.code(), "In function '" + call.function_name + "': " + e.what(), static_cast<int>(i));
            }
            catch (const std::exception &e)
            {
                throw FinanceException(FinanceErrc::UnknownError, "In function '" + call.function_name + "': " + e.what(), static_cast<int>(i));
            }
        }
    }
    catch (...)
    {
        out_exception = std::current_exception();
    }
}

std::vector<BatchResult> BatchEvaluator::run()
{
    if (!m_quiet)
    {
        std::cout << "\n--- Evaluating " << m_calls.size() << " calls ---" << std::endl;
    }

    const size_t num_threads = std::max<size_t>(1, std::min<size_t>(std::thread::hardware_concurrency(), m_calls.size()));
    const size_t calls_per_thread = m_calls.size() / num_threads;
    const size_t remainder_calls = m_calls.size() % num_threads;

    std::vector<BatchResult> results(m_calls.size());
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> thread_exceptions(num_threads, nullptr);

    size_t begin = 0;
    for (size_t i = 0; i < num_threads; ++i)
    {
        const size_t calls_for_this_thread = calls_per_thread + (i == 0 ? remainder_calls : 0);
        if (calls_for_this_thread > 0)
        {
            threads.emplace_back(&BatchEvaluator::run_batch, this, begin, begin + calls_for_this_thread, std::ref(results), std::ref(thread_exceptions[i]));
        }
        begin += calls_for_this_thread;
    }
    for (auto &t : threads)
    {
        t.join();
    }
    // Slices are in call order, so the first stored exception is the earliest failure.
    for (const auto &ex_ptr : thread_exceptions)
    {
        if (ex_ptr)
        {
            std::rethrow_exception(ex_ptr);
        }
    }

    if (!m_output_file_path.empty())
    {
        write_results_to_csv(m_output_file_path, results);
        if (!m_quiet)
        {
            std::cout << "Successfully wrote " << results.size() << " results to " << m_output_file_path << "." << std::endl;
        }
    }
    return results;
}
