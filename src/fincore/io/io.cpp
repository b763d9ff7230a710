#include "include/fincore/io/io.h"
#include "include/fincore/core/FinanceException.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>
#include <stdexcept>
#include <vector>

// The csv.hpp header from the csv-parser library generates some warnings on MSVC
// with high warning levels. We will temporarily disable the specific warning (C4127)
// just for the inclusion of this header.
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4127) // C4127: conditional expression is constant
#endif

#include "csv.hpp"

#ifdef _MSC_VER
#pragma warning(pop)
#endif

void write_results_to_csv(const std::string &path, const std::vector<BatchResult> &results)
{
    if (results.empty())
        return;

    std::ofstream output_file(path);
    if (!output_file.is_open())
    {
        throw FinanceException(FinanceErrc::OutputFileWriteFailed, "Could not open output file '" + path + "' for writing.");
    }

    output_file.precision(std::numeric_limits<double>::max_digits10);
    output_file << "Function,Result\n";
    for (const auto &res : results)
    {
        output_file << res.function << "," << res.value << "\n";
    }

    if (!output_file)
    {
        throw FinanceException(FinanceErrc::OutputFileWriteFailed, "Failed while writing results to '" + path + "'.");
    }
}

static CallValue parse_numeric_cell(const std::string &cell)
{
    if (cell.empty())
    {
        throw std::invalid_argument("empty cell");
    }

    char *end = nullptr;
    errno = 0;
    const long long as_integer = std::strtoll(cell.c_str(), &end, 10);
    if (*end == '\0' && errno == 0)
    {
        return static_cast<std::int64_t>(as_integer);
    }

    errno = 0;
    const double as_double = std::strtod(cell.c_str(), &end);
    if (*end != '\0' || end == cell.c_str())
    {
        throw std::invalid_argument("'" + cell + "' is not a number");
    }
    if (errno == ERANGE)
    {
        throw std::out_of_range("'" + cell + "' is out of range");
    }
    return as_double;
}

std::vector<std::vector<CallValue>> read_csv_arguments(const std::string &path, const std::vector<std::string> &columns)
{
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> cells;
    try
    {
        csv::CSVReader reader(path);
        header = reader.get_col_names();
        for (const auto &col_name : columns)
        {
            if (std::find(header.begin(), header.end(), col_name) == header.end())
            {
                throw FinanceException(FinanceErrc::CsvColumnNotFound, "Column '" + col_name + "' not found in file '" + path + "'.");
            }
        }
        for (auto &row : reader)
        {
            std::vector<std::string> row_cells;
            row_cells.reserve(columns.size());
            for (const auto &col_name : columns)
            {
                row_cells.push_back(row[col_name].get<std::string>());
            }
            cells.push_back(std::move(row_cells));
        }
    }
    catch (const FinanceException &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw FinanceException(FinanceErrc::CsvFileNotFound, "Failed to read or parse CSV file '" + path + "'. Error: " + e.what());
    }

    std::vector<std::vector<CallValue>> rows;
    rows.reserve(cells.size());
    for (size_t row_index = 0; row_index < cells.size(); ++row_index)
    {
        std::vector<CallValue> args;
        args.reserve(columns.size());
        for (size_t col = 0; col < columns.size(); ++col)
        {
            try
            {
                args.push_back(parse_numeric_cell(cells[row_index][col]));
            }
            catch (const std::exception &e)
            {
                throw FinanceException(FinanceErrc::CsvConversionError, "Error converting data to number at row " + std::to_string(row_index) + ", column '" + columns[col] + "' in file '" + path + "'. Error: " + e.what());
            }
        }
        rows.push_back(std::move(args));
    }
    return rows;
}
