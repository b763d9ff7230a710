#pragma once

#include "include/fincore/core/datastructures.h"
#include <string>
#include <vector>

// Writes "Function,Result" then one line per result. Throws OutputFileWriteFailed.
void write_results_to_csv(const std::string &path, const std::vector<BatchResult> &results);

// Reads the named columns of every data row of a CSV file, one argument list per row.
// Cells that parse fully as an integer become std::int64_t, other numbers double.
std::vector<std::vector<CallValue>> read_csv_arguments(const std::string &path, const std::vector<std::string> &columns);
