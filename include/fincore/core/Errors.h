#pragma once

enum class FinanceErrc
{
    // General Errors
    UnknownError,
    UnknownFunction,
    MismatchedArgumentType,
    IncorrectArgumentCount,
    OutputFileWriteFailed,

    // Formula Errors (validated variants only)
    InvalidInput,

    // CSV Errors
    CsvFileNotFound,
    CsvColumnNotFound,
    CsvConversionError,

    // Batch File Errors
    BatchFileNotFound,
    BatchParseError,
    BatchConfigError
};
