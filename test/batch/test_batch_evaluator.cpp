#include "test/test_helpers.h"

class BatchEvaluatorTest : public FileCleanupTest
{
};

TEST_F(BatchEvaluatorTest, EvaluatesLiteralCallsInOrder)
{
    const std::string batch = R"({
        "calls": [
            {"function": "calculate_compound_interest", "args": [1000.0, 5.0, 12, 10]},
            {"function": "calculate_inflation_impact", "args": [1000.0, 3.0, 5]},
            {"function": "calculate_compound_interest", "args": [1000, 0, 4, 30]}
        ]
    })";
    create_test_file("batch.json", batch);

    BatchEvaluator evaluator("batch.json", true);
    EXPECT_EQ(evaluator.num_calls(), 3u);
    EXPECT_EQ(evaluator.get_policy(), FormulaPolicy::Permissive);
    auto results = evaluator.run();

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].function, "calculate_compound_interest");
    EXPECT_NEAR(results[0].value, 1647.0095, 1e-4);
    EXPECT_EQ(results[1].function, "calculate_inflation_impact");
    EXPECT_NEAR(results[1].value, 862.6088, 1e-4);
    EXPECT_DOUBLE_EQ(results[2].value, 1000.0);
}

TEST_F(BatchEvaluatorTest, ExpandsCsvSourceIntoOneCallPerRow)
{
    create_test_file("scenarios.csv",
                     "amount,rate,years\n"
                     "1000,3.0,5\n"
                     "1000,3.0,0\n"
                     "500,0.0,25\n");
    const std::string batch = R"({
        "calls": [
            {"function": "calculate_inflation_impact",
             "csv_source": {"path": "scenarios.csv", "columns": ["amount", "rate", "years"]}}
        ]
    })";
    create_test_file("batch.json", batch);

    BatchEvaluator evaluator("batch.json", true);
    EXPECT_EQ(evaluator.num_calls(), 3u);
    auto results = evaluator.run();

    ASSERT_EQ(results.size(), 3u);
    EXPECT_NEAR(results[0].value, 862.6088, 1e-4);
    EXPECT_DOUBLE_EQ(results[1].value, 1000.0);
    EXPECT_DOUBLE_EQ(results[2].value, 500.0);
}

TEST_F(BatchEvaluatorTest, ManyCallsAcrossThreadsKeepOrder)
{
    std::string calls;
    for (int years = 0; years < 200; ++years)
    {
        calls += std::string(years == 0 ? "" : ",") +
                 R"({"function": "calculate_compound_interest", "args": [1000.0, 2.0, 1, )" + std::to_string(years) + "]}";
    }
    create_test_file("batch.json", R"({"calls": [)" + calls + "]}");

    BatchEvaluator evaluator("batch.json", true);
    auto results = evaluator.run();

    ASSERT_EQ(results.size(), 200u);
    for (size_t years = 0; years < results.size(); ++years)
    {
        EXPECT_NEAR(results[years].value, 1000.0 * std::pow(1.02, static_cast<double>(years)), 1e-6 * results[years].value);
    }
}

TEST_F(BatchEvaluatorTest, WritesOutputFileWhenConfigured)
{
    const std::string batch = R"({
        "batch_config": {"output_file": "test_output.csv"},
        "calls": [
            {"function": "calculate_compound_interest", "args": [1000.0, 10.0, 1, 1]},
            {"function": "calculate_inflation_impact", "args": [1000.0, 0.0, 3]}
        ]
    })";
    create_test_file("batch.json", batch);

    BatchEvaluator evaluator("batch.json", true);
    EXPECT_EQ(evaluator.get_output_file_path(), "test_output.csv");
    evaluator.run();

    const std::string expected_content =
        "Function,Result\n"
        "calculate_compound_interest,1100\n"
        "calculate_inflation_impact,1000\n";
    EXPECT_EQ(read_file_content("test_output.csv"), expected_content);
}

TEST_F(BatchEvaluatorTest, DoesNotWriteFileWhenNotSpecified)
{
    create_test_file("batch.json", R"({"calls": [{"function": "calculate_inflation_impact", "args": [10.0, 1.0, 1]}]})");

    BatchEvaluator evaluator("batch.json", true);
    evaluator.run();

    EXPECT_TRUE(evaluator.get_output_file_path().empty());
    std::ifstream file("test_output.csv");
    EXPECT_FALSE(file.good());
}

TEST_F(BatchEvaluatorTest, PermissiveBatchPropagatesInfinity)
{
    create_test_file("batch.json", R"({"calls": [{"function": "calculate_inflation_impact", "args": [10.0, -100.0, 2]}]})");

    BatchEvaluator evaluator("batch.json", true);
    auto results = evaluator.run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(std::isinf(results[0].value));
}

TEST_F(BatchEvaluatorTest, StrictValidationRejectsInvalidInput)
{
    const std::string batch = R"({
        "batch_config": {"strict_validation": true},
        "calls": [
            {"function": "calculate_inflation_impact", "args": [10.0, 2.0, 2]},
            {"function": "calculate_inflation_impact", "args": [10.0, -100.0, 2]}
        ]
    })";
    create_test_file("batch.json", batch);

    BatchEvaluator evaluator("batch.json", true);
    EXPECT_EQ(evaluator.get_policy(), FormulaPolicy::Strict);
    try
    {
        evaluator.run();
        FAIL() << "Expected exception for -100% inflation under strict validation.";
    }
    catch (const FinanceException &e)
    {
        EXPECT_EQ(e.code(), FinanceErrc::InvalidInput);
        EXPECT_EQ(e.call_index(), 1);
        EXPECT_THAT(e.what(), ::testing::StartsWith("Call #1: In function 'calculate_inflation_impact'"));
    }
}

TEST_F(BatchEvaluatorTest, EmptyCallListProducesNoResults)
{
    create_test_file("batch.json", R"({"batch_config": {"output_file": "test_output.csv"}, "calls": []})");

    BatchEvaluator evaluator("batch.json", true);
    EXPECT_TRUE(evaluator.run().empty());
    std::ifstream file("test_output.csv");
    EXPECT_FALSE(file.good());
}
