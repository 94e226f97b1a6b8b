/**
 * @file test_types.cpp
 * @brief Unit tests for the language vocabulary and result records.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace codelab;

TEST(TypesTest, LanguageToString) {
    EXPECT_EQ(to_string(Language::Python), "python");
    EXPECT_EQ(to_string(Language::JavaScript), "javascript");
    EXPECT_EQ(to_string(Language::Java), "java");
    EXPECT_EQ(to_string(Language::C), "c");
    EXPECT_EQ(to_string(Language::Cpp), "cpp");
    EXPECT_EQ(to_string(Language::Jac), "jac");
}

TEST(TypesTest, ParseLanguageAliases) {
    EXPECT_EQ(parse_language("python"), Language::Python);
    EXPECT_EQ(parse_language("PY"), Language::Python);
    EXPECT_EQ(parse_language("node"), Language::JavaScript);
    EXPECT_EQ(parse_language("c++"), Language::Cpp);
    EXPECT_EQ(parse_language("Jac"), Language::Jac);
    EXPECT_FALSE(parse_language("unsupported-lang").has_value());
    EXPECT_FALSE(parse_language("").has_value());
}

TEST(TypesTest, EveryLanguageRoundTripsThroughItsIdentifier) {
    for (auto language : all_languages()) {
        EXPECT_EQ(parse_language(to_string(language)), language) << to_string(language);
    }
}

TEST(TypesTest, ParseDirectionAndDialect) {
    EXPECT_EQ(parse_direction("teaching_to_host"), TranslationDirection::TeachingToHost);
    EXPECT_EQ(parse_direction("python_to_jac"), TranslationDirection::HostToTeaching);
    EXPECT_FALSE(parse_direction("sideways").has_value());
    EXPECT_EQ(parse_dialect("host"), Dialect::Host);
    EXPECT_EQ(parse_dialect("jac"), Dialect::Teaching);
    EXPECT_FALSE(parse_dialect("cobol").has_value());
}

TEST(TypesTest, ExecutionStatusStrings) {
    EXPECT_EQ(to_string(ExecutionStatus::Success), "success");
    EXPECT_EQ(to_string(ExecutionStatus::SecurityViolation), "security_violation");
    EXPECT_EQ(to_string(ExecutionStatus::CompilationError), "compilation_error");
    EXPECT_EQ(to_string(ExecutionStatus::UnsupportedLanguage), "unsupported_language");
}

TEST(TypesTest, SucceededNeedsStatusAndExitCode) {
    ExecutionResult result;
    result.status = ExecutionStatus::Success;
    result.exit_code = 0;
    EXPECT_TRUE(result.succeeded());

    result.exit_code = 3;
    EXPECT_FALSE(result.succeeded());

    result.status = ExecutionStatus::Failure;
    result.exit_code = 0;
    EXPECT_FALSE(result.succeeded());
}

TEST(TypesTest, RejectionCarriesMessageOnStderr) {
    auto rejected = make_rejection(ExecutionStatus::UnsupportedLanguage, "Unsupported language: x");
    EXPECT_EQ(rejected.status, ExecutionStatus::UnsupportedLanguage);
    EXPECT_EQ(rejected.exit_code, 1);
    EXPECT_TRUE(rejected.stdout_data.empty());
    ASSERT_TRUE(rejected.stderr_data.has_value());
    EXPECT_EQ(*rejected.stderr_data, "Unsupported language: x");
    EXPECT_EQ(rejected.output_size(), rejected.stderr_data->size());
    EXPECT_EQ(rejected.memory_used_bytes, 0u);
}

TEST(TypesTest, SuccessRate) {
    SessionStats stats;
    EXPECT_DOUBLE_EQ(stats.success_rate(), 0.0);

    stats.total_executions = 4;
    stats.successful_executions = 3;
    stats.failed_executions = 1;
    EXPECT_DOUBLE_EQ(stats.success_rate(), 75.0);
}
