/**
 * @file test_translator.cpp
 * @brief Unit tests for DialectTranslator (JAC ↔ Python) and its validators.
 * @author Dimitris Kafetzis
 */

#include "translator/dialect_translator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace codelab;

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

bool any_contains(const std::vector<std::string>& messages, std::string_view needle) {
    return std::any_of(messages.begin(), messages.end(),
                       [needle](const std::string& m) { return contains(m, needle); });
}

size_t count_lines(const std::string& text) {
    if (text.empty()) return 0;
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

/// Leading keyword of every non-comment teaching statement, in order.
std::vector<std::string> statement_keywords(const DialectTranslator& translator,
                                            std::string_view teaching) {
    std::vector<std::string> words;
    for (const auto& stmt : translator.split_statements(teaching)) {
        if (stmt.text.starts_with("//")) continue;
        auto end = stmt.text.find_first_of(" (;");
        words.push_back(stmt.text.substr(0, end));
    }
    return words;
}

constexpr std::string_view kBranchingProgram =
    "can check(n) ->\n"
    "    if n > 0 ->\n"
    "        return 1;\n"
    "    else ->\n"
    "        return 0;\n"
    "    ye;\n"
    "ye;\n";

}  // anonymous namespace

// ═══════════════════════════════════════════════
// Teaching → Host
// ═══════════════════════════════════════════════

TEST(TranslatorTest, DeclarationAndFunctionOnOneLine) {
    DialectTranslator translator;
    auto result = translator.translate("var x: int; can add(a,b) -> return a+b; ye;",
                                       TranslationDirection::TeachingToHost);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(contains(result.translated_code, "x = int"));
    EXPECT_TRUE(contains(result.translated_code, "def add(a,b):\n    return a+b"));
    EXPECT_EQ(result.translated_code, "x = int\ndef add(a,b):\n    return a+b");
}

TEST(TranslatorTest, LabelsAndMetadata) {
    DialectTranslator translator;
    std::string source = "print(\"hi\");";
    auto result = translator.translate(source, TranslationDirection::TeachingToHost);

    EXPECT_EQ(result.source_label, "JAC");
    EXPECT_EQ(result.target_label, "Python");
    EXPECT_EQ(result.metadata.original_length, source.size());
    EXPECT_EQ(result.metadata.translated_length, result.translated_code.size());
    EXPECT_EQ(result.metadata.direction, TranslationDirection::TeachingToHost);
    EXPECT_FALSE(result.metadata.timestamp.empty());

    auto reverse = translator.translate(TranslationRequest{"x = 1", TranslationDirection::HostToTeaching});
    EXPECT_EQ(reverse.source_label, "Python");
    EXPECT_EQ(reverse.target_label, "JAC");
}

TEST(TranslatorTest, IfElsePreservesStructure) {
    DialectTranslator translator;
    auto result = translator.translate(kBranchingProgram, TranslationDirection::TeachingToHost);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.translated_code,
              "def check(n):\n"
              "    if n > 0:\n"
              "        return 1\n"
              "    else:\n"
              "        return 0");
    // can, if, return, else, return
    EXPECT_GE(count_lines(result.translated_code), 5u);
}

TEST(TranslatorTest, ElseSitsAtTheLevelOfItsIf) {
    DialectTranslator translator;
    auto result = translator.translate(
        "if a -> print(1); elif b -> print(2); else -> print(3); ye;",
        TranslationDirection::TeachingToHost);

    EXPECT_EQ(result.translated_code,
              "if a:\n"
              "    print(1)\n"
              "elif b:\n"
              "    print(2)\n"
              "else:\n"
              "    print(3)");
    EXPECT_TRUE(result.warnings.empty());
}

TEST(TranslatorTest, ClassWithBase) {
    DialectTranslator translator;
    auto result = translator.translate("class Dog: Animal -> has name: str; ye;",
                                       TranslationDirection::TeachingToHost);
    EXPECT_EQ(result.translated_code, "class Dog(Animal):\n    name = str");
}

TEST(TranslatorTest, LoopsAndDeclarationsWithValues) {
    DialectTranslator translator;
    auto result = translator.translate(
        "var total = 0;\nfor i in range(3) ->\n    total = total + i;\nye;\nwhile total > 0 -> total = total - 1; ye;",
        TranslationDirection::TeachingToHost);
    EXPECT_EQ(result.translated_code,
              "total = 0\n"
              "for i in range(3):\n"
              "    total = total + i\n"
              "while total > 0:\n"
              "    total = total - 1");
}

TEST(TranslatorTest, CommentsBecomeHostComments) {
    DialectTranslator translator;
    auto result = translator.translate("// setup\nx = 1; // note",
                                       TranslationDirection::TeachingToHost);
    EXPECT_EQ(result.translated_code, "# setup\nx = 1\n# note");
}

TEST(TranslatorTest, BlockEndWithoutBlockWarns) {
    DialectTranslator translator;
    auto result = translator.translate("ye;", TranslationDirection::TeachingToHost);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(any_contains(result.warnings, "without an open block"));
}

TEST(TranslatorTest, StrayBlockEndLeavesLaterNestingIntact) {
    DialectTranslator translator;
    auto result = translator.translate("ye;\nif x ->\nprint(x);\nye;\nprint(2);",
                                       TranslationDirection::TeachingToHost);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.translated_code, "if x:\n    print(x)\nprint(2)");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings.front().find("without an open block"), std::string::npos);
}

TEST(TranslatorTest, UnclosedBlockWarns) {
    DialectTranslator translator;
    auto result = translator.translate("if x -> print(x);", TranslationDirection::TeachingToHost);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.translated_code, "if x:\n    print(x)");
    EXPECT_TRUE(any_contains(result.warnings, "1 block(s) never closed"));
}

TEST(TranslatorTest, HeaderWithoutMarkerPassesThrough) {
    DialectTranslator translator;
    auto result = translator.translate("while running;", TranslationDirection::TeachingToHost);
    EXPECT_EQ(result.translated_code, "while running");
    EXPECT_TRUE(any_contains(result.warnings, "without block-open marker"));
}

TEST(TranslatorTest, EmptyInputTranslatesToEmptyOutput) {
    DialectTranslator translator;
    auto result = translator.translate("", TranslationDirection::TeachingToHost);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.translated_code.empty());
    EXPECT_EQ(result.metadata.translated_length, 0u);
}

// ═══════════════════════════════════════════════
// Host → Teaching
// ═══════════════════════════════════════════════

TEST(TranslatorTest, HostFunctionToTeaching) {
    DialectTranslator translator;
    auto result = translator.translate("def add(a, b):\n    return a + b\n",
                                       TranslationDirection::HostToTeaching);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.translated_code, "can add(a, b) ->\n    return a + b;\nye;");
}

TEST(TranslatorTest, ReturnAnnotationIsDroppedWithWarning) {
    DialectTranslator translator;
    auto result = translator.translate("def f(x) -> int:\n    return x",
                                       TranslationDirection::HostToTeaching);
    EXPECT_EQ(result.translated_code, "can f(x) ->\n    return x;\nye;");
    EXPECT_TRUE(any_contains(result.warnings, "return annotation '-> int' dropped"));
}

TEST(TranslatorTest, TrailingHostCommentBecomesItsOwnLine) {
    DialectTranslator translator;
    auto result = translator.translate("x = 1  # set x", TranslationDirection::HostToTeaching);
    EXPECT_EQ(result.translated_code, "x = 1;\n// set x");
}

TEST(TranslatorTest, HashInsideStringIsNotAComment) {
    DialectTranslator translator;
    auto result = translator.translate("print(\"#1\")", TranslationDirection::HostToTeaching);
    EXPECT_EQ(result.translated_code, "print(\"#1\");");
}

TEST(TranslatorTest, UnknownHostHeaderPassesThroughWithWarning) {
    DialectTranslator translator;
    auto result = translator.translate("try:\n    x = 1\nexcept ValueError:\n    x = 2\n",
                                       TranslationDirection::HostToTeaching);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(any_contains(result.warnings, "'try' block has no JAC equivalent"));
    EXPECT_TRUE(contains(result.translated_code, "try ->"));
    EXPECT_TRUE(contains(result.translated_code, "except ValueError ->"));
}

TEST(TranslatorTest, RoundTripKeepsKeywordOrder) {
    DialectTranslator translator;
    auto host = translator.translate(kBranchingProgram, TranslationDirection::TeachingToHost);
    ASSERT_TRUE(host.success);
    auto back = translator.translate(host.translated_code, TranslationDirection::HostToTeaching);
    ASSERT_TRUE(back.success);

    EXPECT_EQ(statement_keywords(translator, kBranchingProgram),
              statement_keywords(translator, back.translated_code));
    EXPECT_EQ(statement_keywords(translator, back.translated_code),
              (std::vector<std::string>{"can", "if", "return", "else", "return", "ye", "ye"}));
}

// ═══════════════════════════════════════════════
// Statement splitting
// ═══════════════════════════════════════════════

TEST(TranslatorTest, SplitStatementsRespectsStrings) {
    DialectTranslator translator;
    auto statements = translator.split_statements("x = \"a;b\"; y = 2\n\nif y -> print(y);");

    ASSERT_EQ(statements.size(), 4u);
    EXPECT_EQ(statements[0].text, "x = \"a;b\"");
    EXPECT_EQ(statements[0].line, 1u);
    EXPECT_EQ(statements[1].text, "y = 2");
    EXPECT_EQ(statements[2].text, "if y ->");
    EXPECT_EQ(statements[2].line, 3u);
    EXPECT_EQ(statements[3].text, "print(y)");
}

// ═══════════════════════════════════════════════
// Syntax validation
// ═══════════════════════════════════════════════

TEST(TranslatorValidationTest, ValidTeachingProgram) {
    DialectTranslator translator;
    EXPECT_TRUE(translator.validate_syntax(kBranchingProgram, Dialect::Teaching).empty());
    EXPECT_TRUE(translator.validate_syntax("var x = 1;\nprint(x);", Dialect::Teaching).empty());
}

TEST(TranslatorValidationTest, TeachingBlockEndWithoutBlock) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("ye;", Dialect::Teaching);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_TRUE(contains(problems[0], "Line 1"));
    EXPECT_TRUE(contains(problems[0], "without a matching block"));
}

TEST(TranslatorValidationTest, TeachingHeaderWithoutBody) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("if x ->", Dialect::Teaching);
    EXPECT_TRUE(any_contains(problems, "missing body"));
    EXPECT_TRUE(any_contains(problems, "never closed"));
}

TEST(TranslatorValidationTest, TeachingBracketsAndUnknownKeywords) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("print((1);\nfoo bar;", Dialect::Teaching);
    EXPECT_TRUE(any_contains(problems, "Line 1: unclosed '('"));
    EXPECT_TRUE(any_contains(problems, "Line 2: unknown leading keyword 'foo'"));
}

TEST(TranslatorValidationTest, TeachingElseWithoutIf) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("else -> print(1); ye;", Dialect::Teaching);
    EXPECT_TRUE(any_contains(problems, "'else' without a matching block"));
}

TEST(TranslatorValidationTest, ValidHostProgram) {
    DialectTranslator translator;
    EXPECT_TRUE(translator.validate_syntax("def f(x):\n    return x\n\nprint(f(2))\n",
                                           Dialect::Host).empty());
}

TEST(TranslatorValidationTest, HostMissingColonAndIndent) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("if x\n    y = 1", Dialect::Host);
    EXPECT_TRUE(any_contains(problems, "missing ':' after 'if' header"));
    EXPECT_TRUE(any_contains(problems, "unexpected indent"));
}

TEST(TranslatorValidationTest, HostExpectedIndentedBlock) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("def f():\nreturn 1", Dialect::Host);
    EXPECT_TRUE(any_contains(problems, "expected an indented block after 'def f():'"));
}

TEST(TranslatorValidationTest, HostIndentationNotMultipleOfWidth) {
    DialectTranslator translator;
    auto problems = translator.validate_syntax("if x:\n   y = 1", Dialect::Host);
    EXPECT_TRUE(any_contains(problems, "indentation is not a multiple of 4 spaces"));
}

TEST(TranslatorValidationTest, KeywordPrefixedNameIsNotAHeader) {
    DialectTranslator translator;
    EXPECT_TRUE(translator.validate_syntax("if_count = 1\nforward = 2", Dialect::Host).empty());
}
