/**
 * @file pattern_table.cpp
 * @brief The standard JAC ↔ Python pattern table.
 * @author Dimitris Kafetzis
 */

#include "translator/pattern_table.hpp"

namespace codelab {

namespace {

constexpr PatternTable kStandardTable{
    .teaching_label = "JAC",
    .host_label = "Python",
    .teaching_comment = "//",
    .host_comment = "#",
    .teaching_block_open = "->",
    .host_block_open = ":",
    .statement_terminator = ';',
    .block_end_keyword = "ye",
    .line_continuation = "...",
    .indent_width = 4,
    .constructs = {{
        {Construct::Declaration, "var",    "",       false, false},
        {Construct::Declaration, "has",    "",       false, false},
        {Construct::Function,    "can",    "def",    true,  false},
        {Construct::Class,       "class",  "class",  true,  false},
        {Construct::If,          "if",     "if",     true,  false},
        {Construct::ElseIf,      "elif",   "elif",   true,  true},
        {Construct::Else,        "else",   "else",   true,  true},
        {Construct::For,         "for",    "for",    true,  false},
        {Construct::While,       "while",  "while",  true,  false},
        {Construct::Return,      "return", "return", false, false},
        {Construct::Print,       "print",  "print",  false, false},
    }},
};

}  // anonymous namespace

std::optional<ConstructPattern> PatternTable::by_teaching_keyword(std::string_view word) const noexcept {
    for (const auto& pattern : constructs) {
        if (pattern.teaching_keyword == word) return pattern;
    }
    return std::nullopt;
}

std::optional<ConstructPattern> PatternTable::by_host_keyword(std::string_view word) const noexcept {
    for (const auto& pattern : constructs) {
        if (!pattern.host_keyword.empty() && pattern.host_keyword == word) return pattern;
    }
    return std::nullopt;
}

bool PatternTable::is_teaching_keyword(std::string_view word) const noexcept {
    return word == block_end_keyword || by_teaching_keyword(word).has_value();
}

const PatternTable& PatternTable::standard() noexcept {
    return kStandardTable;
}

}  // namespace codelab
