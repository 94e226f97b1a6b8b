/**
 * @file dialect_translator.hpp
 * @brief Line-oriented JAC ↔ Python source rewriter.
 * @author Dimitris Kafetzis
 *
 * Best-effort syntactic rewriting for short pedagogical programs. There is
 * no AST: each logical statement is matched against the pattern table and
 * rewritten, and block nesting is carried by an indent level threaded
 * through a fold over the statements.
 */

#pragma once

#include "core/types.hpp"
#include "translator/pattern_table.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codelab {

/**
 * @brief One logical statement of teaching-dialect source.
 */
struct TeachingStatement {
    std::string text;       ///< Trimmed, terminator removed
    size_t line = 0;        ///< 1-based physical line
};

class DialectTranslator {
public:
    explicit DialectTranslator(const PatternTable& table = PatternTable::standard()) noexcept;

    /**
     * @brief Translate source text in the given direction.
     *
     * Never throws. Malformed input degrades to warnings; only an internal
     * fault fills `errors` (and then success is false).
     */
    [[nodiscard]] TranslationResult translate(std::string_view code,
                                              TranslationDirection direction) const noexcept;

    [[nodiscard]] TranslationResult translate(const TranslationRequest& request) const noexcept;

    /**
     * @brief Shallow heuristic checks; one message per problem found.
     */
    [[nodiscard]] std::vector<std::string> validate_syntax(std::string_view code,
                                                           Dialect dialect) const;

    /**
     * @brief Split teaching source into logical statements.
     *
     * Physical lines are cut at statement terminators outside string
     * literals, and `HEAD -> TAIL` becomes `HEAD ->` followed by `TAIL`.
     * Trailing `//` comments become statements of their own.
     */
    [[nodiscard]] std::vector<TeachingStatement> split_statements(std::string_view code) const;

    [[nodiscard]] const PatternTable& patterns() const noexcept { return table_; }

private:
    std::string teaching_to_host(std::string_view code, std::vector<std::string>& warnings) const;
    std::string host_to_teaching(std::string_view code, std::vector<std::string>& warnings) const;

    std::vector<std::string> validate_teaching(std::string_view code) const;
    std::vector<std::string> validate_host(std::string_view code) const;

    const PatternTable& table_;
};

}  // namespace codelab
