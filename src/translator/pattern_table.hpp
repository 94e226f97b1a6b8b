/**
 * @file pattern_table.hpp
 * @brief Static mapping of teaching-dialect constructs to host-dialect forms.
 * @author Dimitris Kafetzis
 *
 * Pure data. One process-wide instance (PatternTable::standard()) is built
 * once and shared read-only by every translator, so concurrent translations
 * need no locking.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace codelab {

enum class Construct : uint8_t {
    Declaration,
    Function,
    Class,
    If,
    ElseIf,
    Else,
    For,
    While,
    Return,
    Print
};

/**
 * @brief How a construct is spelled in each dialect.
 *
 * An empty host keyword means the host form is implicit (a declaration
 * is a bare assignment).
 */
struct ConstructPattern {
    Construct construct;
    std::string_view teaching_keyword;
    std::string_view host_keyword;
    bool opens_block;
    bool continues_block;   ///< Closes the previous block and opens the next one (else/elif)
};

struct PatternTable {
    std::string_view teaching_label;
    std::string_view host_label;

    std::string_view teaching_comment;
    std::string_view host_comment;
    std::string_view teaching_block_open;
    std::string_view host_block_open;
    char statement_terminator;
    std::string_view block_end_keyword;
    std::string_view line_continuation;
    uint32_t indent_width;

    std::array<ConstructPattern, 11> constructs;

    /// Pattern matched by a leading teaching keyword, if any.
    [[nodiscard]] std::optional<ConstructPattern> by_teaching_keyword(std::string_view word) const noexcept;

    /// Pattern matched by a leading host keyword, if any.
    [[nodiscard]] std::optional<ConstructPattern> by_host_keyword(std::string_view word) const noexcept;

    [[nodiscard]] bool is_teaching_keyword(std::string_view word) const noexcept;

    /// The constant table used throughout the daemon.
    [[nodiscard]] static const PatternTable& standard() noexcept;
};

}  // namespace codelab
