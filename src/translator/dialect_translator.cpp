/**
 * @file dialect_translator.cpp
 * @brief DialectTranslator implementation.
 * @author Dimitris Kafetzis
 *
 * Teaching → host folds logical statements into an accumulator holding the
 * current indent level. Host → teaching derives the level of every line
 * from its leading whitespace and re-inserts `->`, `;` and `ye;` markers.
 */

#include "translator/dialect_translator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <numeric>
#include <optional>
#include <utility>

namespace codelab {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

std::string_view trim(std::string_view s) noexcept {
    auto begin = s.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string_view> split_lines(std::string_view code) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= code.size()) {
        auto end = code.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(code.substr(start));
            break;
        }
        lines.push_back(code.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string_view leading_word(std::string_view s) noexcept {
    size_t n = 0;
    while (n < s.size() && is_ident_char(s[n])) ++n;
    return s.substr(0, n);
}

std::string indent(int level, uint32_t width) {
    return std::string(static_cast<size_t>(std::max(level, 0)) * width, ' ');
}

std::string line_prefix(size_t line) {
    return "Line " + std::to_string(line) + ": ";
}

/**
 * @brief Tracks whether a scan position is inside a string literal.
 */
class QuoteTracker {
public:
    void feed(char c) noexcept {
        if (quote_ == 0) {
            if (c == '"' || c == '\'') quote_ = c;
            return;
        }
        if (escaped_) {
            escaped_ = false;
        } else if (c == '\\') {
            escaped_ = true;
        } else if (c == quote_) {
            quote_ = 0;
        }
    }

    [[nodiscard]] bool in_string() const noexcept { return quote_ != 0; }

private:
    char quote_ = 0;
    bool escaped_ = false;
};

/**
 * @brief Split a host line into its code and its trailing `#` comment.
 */
std::pair<std::string_view, std::string_view> split_host_comment(std::string_view line,
                                                                 std::string_view marker) {
    QuoteTracker quotes;
    for (size_t pos = 0; pos < line.size(); ++pos) {
        if (!quotes.in_string() && line.substr(pos).starts_with(marker)) {
            return {trim(line.substr(0, pos)), trim(line.substr(pos + marker.size()))};
        }
        quotes.feed(line[pos]);
    }
    return {line, {}};
}

/**
 * @brief First bracket mismatch in a statement, if any.
 */
std::optional<std::string> bracket_problem(std::string_view text) {
    std::string stack;
    QuoteTracker quotes;
    for (char c : text) {
        bool was_in_string = quotes.in_string();
        quotes.feed(c);
        if (was_in_string || quotes.in_string()) continue;

        if (c == '(' || c == '[' || c == '{') {
            stack.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            char expected = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back() != expected) {
                return std::string{"unexpected '"} + c + "'";
            }
            stack.pop_back();
        }
    }
    if (!stack.empty()) return std::string{"unclosed '"} + stack.back() + "'";
    if (quotes.in_string()) return std::string{"unterminated string literal"};
    return std::nullopt;
}

int64_t unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ─────────────────────────────────────────────
// Teaching → Host fold
// ─────────────────────────────────────────────

struct HostFold {
    int indent_level = 0;
    std::vector<std::string> lines;
    std::vector<std::string> warnings;
};

/// `name: Base` and `name(Base)` both become `name(Base)`.
std::string host_class_header(std::string_view rest) {
    auto name = leading_word(rest);
    auto tail = trim(rest.substr(name.size()));
    if (tail.starts_with(':')) {
        auto base = trim(tail.substr(1));
        if (base.empty()) return std::string(name);
        return std::string(name) + "(" + std::string(base) + ")";
    }
    return std::string(rest);
}

HostFold fold_teaching_statement(HostFold acc, const TeachingStatement& stmt,
                                 const PatternTable& table) {
    const std::string_view text = stmt.text;
    const auto where = line_prefix(stmt.line);
    auto emit = [&acc, &table](int level, std::string body) {
        acc.lines.push_back(indent(level, table.indent_width) + std::move(body));
    };

    if (text.starts_with(table.teaching_comment)) {
        auto body = trim(text.substr(table.teaching_comment.size()));
        std::string comment(table.host_comment);
        if (!body.empty()) comment += " " + std::string(body);
        emit(acc.indent_level, std::move(comment));
        return acc;
    }

    if (text.ends_with(table.line_continuation)) {
        acc.warnings.push_back(where + "line continuation '" + std::string(table.line_continuation)
                               + "' is not supported; statement passed through");
    }

    const bool opens = text.ends_with(table.teaching_block_open);
    const std::string_view head = opens
        ? trim(text.substr(0, text.size() - table.teaching_block_open.size()))
        : text;
    const auto word = leading_word(head);
    const auto rest = trim(head.substr(word.size()));

    if (!opens && word == table.block_end_keyword && rest.empty()) {
        --acc.indent_level;
        if (acc.indent_level < 0) {
            acc.warnings.push_back(where + "block end '" + std::string(word)
                                   + "' without an open block");
            acc.indent_level = 0;
        }
        return acc;
    }

    auto pattern = word.empty() ? std::nullopt : table.by_teaching_keyword(word);
    if (!pattern) {
        if (opens) {
            acc.warnings.push_back(where + "unrecognised block header '" + std::string(head)
                                   + "' passed through");
            emit(acc.indent_level, std::string(head) + std::string(table.host_block_open));
            ++acc.indent_level;
        } else {
            emit(acc.indent_level, std::string(text));
        }
        return acc;
    }

    switch (pattern->construct) {
        case Construct::Declaration: {
            auto name = leading_word(rest);
            auto after = trim(rest.substr(name.size()));
            std::string_view type;
            std::string_view value;
            if (after.starts_with(':')) {
                auto annotated = trim(after.substr(1));
                auto eq = annotated.find('=');
                type = trim(annotated.substr(0, eq));
                if (eq != std::string_view::npos) value = trim(annotated.substr(eq + 1));
            } else if (after.starts_with('=')) {
                value = trim(after.substr(1));
            }
            if (name.empty()) {
                acc.warnings.push_back(where + "malformed declaration '" + std::string(text)
                                       + "' passed through");
                emit(acc.indent_level, std::string(text));
                break;
            }
            std::string assigned = !value.empty() ? std::string(value)
                                 : !type.empty() ? std::string(type)
                                 : std::string("None");
            emit(acc.indent_level, std::string(name) + " = " + assigned);
            break;
        }

        case Construct::Function: {
            if (!opens) {
                acc.warnings.push_back(where + "function header without '"
                                       + std::string(table.teaching_block_open) + "'");
            }
            auto name = leading_word(rest);
            auto after = rest.substr(name.size());
            std::string params = "()";
            if (after.starts_with('(')) {
                auto close = after.find(')');
                if (close != std::string_view::npos) {
                    params = std::string(after.substr(0, close + 1));
                    if (!trim(after.substr(close + 1)).empty()) {
                        acc.warnings.push_back(where + "text after parameter list dropped: '"
                                               + std::string(trim(after.substr(close + 1))) + "'");
                    }
                } else {
                    acc.warnings.push_back(where + "unclosed parameter list");
                    params = std::string(after) + ")";
                }
            } else {
                acc.warnings.push_back(where + "function '" + std::string(name)
                                       + "' has no parameter list; assuming none");
            }
            emit(acc.indent_level, std::string(pattern->host_keyword) + " "
                                   + std::string(name) + params
                                   + std::string(table.host_block_open));
            ++acc.indent_level;
            break;
        }

        case Construct::Class: {
            if (!opens) {
                acc.warnings.push_back(where + "class header without '"
                                       + std::string(table.teaching_block_open) + "'");
            }
            emit(acc.indent_level, std::string(pattern->host_keyword) + " "
                                   + host_class_header(rest)
                                   + std::string(table.host_block_open));
            ++acc.indent_level;
            break;
        }

        case Construct::If:
        case Construct::For:
        case Construct::While: {
            if (!opens) {
                acc.warnings.push_back(where + "'" + std::string(word)
                                       + "' without block-open marker; passed through");
                emit(acc.indent_level, std::string(text));
                break;
            }
            if (rest.empty()) {
                acc.warnings.push_back(where + "'" + std::string(word) + "' without a condition");
            }
            emit(acc.indent_level, std::string(pattern->host_keyword) + " " + std::string(rest)
                                   + std::string(table.host_block_open));
            ++acc.indent_level;
            break;
        }

        case Construct::ElseIf:
        case Construct::Else: {
            // One token closes the previous block and opens the alternative.
            --acc.indent_level;
            if (acc.indent_level < 0) {
                acc.warnings.push_back(where + "'" + std::string(word)
                                       + "' without an open block");
            }
            std::string header(pattern->host_keyword);
            if (pattern->construct == Construct::ElseIf) header += " " + std::string(rest);
            emit(acc.indent_level, header + std::string(table.host_block_open));
            ++acc.indent_level;
            break;
        }

        case Construct::Return:
        case Construct::Print:
            emit(acc.indent_level, std::string(text));
            break;
    }
    return acc;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────

DialectTranslator::DialectTranslator(const PatternTable& table) noexcept
    : table_(table) {}

TranslationResult DialectTranslator::translate(const TranslationRequest& request) const noexcept {
    return translate(request.source_code, request.direction);
}

TranslationResult DialectTranslator::translate(std::string_view code,
                                               TranslationDirection direction) const noexcept {
    TranslationResult result;
    result.metadata.direction = direction;
    result.metadata.original_length = code.size();

    try {
        result.metadata.timestamp = std::to_string(unix_seconds());
        if (direction == TranslationDirection::TeachingToHost) {
            result.translated_code = teaching_to_host(code, result.warnings);
            result.source_label = table_.teaching_label;
            result.target_label = table_.host_label;
        } else {
            result.translated_code = host_to_teaching(code, result.warnings);
            result.source_label = table_.host_label;
            result.target_label = table_.teaching_label;
        }
        result.metadata.translated_length = result.translated_code.size();
    } catch (const std::exception& e) {
        result.translated_code.clear();
        result.source_label = "Unknown";
        result.target_label = "Unknown";
        result.metadata.translated_length = 0;
        result.errors.push_back(std::string{"Translation failed: "} + e.what());
    }

    result.success = result.errors.empty();
    return result;
}

std::vector<TeachingStatement> DialectTranslator::split_statements(std::string_view code) const {
    std::vector<TeachingStatement> statements;
    const auto lines = split_lines(code);

    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t line_no = i + 1;
        const auto line = trim(lines[i]);
        if (line.empty()) continue;

        if (line.starts_with(table_.teaching_comment)) {
            statements.push_back({std::string(line), line_no});
            continue;
        }

        std::string current;
        std::string trailing_comment;
        QuoteTracker quotes;
        auto flush = [&] {
            auto piece = trim(current);
            if (!piece.empty()) statements.push_back({std::string(piece), line_no});
            current.clear();
        };

        for (size_t pos = 0; pos < line.size(); ++pos) {
            const char c = line[pos];
            if (!quotes.in_string()) {
                const auto remaining = line.substr(pos);
                if (remaining.starts_with(table_.teaching_comment)) {
                    trailing_comment = std::string(remaining);
                    break;
                }
                if (c == table_.statement_terminator) {
                    flush();
                    continue;
                }
                if (remaining.starts_with(table_.teaching_block_open)) {
                    current += table_.teaching_block_open;
                    flush();
                    pos += table_.teaching_block_open.size() - 1;
                    continue;
                }
            }
            quotes.feed(c);
            current += c;
        }
        flush();

        if (!trailing_comment.empty()) {
            statements.push_back({std::move(trailing_comment), line_no});
        }
    }
    return statements;
}

std::string DialectTranslator::teaching_to_host(std::string_view code,
                                                std::vector<std::string>& warnings) const {
    const auto statements = split_statements(code);

    HostFold folded = std::accumulate(
        statements.begin(), statements.end(), HostFold{},
        [this](HostFold acc, const TeachingStatement& stmt) {
            return fold_teaching_statement(std::move(acc), stmt, table_);
        });

    if (folded.indent_level > 0) {
        folded.warnings.push_back(std::to_string(folded.indent_level)
                                  + " block(s) never closed with '"
                                  + std::string(table_.block_end_keyword) + "'");
    }

    warnings.insert(warnings.end(),
                    std::make_move_iterator(folded.warnings.begin()),
                    std::make_move_iterator(folded.warnings.end()));
    return join_lines(folded.lines);
}

std::string DialectTranslator::host_to_teaching(std::string_view code,
                                                std::vector<std::string>& warnings) const {
    const uint32_t width = table_.indent_width;
    const std::string block_end = std::string(table_.block_end_keyword)
                                + table_.statement_terminator;
    const std::string open_marker = " " + std::string(table_.teaching_block_open);

    std::vector<std::string> out;
    std::vector<int> open_levels;
    const auto lines = split_lines(code);

    auto close_block = [&](int level) {
        out.push_back(indent(level, width) + block_end);
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto raw = lines[i];
        const auto content = trim(raw);
        if (content.empty()) continue;
        const auto where = line_prefix(i + 1);

        uint32_t columns = 0;
        for (char c : raw) {
            if (c == ' ') ++columns;
            else if (c == '\t') columns += width;
            else break;
        }
        const int level = static_cast<int>(columns / width);
        if (columns % width != 0) {
            warnings.push_back(where + "indentation of " + std::to_string(columns)
                               + " columns is not a multiple of " + std::to_string(width));
        }

        if (content.starts_with(table_.host_comment)) {
            auto body = trim(content.substr(table_.host_comment.size()));
            int comment_level = std::min(level, static_cast<int>(open_levels.size()));
            std::string comment(table_.teaching_comment);
            if (!body.empty()) comment += " " + std::string(body);
            out.push_back(indent(comment_level, width) + comment);
            continue;
        }

        const auto [code_part, comment_part] = split_host_comment(content, table_.host_comment);
        const auto word = leading_word(code_part);
        const bool continuation = word == "else" || word == "elif"
                               || word == "except" || word == "finally";

        while (!open_levels.empty() && open_levels.back() > level) {
            close_block(open_levels.back());
            open_levels.pop_back();
        }
        if (!open_levels.empty() && open_levels.back() == level) {
            open_levels.pop_back();
            if (!continuation) close_block(level);
        } else if (continuation) {
            warnings.push_back(where + "'" + std::string(word) + "' without a matching block");
        }

        const bool header = code_part.ends_with(table_.host_block_open);
        const auto pattern = word.empty() ? std::nullopt : table_.by_host_keyword(word);

        if (header) {
            auto head = trim(code_part.substr(0, code_part.size() - table_.host_block_open.size()));
            auto rest = trim(head.substr(word.size()));
            std::string teaching;

            if (pattern && pattern->opens_block) {
                switch (pattern->construct) {
                    case Construct::Function: {
                        auto close = rest.rfind(')');
                        if (close != std::string_view::npos
                            && !trim(rest.substr(close + 1)).empty()) {
                            warnings.push_back(where + "return annotation '"
                                               + std::string(trim(rest.substr(close + 1)))
                                               + "' dropped");
                            rest = rest.substr(0, close + 1);
                        }
                        teaching = std::string(pattern->teaching_keyword) + " " + std::string(rest);
                        break;
                    }
                    case Construct::Else:
                        teaching = std::string(pattern->teaching_keyword);
                        break;
                    default:
                        teaching = std::string(pattern->teaching_keyword) + " " + std::string(rest);
                        break;
                }
            } else {
                warnings.push_back(where + "'" + std::string(word.empty() ? head : word)
                                   + "' block has no " + std::string(table_.teaching_label)
                                   + " equivalent; header passed through");
                teaching = std::string(head);
            }

            out.push_back(indent(level, width) + teaching + open_marker);
            open_levels.push_back(level);
        } else {
            if (pattern && pattern->opens_block) {
                warnings.push_back(where + "'" + std::string(word) + "' header is missing '"
                                   + std::string(table_.host_block_open) + "'");
            }
            std::string stmt(code_part);
            if (!stmt.ends_with(table_.statement_terminator)) stmt += table_.statement_terminator;
            out.push_back(indent(level, width) + stmt);
        }

        if (!comment_part.empty()) {
            out.push_back(indent(level, width) + std::string(table_.teaching_comment) + " "
                          + std::string(comment_part));
        }
    }

    while (!open_levels.empty()) {
        close_block(open_levels.back());
        open_levels.pop_back();
    }
    return join_lines(out);
}

// ─────────────────────────────────────────────
// Syntax Validation
// ─────────────────────────────────────────────

std::vector<std::string> DialectTranslator::validate_syntax(std::string_view code,
                                                            Dialect dialect) const {
    return dialect == Dialect::Teaching ? validate_teaching(code) : validate_host(code);
}

std::vector<std::string> DialectTranslator::validate_teaching(std::string_view code) const {
    std::vector<std::string> problems;
    std::vector<const TeachingStatement*> open_blocks;
    const TeachingStatement* last = nullptr;

    const auto statements = split_statements(code);
    for (const auto& stmt : statements) {
        std::string_view text = stmt.text;
        if (text.starts_with(table_.teaching_comment)) continue;
        last = &stmt;
        const auto where = line_prefix(stmt.line);

        if (auto problem = bracket_problem(text)) {
            problems.push_back(where + *problem + " in '" + stmt.text + "'");
        }

        const auto word = leading_word(text);
        const auto rest = text.substr(word.size());
        const bool opens = text.ends_with(table_.teaching_block_open);

        if (word == table_.block_end_keyword && trim(rest).empty()) {
            if (open_blocks.empty()) {
                problems.push_back(where + "block end '" + std::string(word)
                                   + "' without a matching block");
            } else {
                open_blocks.pop_back();
            }
            continue;
        }

        auto pattern = table_.by_teaching_keyword(word);
        if (pattern && pattern->continues_block) {
            if (open_blocks.empty()) {
                problems.push_back(where + "'" + std::string(word) + "' without a matching block");
            } else {
                open_blocks.back() = &stmt;
            }
            continue;
        }

        if (opens) {
            open_blocks.push_back(&stmt);
        }

        // `word identifier ...` reads as a keyword statement; flag unknown keywords.
        if (!word.empty() && !pattern && !std::isdigit(static_cast<unsigned char>(word.front()))
            && !rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) {
            auto next = trim(rest);
            if (!next.empty() && (std::isalpha(static_cast<unsigned char>(next.front()))
                                  || next.front() == '_')) {
                problems.push_back(where + "unknown leading keyword '" + std::string(word) + "'");
            }
        }
    }

    if (last && last->text.ends_with(table_.teaching_block_open)) {
        problems.push_back(line_prefix(last->line) + "block statement '" + last->text
                           + "' missing body");
    }
    for (const auto* block : open_blocks) {
        problems.push_back(line_prefix(block->line) + "block opened by '" + block->text
                           + "' is never closed with '" + std::string(table_.block_end_keyword)
                           + "'");
    }
    return problems;
}

std::vector<std::string> DialectTranslator::validate_host(std::string_view code) const {
    std::vector<std::string> problems;
    const uint32_t width = table_.indent_width;
    std::vector<uint32_t> levels{0};
    std::optional<std::pair<size_t, std::string>> pending_header;

    const auto lines = split_lines(code);
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto raw = lines[i];
        const auto content = trim(raw);
        if (content.empty() || content.starts_with(table_.host_comment)) continue;
        const auto where = line_prefix(i + 1);

        uint32_t columns = 0;
        for (char c : raw) {
            if (c == ' ') ++columns;
            else if (c == '\t') columns += width;
            else break;
        }
        if (columns % width != 0) {
            problems.push_back(where + "indentation is not a multiple of "
                               + std::to_string(width) + " spaces");
        }

        if (pending_header) {
            if (columns <= levels.back()) {
                problems.push_back(line_prefix(pending_header->first)
                                   + "expected an indented block after '"
                                   + pending_header->second + "'");
            } else {
                levels.push_back(columns);
            }
            pending_header.reset();
        } else if (columns > levels.back()) {
            problems.push_back(where + "unexpected indent");
        }

        if (columns < levels.back()) {
            while (levels.size() > 1 && levels.back() > columns) levels.pop_back();
            if (levels.back() != columns) {
                problems.push_back(where + "unindent does not match any outer indentation level");
            }
        }

        const auto [code_part, comment_part] = split_host_comment(content, table_.host_comment);
        (void)comment_part;
        const auto word = leading_word(code_part);
        const auto pattern = word.empty() ? std::nullopt : table_.by_host_keyword(word);
        const bool compound = (pattern && pattern->opens_block)
                           || word == "try" || word == "except" || word == "finally"
                           || word == "with";
        // A keyword used as a plain name (`if_count = 1`) is not a header.
        const bool keyword_use = compound && (code_part.size() == word.size()
            || !is_ident_char(code_part[word.size()]));

        if (keyword_use) {
            if (!code_part.ends_with(table_.host_block_open)) {
                problems.push_back(where + "missing '" + std::string(table_.host_block_open)
                                   + "' after '" + std::string(word) + "' header");
            } else {
                pending_header = std::make_pair(i + 1, std::string(code_part));
            }
        }
        if (auto problem = bracket_problem(code_part)) {
            problems.push_back(where + *problem);
        }
    }

    if (pending_header) {
        problems.push_back(line_prefix(pending_header->first)
                           + "expected an indented block after '" + pending_header->second + "'");
    }
    return problems;
}

}  // namespace codelab
