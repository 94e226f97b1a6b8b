/**
 * @file host_syntax_checker.hpp
 * @brief Host-dialect syntax check delegated to the host interpreter's parser.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace codelab {

/**
 * @brief Parses host source with `python3 -c "import ast ..."` in a child.
 *
 * The code is only parsed, never executed.
 */
class HostSyntaxChecker {
public:
    explicit HostSyntaxChecker(std::string interpreter = "python3",
                               std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /// True when the interpreter can be found on PATH.
    [[nodiscard]] bool available() const;

    /**
     * @brief Diagnostics reported by the parser; empty when the code parses.
     */
    [[nodiscard]] Result<std::vector<std::string>> check(std::string_view code) const;

private:
    std::string interpreter_;
    std::chrono::milliseconds timeout_;
};

}  // namespace codelab
