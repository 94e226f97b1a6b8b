/**
 * @file host_syntax_checker.cpp
 * @brief HostSyntaxChecker implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/host_syntax_checker.hpp"

#include "sandbox/process.hpp"

#include <utility>

namespace codelab {

namespace {

constexpr std::string_view kParseScript =
    "import ast, sys\n"
    "try:\n"
    "    ast.parse(sys.stdin.read())\n"
    "except SyntaxError as e:\n"
    "    print('Syntax error at line %s: %s' % (e.lineno, e.msg))\n";

constexpr uint64_t kParserMemoryBytes = 256ULL * 1024 * 1024;

}  // anonymous namespace

HostSyntaxChecker::HostSyntaxChecker(std::string interpreter, std::chrono::milliseconds timeout)
    : interpreter_(std::move(interpreter))
    , timeout_(timeout) {}

bool HostSyntaxChecker::available() const {
    return find_executable(interpreter_).has_value();
}

Result<std::vector<std::string>> HostSyntaxChecker::check(std::string_view code) const {
    ProcessSpec spec;
    spec.argv = {interpreter_, "-c", std::string(kParseScript)};
    spec.stdin_data = std::string(code);
    spec.timeout = timeout_;
    spec.capture_limit_bytes = 64 * 1024;
    spec.address_space_bytes = kParserMemoryBytes;

    auto outcome = run_process(spec);
    if (!outcome) return outcome.error();

    if (outcome->timed_out) {
        return Error{ErrorCode::Timeout, "host syntax check timed out"};
    }
    if (outcome->exit_code != 0) {
        return Error{ErrorCode::Generic, "host syntax check failed: " + outcome->stderr_data};
    }

    std::vector<std::string> diagnostics;
    std::string_view text = outcome->stdout_data;
    while (!text.empty()) {
        auto end = text.find('\n');
        auto line = text.substr(0, end);
        if (!line.empty()) diagnostics.emplace_back(line);
        if (end == std::string_view::npos) break;
        text.remove_prefix(end + 1);
    }
    return diagnostics;
}

}  // namespace codelab
