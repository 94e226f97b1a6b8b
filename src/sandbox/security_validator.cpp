/**
 * @file security_validator.cpp
 * @brief SecurityValidator implementation and the built-in deny-lists.
 * @author Dimitris Kafetzis
 */

#include "sandbox/security_validator.hpp"

#include <exception>
#include <utility>

namespace codelab {

namespace {

std::string regex_escape(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (kSpecial.find(c) != std::string_view::npos) out += '\\';
        out += c;
    }
    return out;
}

std::string_view describe(ThreatCategory category) noexcept {
    switch (category) {
        case ThreatCategory::ProcessControl:    return "process control";
        case ThreatCategory::Filesystem:        return "filesystem";
        case ThreatCategory::Network:           return "network";
        case ThreatCategory::DynamicEvaluation: return "dynamic evaluation";
        default:                                return "forbidden";
    }
}

std::string python_import_pattern(std::string_view module) {
    return R"((?:^|;)\s*(?:import\s+(?:[\w.]+(?:\s+as\s+\w+)?\s*,\s*)*|from\s+))"
           + regex_escape(module) + R"(\b)";
}

std::string teaching_import_pattern(std::string_view module) {
    return R"((?:^|;)\s*import\b[^;]*\b)" + regex_escape(module) + R"(\b)";
}

std::string call_pattern(std::string_view function) {
    return R"((?:^|[^\w.])\s*)" + regex_escape(function) + R"(\s*\()";
}

std::string js_module_pattern(std::string_view module) {
    return R"((?:require\s*\(\s*|from\s+|import\s*\(\s*|import\s+)['"`](?:node:)?)"
           + regex_escape(module) + R"((?:/[\w/]*)?['"`])";
}

}  // anonymous namespace

SecurityVerdict SecurityVerdict::deny(ThreatCategory category, std::string reason, size_t line) {
    SecurityVerdict verdict;
    verdict.allowed = false;
    verdict.reason = std::move(reason);
    verdict.category = category;
    verdict.line = line;
    return verdict;
}

// ─────────────────────────────────────────────
// Rule Tables
// ─────────────────────────────────────────────

SecurityValidator::SecurityValidator(const SecurityConfig& config)
    : enabled_(config.enabled) {
    using enum ThreatCategory;

    // ── Python and the teaching dialect (a Python superset) ──
    for (auto language : {Language::Python, Language::Jac}) {
        for (const auto& module : config.blocked_imports) {
            add(language, BlockedImport, module,
                language == Language::Python ? python_import_pattern(module)
                                             : teaching_import_pattern(module));
        }
        for (const auto& function : config.blocked_functions) {
            add(language, BlockedFunction, function, call_pattern(function));
        }

        add(language, ProcessControl, "os process call",
            R"(\bos\s*\.\s*(?:system|popen|exec\w*|spawn\w*|fork\w*|kill\w*)\b)");
        add(language, ProcessControl, "subprocess", R"(\bsubprocess\s*\.)");
        add(language, ProcessControl, "pty.spawn", R"(\bpty\s*\.\s*spawn\b)");

        add(language, Filesystem, "shutil", R"(\bshutil\s*\.\s*(?:rmtree|move|copy\w*|chown)\b)");
        add(language, Filesystem, "os file mutation",
            R"(\bos\s*\.\s*(?:remove|unlink|rmdir|removedirs|rename|chmod|chown)\b)");
        add(language, Filesystem, "pathlib", R"(\bpathlib\b)");

        add(language, Network, "socket", R"(\bsocket\s*\.\s*socket\b)");
        add(language, Network, "network module",
            R"(\b(?:urllib|requests|httplib|http\.client|smtplib|ftplib|telnetlib|poplib|imaplib)\b)");

        add(language, DynamicEvaluation, "__builtins__", R"(\b__builtins__\b)");
        add(language, DynamicEvaluation, "__subclasses__", R"(\b__subclasses__\b)");
        add(language, DynamicEvaluation, "globals()", R"(\b(?:globals|locals)\s*\(\s*\))");
        add(language, DynamicEvaluation, "serialisation module", R"(\b(?:pickle|marshal|shelve)\b)");
        add(language, DynamicEvaluation, "breakpoint()", R"(\bbreakpoint\s*\()");
    }

    // ── JavaScript ──
    add(Language::JavaScript, ProcessControl, "child_process", js_module_pattern("child_process"));
    add(Language::JavaScript, ProcessControl, "worker_threads", js_module_pattern("worker_threads"));
    add(Language::JavaScript, ProcessControl, "cluster", js_module_pattern("cluster"));
    add(Language::JavaScript, ProcessControl, "process control",
        R"(\bprocess\s*\.\s*(?:exit|kill|abort|binding|dlopen|chdir|setuid|setgid)\b)");
    add(Language::JavaScript, Filesystem, "fs", js_module_pattern("fs"));
    for (const char* module : {"net", "http", "https", "http2", "dgram", "tls", "dns"}) {
        add(Language::JavaScript, Network, module, js_module_pattern(module));
    }
    add(Language::JavaScript, Network, "fetch",
        R"(\b(?:fetch\s*\(|new\s+(?:XMLHttpRequest|WebSocket)\b))");
    add(Language::JavaScript, DynamicEvaluation, "vm", js_module_pattern("vm"));
    add(Language::JavaScript, DynamicEvaluation, "eval", R"((?:^|[^\w.$])eval\s*\()");
    add(Language::JavaScript, DynamicEvaluation, "Function constructor",
        R"(\bnew\s+Function\s*\(|\bFunction\s*\(\s*['"`])");

    // ── Java ──
    add(Language::Java, ProcessControl, "Runtime.getRuntime", R"(\bRuntime\s*\.\s*getRuntime\b)");
    add(Language::Java, ProcessControl, "ProcessBuilder", R"(\bProcess(?:Builder|Handle)\b)");
    add(Language::Java, ProcessControl, "System.exit", R"(\bSystem\s*\.\s*exit\s*\()");
    add(Language::Java, Filesystem, "java.nio.file", R"(\bjava\s*\.\s*nio\s*\.\s*file\b)");
    add(Language::Java, Filesystem, "file stream",
        R"(\bnew\s+(?:File|FileWriter|FileOutputStream|FileInputStream|FileReader|RandomAccessFile)\s*\()");
    add(Language::Java, Filesystem, "Files", R"(\bFiles\s*\.\s*\w+\s*\()");
    add(Language::Java, Network, "java.net", R"(\bjava\s*\.\s*net\b)");
    add(Language::Java, Network, "socket",
        R"(\b(?:Socket|ServerSocket|DatagramSocket|HttpURLConnection|HttpClient)\b)");
    add(Language::Java, DynamicEvaluation, "reflection",
        R"(\bClass\s*\.\s*forName\b|\bjava\s*\.\s*lang\s*\.\s*reflect\b|\bsetAccessible\s*\()");
    add(Language::Java, DynamicEvaluation, "native library", R"(\bSystem\s*\.\s*(?:loadLibrary|load)\s*\()");

    // ── C and C++ ──
    for (auto language : {Language::C, Language::Cpp}) {
        add(language, ProcessControl, "process call",
            R"((?:^|[^\w.>])(?:system|popen|fork|vfork|execl|execlp|execle|execv|execvp|execvpe|execve|kill|ptrace|setuid|setgid|daemon)\s*\()");
        add(language, ProcessControl, "process header",
            R"(#\s*include\s*<\s*(?:unistd|spawn|sys/ptrace|sys/wait)\.h\s*>)");
        add(language, Filesystem, "file mutation",
            R"((?:^|[^\w.>:])(?:remove|unlink|rmdir|rename|chmod|chown|truncate)\s*\()");
        add(language, Filesystem, "std::filesystem",
            R"(\bstd\s*::\s*filesystem\b|#\s*include\s*<\s*filesystem\s*>)");
        add(language, Network, "socket header",
            R"(#\s*include\s*<\s*(?:sys/socket|netinet/\w+|arpa/inet|netdb)\.h\s*>)");
        add(language, Network, "socket call",
            R"((?:^|[^\w.>:])(?:socket|connect|bind|listen|accept)\s*\()");
        add(language, DynamicEvaluation, "dynamic loading",
            R"((?:^|[^\w.>:])(?:dlopen|dlsym|syscall)\s*\(|#\s*include\s*<\s*dlfcn\.h\s*>)");
        add(language, DynamicEvaluation, "inline assembly",
            R"(\b(?:__asm__|__asm|asm)\s*(?:volatile\s*)?\()");
    }
}

void SecurityValidator::add(Language language, ThreatCategory category, std::string label,
                            const std::string& pattern) {
    rules_[language].push_back(Rule{category, std::move(label),
                                    std::regex(pattern, std::regex::ECMAScript | std::regex::optimize)});
}

size_t SecurityValidator::rule_count(Language language) const {
    auto it = rules_.find(language);
    return it == rules_.end() ? 0 : it->second.size();
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

SecurityVerdict SecurityValidator::validate(std::string_view code, Language language) const noexcept {
    try {
        if (!enabled_) return SecurityVerdict::allow();
        auto it = rules_.find(language);
        if (it == rules_.end()) return SecurityVerdict::allow();
        return scan(code, it->second);
    } catch (const std::exception& e) {
        return SecurityVerdict::deny(ThreatCategory::Internal,
                                     std::string("security validator error: ") + e.what());
    }
}

SecurityVerdict SecurityValidator::scan(std::string_view code, const RuleSet& rules) const {
    size_t line_no = 0;
    size_t start = 0;
    while (start <= code.size()) {
        auto end = code.find('\n', start);
        if (end == std::string_view::npos) end = code.size();
        auto line = code.substr(start, end - start);
        ++line_no;
        start = end + 1;

        if (line.size() > kMaxScannedLine) {
            return SecurityVerdict::deny(ThreatCategory::Internal,
                "Line " + std::to_string(line_no) + " exceeds "
                + std::to_string(kMaxScannedLine) + " characters", line_no);
        }

        for (const auto& rule : rules) {
            if (!std::regex_search(line.begin(), line.end(), rule.pattern)) continue;

            std::string reason;
            switch (rule.category) {
                case ThreatCategory::BlockedImport:
                    reason = "Import '" + rule.label + "' is blocked";
                    break;
                case ThreatCategory::BlockedFunction:
                    reason = "Function '" + rule.label + "' is blocked";
                    break;
                default:
                    reason = "Dangerous " + std::string(describe(rule.category))
                           + " pattern '" + rule.label + "' detected";
                    break;
            }
            reason += " (line " + std::to_string(line_no) + ")";
            return SecurityVerdict::deny(rule.category, std::move(reason), line_no);
        }
    }
    return SecurityVerdict::allow();
}

}  // namespace codelab
