/**
 * @file security_validator.hpp
 * @brief Static deny-list inspection of submitted source before it runs.
 * @author Dimitris Kafetzis
 *
 * Rules are regular expressions compiled once per validator and grouped by
 * threat category. Source is scanned line by line. The validator fails
 * closed: an internal error denies the submission.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codelab {

enum class ThreatCategory : uint8_t {
    BlockedImport,
    BlockedFunction,
    ProcessControl,
    Filesystem,
    Network,
    DynamicEvaluation,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ThreatCategory category) noexcept {
    switch (category) {
        case ThreatCategory::BlockedImport:     return "blocked_import";
        case ThreatCategory::BlockedFunction:   return "blocked_function";
        case ThreatCategory::ProcessControl:    return "process_control";
        case ThreatCategory::Filesystem:        return "filesystem";
        case ThreatCategory::Network:           return "network";
        case ThreatCategory::DynamicEvaluation: return "dynamic_evaluation";
        case ThreatCategory::Internal:          return "internal";
    }
    return "unknown";
}

struct SecurityVerdict {
    bool allowed = true;
    std::optional<std::string> reason;
    std::optional<ThreatCategory> category;
    size_t line = 0;                    ///< 1-based line of the first match, 0 if none

    [[nodiscard]] static SecurityVerdict allow() { return {}; }
    [[nodiscard]] static SecurityVerdict deny(ThreatCategory category, std::string reason,
                                              size_t line = 0);
};

class SecurityValidator {
public:
    static constexpr size_t kMaxScannedLine = 8192;

    explicit SecurityValidator(const SecurityConfig& config = SecurityConfig{});

    /**
     * @brief Inspect source for the given language.
     *
     * Never throws; any internal failure yields a denial whose reason
     * starts with "security validator error".
     */
    [[nodiscard]] SecurityVerdict validate(std::string_view code, Language language) const noexcept;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] size_t rule_count(Language language) const;

private:
    struct Rule {
        ThreatCategory category;
        std::string label;
        std::regex pattern;
    };

    using RuleSet = std::vector<Rule>;

    void add(Language language, ThreatCategory category, std::string label,
             const std::string& pattern);

    SecurityVerdict scan(std::string_view code, const RuleSet& rules) const;

    bool enabled_;
    std::unordered_map<Language, RuleSet> rules_;
};

}  // namespace codelab
