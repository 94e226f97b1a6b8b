/**
 * @file types.cpp
 * @brief Identifier parsing for languages, dialects and directions.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace codelab {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
            == std::tolower(static_cast<unsigned char>(y));
    });
}

constexpr std::array<std::pair<std::string_view, Language>, 13> kLanguageAliases{{
    {"python", Language::Python},
    {"py", Language::Python},
    {"python3", Language::Python},
    {"javascript", Language::JavaScript},
    {"js", Language::JavaScript},
    {"node", Language::JavaScript},
    {"java", Language::Java},
    {"c", Language::C},
    {"cpp", Language::Cpp},
    {"c++", Language::Cpp},
    {"cxx", Language::Cpp},
    {"jac", Language::Jac},
    {"teaching", Language::Jac},
}};

}  // anonymous namespace

std::optional<Language> parse_language(std::string_view id) noexcept {
    for (const auto& [alias, lang] : kLanguageAliases) {
        if (iequals(alias, id)) return lang;
    }
    return std::nullopt;
}

const std::vector<Language>& all_languages() {
    static const std::vector<Language> languages{
        Language::Python, Language::JavaScript, Language::Java,
        Language::C, Language::Cpp, Language::Jac
    };
    return languages;
}

std::optional<Dialect> parse_dialect(std::string_view id) noexcept {
    if (id == "teaching" || id == "jac") return Dialect::Teaching;
    if (id == "host" || id == "python") return Dialect::Host;
    return std::nullopt;
}

std::optional<TranslationDirection> parse_direction(std::string_view id) noexcept {
    if (id == "teaching_to_host" || id == "jac_to_python") {
        return TranslationDirection::TeachingToHost;
    }
    if (id == "host_to_teaching" || id == "python_to_jac") {
        return TranslationDirection::HostToTeaching;
    }
    return std::nullopt;
}

ExecutionResult make_rejection(ExecutionStatus status, std::string message, int exit_code) {
    ExecutionResult result;
    result.status = status;
    result.stderr_data = std::move(message);
    result.exit_code = exit_code;
    return result;
}

}  // namespace codelab
