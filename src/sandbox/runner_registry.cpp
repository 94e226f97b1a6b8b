/**
 * @file runner_registry.cpp
 * @brief RunnerRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/runner_registry.hpp"

#include <string>

namespace codelab {

void RunnerRegistry::register_runner(std::unique_ptr<IRunner> runner) {
    if (!runner) return;
    auto language = runner->language();
    runners_[language] = std::move(runner);
}

Result<const IRunner*> RunnerRegistry::find(Language language) const {
    auto it = runners_.find(language);
    if (it == runners_.end()) {
        return Error{ErrorCode::UnsupportedLanguage,
                     "Unsupported language: " + std::string(to_string(language))};
    }
    return static_cast<const IRunner*>(it->second.get());
}

Result<const IRunner*> RunnerRegistry::resolve(std::string_view language_id) const {
    auto language = parse_language(language_id);
    if (!language) {
        return Error{ErrorCode::UnsupportedLanguage,
                     "Unsupported language: " + std::string(language_id)};
    }
    return find(*language);
}

bool RunnerRegistry::supports(Language language) const noexcept {
    return runners_.contains(language);
}

std::vector<Language> RunnerRegistry::languages() const {
    std::vector<Language> out;
    for (auto language : all_languages()) {
        if (supports(language)) out.push_back(language);
    }
    return out;
}

RunnerRegistry RunnerRegistry::from_config(const ToolchainConfig& toolchains) {
    RunnerRegistry registry;
    registry.register_runner(InterpretedRunner::python(toolchains.python));
    registry.register_runner(InterpretedRunner::javascript(toolchains.node));
    registry.register_runner(CompiledRunner::java(toolchains.javac, toolchains.java));
    registry.register_runner(CompiledRunner::c(toolchains.gcc));
    registry.register_runner(CompiledRunner::cpp(toolchains.gxx));
    if (!toolchains.jac.empty()) {
        registry.register_runner(InterpretedRunner::teaching(toolchains.jac));
    }
    return registry;
}

}  // namespace codelab
