/**
 * @file runner.hpp
 * @brief Per-language runners: source preparation plus compile/run steps.
 * @author Dimitris Kafetzis
 *
 * IRunner is the only seam between the executor and a toolchain. Runners are
 * immutable after construction and shared by all request threads.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/process.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace codelab {

/**
 * @brief Resource bounds applied to one request.
 */
struct RunLimits {
    std::chrono::milliseconds run_timeout{30000};
    std::chrono::milliseconds compile_timeout{30000};
    std::chrono::milliseconds java_compile_timeout{10000};
    std::optional<uint64_t> memory_limit_bytes;     ///< Unset when enforcement is off
    std::optional<uint32_t> cpu_seconds;
    uint64_t capture_limit_bytes = 10240;
};

/**
 * @brief Raw outcome of a runner, before status mapping.
 *
 * When compile_failed is set, `process` is the compiler's outcome and the
 * program never ran.
 */
struct RawRunResult {
    ProcessOutcome process;
    bool compile_failed = false;
    bool compile_timed_out = false;
};

// ─────────────────────────────────────────────
// IRunner (Virtual, one per language)
// ─────────────────────────────────────────────

class IRunner {
public:
    virtual ~IRunner() = default;

    [[nodiscard]] virtual Language language() const noexcept = 0;
    [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

    /// Name of the executable that must be installed.
    [[nodiscard]] virtual const std::string& tool() const noexcept = 0;

    /**
     * @brief Write the source into the workspace; returns the artifact path.
     */
    [[nodiscard]] virtual Result<std::filesystem::path> prepare(
        std::string_view code, const std::filesystem::path& workspace) const = 0;

    /**
     * @brief Compile (if needed) and run the prepared artifact.
     *
     * A missing toolchain yields ErrorCode::SpawnFailed with the message
     * "<tool> is not installed in the sandbox environment".
     */
    [[nodiscard]] virtual Result<RawRunResult> run(const std::filesystem::path& artifact,
                                                   const RunLimits& limits,
                                                   std::string_view stdin_data,
                                                   std::stop_token stop) const = 0;
};

// ─────────────────────────────────────────────
// InterpretedRunner
// ─────────────────────────────────────────────

/**
 * @brief Runs the source file directly through an interpreter.
 */
class InterpretedRunner : public IRunner {
public:
    enum class MemoryCap : uint8_t {
        AddressSpace,       ///< RLIMIT_AS
        NodeHeapFlag        ///< --max-old-space-size; V8 reserves more address space than it uses
    };

    InterpretedRunner(Language language, std::string interpreter,
                      std::vector<std::string> leading_args, std::string extension,
                      MemoryCap memory_cap = MemoryCap::AddressSpace);

    static std::unique_ptr<InterpretedRunner> python(std::string interpreter);
    static std::unique_ptr<InterpretedRunner> javascript(std::string interpreter);
    static std::unique_ptr<InterpretedRunner> teaching(std::string interpreter);

    [[nodiscard]] Language language() const noexcept override { return language_; }
    [[nodiscard]] std::string_view file_extension() const noexcept override { return extension_; }
    [[nodiscard]] const std::string& tool() const noexcept override { return interpreter_; }

    [[nodiscard]] Result<std::filesystem::path> prepare(
        std::string_view code, const std::filesystem::path& workspace) const override;

    [[nodiscard]] Result<RawRunResult> run(const std::filesystem::path& artifact,
                                           const RunLimits& limits,
                                           std::string_view stdin_data,
                                           std::stop_token stop) const override;

private:
    Language language_;
    std::string interpreter_;
    std::vector<std::string> leading_args_;
    std::string extension_;
    MemoryCap memory_cap_;
};

// ─────────────────────────────────────────────
// CompiledRunner
// ─────────────────────────────────────────────

/**
 * @brief Compiles in the workspace, then runs the product.
 *
 * Native programs are linked to `main.out`; JVM sources are named after
 * their public class and launched with `java -cp`. Build products are
 * removed as soon as the run finishes.
 */
class CompiledRunner : public IRunner {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Use the c(), cpp() and java() factories.
    CompiledRunner(ConstructionKey, Language language, std::string extension, std::string compiler,
                   std::vector<std::string> compile_flags, std::vector<std::string> link_flags,
                   std::string launcher);

    static std::unique_ptr<CompiledRunner> c(std::string gcc);
    static std::unique_ptr<CompiledRunner> cpp(std::string gxx);
    static std::unique_ptr<CompiledRunner> java(std::string javac, std::string java);

    [[nodiscard]] Language language() const noexcept override { return language_; }
    [[nodiscard]] std::string_view file_extension() const noexcept override { return extension_; }
    [[nodiscard]] const std::string& tool() const noexcept override { return compiler_; }

    [[nodiscard]] Result<std::filesystem::path> prepare(
        std::string_view code, const std::filesystem::path& workspace) const override;

    [[nodiscard]] Result<RawRunResult> run(const std::filesystem::path& artifact,
                                           const RunLimits& limits,
                                           std::string_view stdin_data,
                                           std::stop_token stop) const override;

    /// Public class name declared in Java source, "Main" when there is none.
    [[nodiscard]] static std::string java_class_name(std::string_view code);

private:
    [[nodiscard]] bool is_jvm() const noexcept { return !launcher_.empty(); }

    Language language_;
    std::string extension_;
    std::string compiler_;
    std::vector<std::string> compile_flags_;
    std::vector<std::string> link_flags_;
    std::string launcher_;              ///< "java" for JVM targets, empty for native
};

}  // namespace codelab
