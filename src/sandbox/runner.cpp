/**
 * @file runner.cpp
 * @brief InterpretedRunner and CompiledRunner implementations.
 * @author Dimitris Kafetzis
 */

#include "sandbox/runner.hpp"

#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

namespace codelab {

namespace {

constexpr std::string_view kNativeBinary = "main.out";
constexpr uint64_t kMiB = 1024 * 1024;

Result<std::filesystem::path> write_source(const std::filesystem::path& workspace,
                                           const std::string& filename,
                                           std::string_view code) {
    auto target = workspace / filename;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::Io, "cannot create " + target.string()};
    }
    out.write(code.data(), static_cast<std::streamsize>(code.size()));
    out.close();
    if (!out) {
        return Error{ErrorCode::Io, "cannot write " + target.string()};
    }
    return target;
}

/**
 * @brief run_process with the missing-toolchain message callers expect.
 */
Result<ProcessOutcome> spawn(const ProcessSpec& spec, std::stop_token stop,
                             const std::string& tool) {
    auto outcome = run_process(spec, std::move(stop));
    if (!outcome && outcome.error().code == ErrorCode::SpawnFailed) {
        return Error{ErrorCode::SpawnFailed, tool + " is not installed in the sandbox environment"};
    }
    return outcome;
}

/**
 * @brief Removes compiler output when a compiled run ends, however it ends.
 */
class BuildProducts {
public:
    BuildProducts(std::filesystem::path dir, bool jvm) : dir_(std::move(dir)), jvm_(jvm) {}

    ~BuildProducts() {
        std::error_code ec;
        if (!jvm_) {
            std::filesystem::remove(dir_ / kNativeBinary, ec);
            return;
        }
        std::vector<std::filesystem::path> classes;
        for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() == ".class") classes.push_back(it->path());
        }
        for (const auto& path : classes) {
            std::filesystem::remove(path, ec);
        }
    }

    BuildProducts(const BuildProducts&) = delete;
    BuildProducts& operator=(const BuildProducts&) = delete;

private:
    std::filesystem::path dir_;
    bool jvm_;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// InterpretedRunner
// ─────────────────────────────────────────────

InterpretedRunner::InterpretedRunner(Language language, std::string interpreter,
                                     std::vector<std::string> leading_args,
                                     std::string extension, MemoryCap memory_cap)
    : language_(language)
    , interpreter_(std::move(interpreter))
    , leading_args_(std::move(leading_args))
    , extension_(std::move(extension))
    , memory_cap_(memory_cap) {}

std::unique_ptr<InterpretedRunner> InterpretedRunner::python(std::string interpreter) {
    return std::make_unique<InterpretedRunner>(Language::Python, std::move(interpreter),
                                               std::vector<std::string>{"-u"}, ".py");
}

std::unique_ptr<InterpretedRunner> InterpretedRunner::javascript(std::string interpreter) {
    return std::make_unique<InterpretedRunner>(Language::JavaScript, std::move(interpreter),
                                               std::vector<std::string>{}, ".js",
                                               MemoryCap::NodeHeapFlag);
}

std::unique_ptr<InterpretedRunner> InterpretedRunner::teaching(std::string interpreter) {
    return std::make_unique<InterpretedRunner>(Language::Jac, std::move(interpreter),
                                               std::vector<std::string>{"run"}, ".jac");
}

Result<std::filesystem::path> InterpretedRunner::prepare(
    std::string_view code, const std::filesystem::path& workspace) const {
    return write_source(workspace, "main" + extension_, code);
}

Result<RawRunResult> InterpretedRunner::run(const std::filesystem::path& artifact,
                                            const RunLimits& limits,
                                            std::string_view stdin_data,
                                            std::stop_token stop) const {
    ProcessSpec spec;
    spec.argv.push_back(interpreter_);
    if (memory_cap_ == MemoryCap::NodeHeapFlag && limits.memory_limit_bytes) {
        spec.argv.push_back("--max-old-space-size="
                            + std::to_string(*limits.memory_limit_bytes / kMiB));
    }
    spec.argv.insert(spec.argv.end(), leading_args_.begin(), leading_args_.end());
    spec.argv.push_back(artifact.filename().string());

    spec.working_dir = artifact.parent_path();
    spec.stdin_data = std::string(stdin_data);
    spec.timeout = limits.run_timeout;
    spec.capture_limit_bytes = limits.capture_limit_bytes;
    spec.cpu_seconds = limits.cpu_seconds;
    if (memory_cap_ == MemoryCap::AddressSpace) {
        spec.address_space_bytes = limits.memory_limit_bytes;
    }

    auto outcome = spawn(spec, std::move(stop), interpreter_);
    if (!outcome) return outcome.error();

    RawRunResult raw;
    raw.process = std::move(*outcome);
    return raw;
}

// ─────────────────────────────────────────────
// CompiledRunner
// ─────────────────────────────────────────────

CompiledRunner::CompiledRunner(ConstructionKey, Language language, std::string extension,
                               std::string compiler, std::vector<std::string> compile_flags,
                               std::vector<std::string> link_flags, std::string launcher)
    : language_(language)
    , extension_(std::move(extension))
    , compiler_(std::move(compiler))
    , compile_flags_(std::move(compile_flags))
    , link_flags_(std::move(link_flags))
    , launcher_(std::move(launcher)) {}

std::unique_ptr<CompiledRunner> CompiledRunner::c(std::string gcc) {
    return std::make_unique<CompiledRunner>(ConstructionKey{}, Language::C, ".c", std::move(gcc),
                                            std::vector<std::string>{"-O2"},
                                            std::vector<std::string>{"-lm"}, std::string{});
}

std::unique_ptr<CompiledRunner> CompiledRunner::cpp(std::string gxx) {
    return std::make_unique<CompiledRunner>(ConstructionKey{}, Language::Cpp, ".cpp", std::move(gxx),
                                            std::vector<std::string>{"-std=c++17", "-O2"},
                                            std::vector<std::string>{}, std::string{});
}

std::unique_ptr<CompiledRunner> CompiledRunner::java(std::string javac, std::string java) {
    return std::make_unique<CompiledRunner>(ConstructionKey{}, Language::Java, ".java",
                                            std::move(javac),
                                            std::vector<std::string>{"-encoding", "UTF-8"},
                                            std::vector<std::string>{}, std::move(java));
}

std::string CompiledRunner::java_class_name(std::string_view code) {
    // Token walk for `public [final|abstract]* class <Name>`; any other
    // token between the keywords restarts the search.
    enum class Expect : uint8_t { Public, ClassOrModifier, Name };
    const auto word_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
    };

    Expect expect = Expect::Public;
    size_t pos = 0;
    while (pos < code.size()) {
        const char c = code[pos];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++pos;
            continue;
        }
        if (!word_char(c)) {
            expect = Expect::Public;
            ++pos;
            continue;
        }
        size_t end = pos;
        while (end < code.size() && word_char(code[end])) ++end;
        const auto word = code.substr(pos, end - pos);
        pos = end;

        if (expect == Expect::Name
            && std::isdigit(static_cast<unsigned char>(word.front())) == 0) {
            return std::string(word);
        }
        if (word == "public") {
            expect = Expect::ClassOrModifier;
        } else if (expect == Expect::ClassOrModifier && word == "class") {
            expect = Expect::Name;
        } else if (expect != Expect::ClassOrModifier || (word != "final" && word != "abstract")) {
            expect = Expect::Public;
        }
    }
    return "Main";
}

Result<std::filesystem::path> CompiledRunner::prepare(
    std::string_view code, const std::filesystem::path& workspace) const {
    const std::string stem = is_jvm() ? java_class_name(code) : std::string("main");
    return write_source(workspace, stem + extension_, code);
}

Result<RawRunResult> CompiledRunner::run(const std::filesystem::path& artifact,
                                         const RunLimits& limits,
                                         std::string_view stdin_data,
                                         std::stop_token stop) const {
    const auto dir = artifact.parent_path();
    BuildProducts products(dir, is_jvm());

    // ── Compile ──────────────────────────────
    ProcessSpec compile;
    compile.argv.push_back(compiler_);
    compile.argv.insert(compile.argv.end(), compile_flags_.begin(), compile_flags_.end());
    compile.argv.push_back(artifact.filename().string());
    if (!is_jvm()) {
        compile.argv.emplace_back("-o");
        compile.argv.emplace_back(kNativeBinary);
    }
    compile.argv.insert(compile.argv.end(), link_flags_.begin(), link_flags_.end());
    compile.working_dir = dir;
    compile.timeout = is_jvm() ? limits.java_compile_timeout : limits.compile_timeout;
    compile.capture_limit_bytes = limits.capture_limit_bytes;

    auto compiled = spawn(compile, stop, compiler_);
    if (!compiled) return compiled.error();

    RawRunResult raw;
    if (compiled->cancelled || compiled->timed_out || compiled->exit_code != 0) {
        raw.compile_failed = !compiled->cancelled;
        raw.compile_timed_out = compiled->timed_out;
        raw.process = std::move(*compiled);
        return raw;
    }

    // ── Run ──────────────────────────────────
    ProcessSpec program;
    if (is_jvm()) {
        program.argv.push_back(launcher_);
        if (limits.memory_limit_bytes) {
            program.argv.push_back("-Xmx" + std::to_string(*limits.memory_limit_bytes / kMiB) + "m");
        }
        program.argv.emplace_back("-cp");
        program.argv.push_back(dir.string());
        program.argv.push_back(artifact.stem().string());
    } else {
        program.argv.push_back((dir / kNativeBinary).string());
        program.address_space_bytes = limits.memory_limit_bytes;
    }
    program.working_dir = dir;
    program.stdin_data = std::string(stdin_data);
    program.timeout = limits.run_timeout;
    program.capture_limit_bytes = limits.capture_limit_bytes;
    program.cpu_seconds = limits.cpu_seconds;

    auto ran = spawn(program, std::move(stop), is_jvm() ? launcher_ : compiler_);
    if (!ran) return ran.error();

    raw.process = std::move(*ran);
    return raw;
}

}  // namespace codelab
