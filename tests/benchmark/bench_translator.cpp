/**
 * @file bench_translator.cpp
 * @brief Performance benchmarks for dialect translation and security scanning.
 * @author Dimitris Kafetzis
 *
 * Measures translation latency in both directions, heuristic syntax
 * validation and the deny-list scan across program sizes.
 *
 * Usage: ./bench_translator [--csv]
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "sandbox/security_validator.hpp"
#include "translator/dialect_translator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace codelab;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Program Generators
// ─────────────────────────────────────────────

/// `n` teaching-dialect functions, each with a branch and a loop.
std::string teaching_program(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        auto id = std::to_string(i);
        out += "can f" + id + "(x) ->\n"
               "    var total = 0;\n"
               "    for i in range(x) ->\n"
               "        if i % 2 == 0 ->\n"
               "            total = total + i; // even\n"
               "        else ->\n"
               "            total = total - 1;\n"
               "        ye;\n"
               "    ye;\n"
               "    return total;\n"
               "ye;\n";
    }
    out += "print(f0(10));\n";
    return out;
}

std::string host_program(size_t n) {
    DialectTranslator translator;
    return translator.translate(teaching_program(n), TranslationDirection::TeachingToHost)
        .translated_code;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_translation() {
    std::vector<BenchResult> R;
    DialectTranslator translator;

    for (size_t n : {1, 10, 50, 200}) {
        auto teaching = teaching_program(n);
        auto host = host_program(n);
        auto label = std::to_string(teaching.size()) + " bytes";
        size_t iterations = n >= 200 ? 100 : 500;

        R.push_back(run_bench("teaching_to_host(" + std::to_string(n) + " fn)", "Translation",
            iterations,
            [&]{ auto r = translator.translate(teaching, TranslationDirection::TeachingToHost); (void)r; },
            label));
        R.push_back(run_bench("host_to_teaching(" + std::to_string(n) + " fn)", "Translation",
            iterations,
            [&]{ auto r = translator.translate(host, TranslationDirection::HostToTeaching); (void)r; },
            std::to_string(host.size()) + " bytes"));
    }
    return R;
}

std::vector<BenchResult> bench_validation() {
    std::vector<BenchResult> R;
    DialectTranslator translator;

    for (size_t n : {10, 200}) {
        auto teaching = teaching_program(n);
        auto host = host_program(n);

        R.push_back(run_bench("split_statements(" + std::to_string(n) + " fn)", "Syntax", 500,
            [&]{ auto s = translator.split_statements(teaching); (void)s; },
            std::to_string(teaching.size()) + " bytes"));
        R.push_back(run_bench("validate_teaching(" + std::to_string(n) + " fn)", "Syntax", 500,
            [&]{ auto p = translator.validate_syntax(teaching, Dialect::Teaching); (void)p; }));
        R.push_back(run_bench("validate_host(" + std::to_string(n) + " fn)", "Syntax", 500,
            [&]{ auto p = translator.validate_syntax(host, Dialect::Host); (void)p; }));
    }
    return R;
}

std::vector<BenchResult> bench_security() {
    std::vector<BenchResult> R;
    SecurityValidator validator(default_config().security);

    R.push_back(run_bench("construct_rule_tables", "Security", 100,
        [&]{ SecurityValidator v(default_config().security); (void)v; }));

    for (size_t n : {1, 10, 50}) {
        auto host = host_program(n);
        R.push_back(run_bench("scan_python(" + std::to_string(n) + " fn)", "Security", 200,
            [&]{ auto v = validator.validate(host, Language::Python); (void)v; },
            std::to_string(validator.rule_count(Language::Python)) + " rules"));
    }

    const std::string c_source =
        "#include <stdio.h>\n"
        "int fib(int n) { return n < 2 ? n : fib(n - 1) + fib(n - 2); }\n"
        "int main(void) { printf(\"%d\\n\", fib(20)); return 0; }\n";
    const std::string js_source =
        "const xs = [1, 2, 3, 4];\n"
        "console.log(xs.map(x => x * x).reduce((a, b) => a + b, 0));\n";

    R.push_back(run_bench("scan_c(small)", "Security", 1000,
        [&]{ auto v = validator.validate(c_source, Language::C); (void)v; },
        std::to_string(validator.rule_count(Language::C)) + " rules"));
    R.push_back(run_bench("scan_javascript(small)", "Security", 1000,
        [&]{ auto v = validator.validate(js_source, Language::JavaScript); (void)v; },
        std::to_string(validator.rule_count(Language::JavaScript)) + " rules"));
    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  CodeLab Translator Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_translation());
    append(bench_validation());
    append(bench_security());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
