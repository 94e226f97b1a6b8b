/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace codelab;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "codelab_test_config";
        std::filesystem::create_directories(temp_dir_);
        for (const char* name : kEnvVars) ::unsetenv(name);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        for (const char* name : kEnvVars) ::unsetenv(name);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    static constexpr const char* kEnvVars[] = {
        "SANDBOX_TIMEOUT", "MAX_MEMORY_MB", "MAX_OUTPUT_SIZE", "SANDBOX_PORT", "JAC_EXECUTOR_PATH"
    };
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.sandbox.timeout_s, 30u);
    EXPECT_EQ(config.sandbox.max_memory_mb, 128u);
    EXPECT_EQ(config.sandbox.max_output_bytes, 10240u);
    EXPECT_EQ(config.sandbox.max_code_bytes, 102400u);
    EXPECT_TRUE(config.security.enabled);
    EXPECT_TRUE(config.toolchains.jac.empty());
    EXPECT_EQ(config.sandbox.run_timeout(), std::chrono::seconds(30));
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [server]
        host = "127.0.0.1"
        port = 9090
        worker_threads = 2
        max_pending_requests = 8
        max_request_bytes = 4096
        max_sessions = 3

        [sandbox]
        timeout_s = 5
        compile_timeout_s = 20
        max_memory_mb = 64
        enforce_memory_limit = false
        max_output_bytes = 2048
        scratch_dir = "/tmp/codelab"

        [toolchains]
        python = "/usr/bin/python3"
        jac = "/opt/jac/bin/jac"

        [security]
        enabled = true
        blocked_imports = ["os", "ctypes"]
        blocked_functions = ["eval"]

        [translator]
        native_host_check = true

        [telemetry]
        log_dir = "/tmp/codelab_logs"
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.worker_threads, 2u);
    EXPECT_EQ(config.server.max_pending_requests, 8u);
    EXPECT_EQ(config.server.max_request_bytes, 4096u);
    EXPECT_EQ(config.server.max_sessions, 3u);
    EXPECT_EQ(config.sandbox.timeout_s, 5u);
    EXPECT_EQ(config.sandbox.compile_timeout_s, 20u);
    EXPECT_EQ(config.sandbox.max_memory_mb, 64u);
    EXPECT_FALSE(config.sandbox.enforce_memory_limit);
    EXPECT_EQ(config.sandbox.max_output_bytes, 2048u);
    EXPECT_EQ(config.sandbox.scratch_dir.string(), "/tmp/codelab");
    EXPECT_EQ(config.toolchains.python, "/usr/bin/python3");
    EXPECT_EQ(config.toolchains.jac, "/opt/jac/bin/jac");
    EXPECT_EQ(config.toolchains.gcc, "gcc");
    ASSERT_EQ(config.security.blocked_imports.size(), 2u);
    EXPECT_EQ(config.security.blocked_imports[1], "ctypes");
    ASSERT_EQ(config.security.blocked_functions.size(), 1u);
    EXPECT_TRUE(config.translator.native_host_check);
    EXPECT_EQ(config.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [sandbox]
        timeout_s = 12
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->sandbox.timeout_s, 12u);
    // Defaults for everything else
    EXPECT_EQ(result->server.port, 8080);
    EXPECT_EQ(result->sandbox.max_output_bytes, 10240u);
    EXPECT_FALSE(result->security.blocked_imports.empty());
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("SANDBOX_TIMEOUT", "7", 1);
    ::setenv("MAX_MEMORY_MB", "256", 1);
    ::setenv("MAX_OUTPUT_SIZE", "500", 1);
    ::setenv("SANDBOX_PORT", "9191", 1);
    ::setenv("JAC_EXECUTOR_PATH", "/usr/local/bin/jac", 1);

    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config).has_value());
    EXPECT_EQ(config.sandbox.timeout_s, 7u);
    EXPECT_EQ(config.sandbox.max_memory_mb, 256u);
    EXPECT_EQ(config.sandbox.max_output_bytes, 500u);
    EXPECT_EQ(config.server.port, 9191);
    EXPECT_EQ(config.toolchains.jac, "/usr/local/bin/jac");
}

TEST_F(ConfigTest, MalformedEnvironmentValueIsReportedAndIgnored) {
    ::setenv("SANDBOX_TIMEOUT", "soon", 1);
    ::setenv("MAX_MEMORY_MB", "512", 1);

    auto config = default_config();
    auto result = apply_env_overrides(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("SANDBOX_TIMEOUT"), std::string::npos);
    EXPECT_EQ(config.sandbox.timeout_s, 30u);
    EXPECT_EQ(config.sandbox.max_memory_mb, 512u);
}
