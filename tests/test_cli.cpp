/**
 * @file test_cli.cpp
 * @brief Tests for argument parsing and command exit codes
 */

#include "test_framework.h"
#include "core/command.h"
#include "core/commands.hpp"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

// Parse and dispatch words as if given after the program name.
// Returns -1 when argument parsing fails.
static int run_command(std::vector<std::string> words) {
    words.insert(words.begin(), "tsanalyzer");

    std::vector<char *> argv;
    for (auto &word : words) {
        argv.push_back(&word[0]);
    }
    argv.push_back(nullptr);

    tsanalyzer_context_t ctx;
    int result = -1;
    if (tsanalyzer_parse_args(static_cast<int>(words.size()), argv.data(), &ctx)) {
        result = tsanalyzer_dispatch_command(&ctx);
    }
    tsanalyzer_free_args(&ctx.args);

    // Commands may change the process-wide verbosity
    tsanalyzer_set_verbosity("normal");
    return result;
}

static bool write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

// ============================================================================
// Argument parsing
// ============================================================================

TEST(Cli, ParseArgsOptions) {
    std::vector<std::string> words = {"tsanalyzer", "analyze", "build.log",
                                      "--no-color", "--extended", "-q",
                                      "--config=ci.toml"};
    std::vector<char *> argv;
    for (auto &word : words) {
        argv.push_back(&word[0]);
    }

    tsanalyzer_context_t ctx;
    cf_assert(tsanalyzer_parse_args(static_cast<int>(argv.size()), argv.data(), &ctx));
    cf_assert(strcmp(ctx.args.command, "analyze") == 0);
    cf_assert(ctx.args.arg_count == 1);
    cf_assert(strcmp(ctx.args.args[0], "build.log") == 0);
    cf_assert(ctx.args.args[1] == nullptr);
    cf_assert(ctx.args.no_color);
    cf_assert(ctx.args.extended);
    cf_assert(strcmp(ctx.args.verbosity, "quiet") == 0);
    cf_assert(strcmp(ctx.args.config, "ci.toml") == 0);
    tsanalyzer_free_args(&ctx.args);
    cf_assert(ctx.args.args == nullptr);
    return 0;
}

TEST(Cli, ParseArgsMissingValue) {
    cf_assert(run_command({"analyze", "build.log", "--config"}) == -1);
    cf_assert(run_command({"analyze", "-c"}) == -1);
    cf_assert(run_command({"analyze", "--verbosity"}) == -1);
    return 0;
}

TEST(Cli, UnknownCommand) {
    cf_assert(run_command({"frobnicate"}) == 1);
    return 0;
}

// ============================================================================
// explain
// ============================================================================

TEST(Cli, ExplainRequiresCode) {
    cf_assert(run_command({"explain"}) == 1);
    return 0;
}

TEST(Cli, ExplainCode) {
    cf_assert(run_command({"explain", "TS2304"}) == 0);
    cf_assert(run_command({"explain", "TS2304", "--extended"}) == 0);
    cf_assert(run_command({"explain", "TS9999"}) == 0);
    return 0;
}

// ============================================================================
// analyze
// ============================================================================

TEST(Cli, AnalyzeMissingInput) {
    cf_assert(run_command({"analyze", "does/not/exist.log", "-q"}) == 1);
    return 0;
}

TEST(Cli, AnalyzeMissingConfig) {
    const std::string log_path = "tsanalyzer_cli_config_test.log";
    cf_assert(write_file(log_path,
                         "src/a.ts(1,5): error TS2322: Type 'string' is not "
                         "assignable to type 'number'.\n"));

    int result = run_command({"analyze", log_path, "--config",
                              "does/not/exist.toml", "-q"});
    std::remove(log_path.c_str());

    cf_assert(result == 1);
    return 0;
}

TEST(Cli, AnalyzeInvalidConfig) {
    const std::string log_path = "tsanalyzer_cli_invalid_test.log";
    const std::string config_path = "tsanalyzer_cli_invalid_test.toml";
    cf_assert(write_file(log_path, "a.ts(1,1): error TS2304: Cannot find name 'x'.\n"));
    cf_assert(write_file(config_path, "[output\ncolor = "));

    int result = run_command({"analyze", log_path, "-c", config_path, "-q"});
    std::remove(log_path.c_str());
    std::remove(config_path.c_str());

    cf_assert(result == 1);
    return 0;
}

TEST(Cli, AnalyzeProcessesInput) {
    const std::string log_path = "tsanalyzer_cli_input_test.log";
    const std::string source_path = "tsanalyzer_cli_input_test.ts";
    const std::string config_path = "tsanalyzer_cli_input_test.toml";

    cf_assert(write_file(source_path, "let value: number = \"five\";\nadd(1);\n"));
    cf_assert(write_file(log_path,
                         source_path + "(1,5): error TS2322: Type 'string' is not "
                                       "assignable to type 'number'.\n" +
                         source_path + "(2,1): error TS2554: Expected 2 arguments, "
                                       "but got 1.\n" +
                         source_path + "(2,1): error TS7006: Parameter 'x' "
                                       "implicitly has an 'any' type.\n"
                                       "Found 3 errors in the same file.\n"));
    cf_assert(write_file(config_path,
                         "[output]\ncolor = false\nsummary = true\n"
                         "[analyzer]\nignore = [\"TS7044\"]\n"));

    int result = run_command({"analyze", log_path, "-c", config_path, "-q"});
    std::remove(log_path.c_str());
    std::remove(source_path.c_str());
    std::remove(config_path.c_str());

    cf_assert(result == 0);
    return 0;
}

TEST(Cli, AnalyzeWithoutDiagnostics) {
    const std::string log_path = "tsanalyzer_cli_empty_test.log";
    cf_assert(write_file(log_path, "Found 0 errors.\n"));

    int result = run_command({"analyze", log_path, "--no-color", "-q"});
    std::remove(log_path.c_str());

    cf_assert(result == 0);
    return 0;
}
