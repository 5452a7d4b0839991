// tests/cli/test_cli.cpp - Command line tests for the jlint executable
//
// Runs the built binary and checks option handling, exit codes and the JSON
// report.
//

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(std::string_view prefix)
  {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "cannot write " << p.string();
  out << s;
}

std::string shell_quote(const std::string & s)
{
  std::string out = "'";
  for (const char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Exit status of `jlint <args>`; stdout goes to `stdout_file` when given
int run_jlint(std::initializer_list<std::string> args, const fs::path & stdout_file = {})
{
#ifndef JLINT_CLI_PATH
  (void)args;
  (void)stdout_file;
  return -1;
#else
  std::string cmd = shell_quote(JLINT_CLI_PATH);
  for (const auto & a : args) {
    cmd += " " + shell_quote(a);
  }
  cmd += stdout_file.empty() ? " > /dev/null" : " > " + shell_quote(stdout_file.string());
  cmd += " 2>/dev/null";

  const int rc = std::system(cmd.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    return 127;
  }
  if (WIFEXITED(rc)) {
    return WEXITSTATUS(rc);
  }
  return 128;
#else
  return rc;
#endif
#endif
}

const char * const k_clean_source = "class A {\n}\n";

const char * const k_finality_source =
  "class A {\n"
  "  void m() {\n"
  "    int x = 1;\n"
  "    use(x);\n"
  "  }\n"
  "}\n";

}  // namespace

#ifndef JLINT_CLI_PATH
#define REQUIRE_CLI() GTEST_SKIP() << "JLINT_CLI_PATH is not configured (jlint target missing?)"
#else
#define REQUIRE_CLI() (void)0
#endif

// ============================================================================
// Usage errors
// ============================================================================

TEST(CliTest, NoArgumentsPrintsUsage)
{
  REQUIRE_CLI();
  EXPECT_EQ(run_jlint({}), 0);
  EXPECT_EQ(run_jlint({"--help"}), 0);
  EXPECT_EQ(run_jlint({"--list-rules"}), 0);
}

TEST(CliTest, BadOptionsExitWithTwo)
{
  REQUIRE_CLI();
  EXPECT_EQ(run_jlint({"--bogus", "A.java"}), 2);
  EXPECT_EQ(run_jlint({"--format", "xml", "A.java"}), 2);
  EXPECT_EQ(run_jlint({"-j", "many", "A.java"}), 2);
  EXPECT_EQ(run_jlint({"-j"}), 2);
  EXPECT_EQ(run_jlint({"--verbose"}), 2);
}

TEST(CliTest, MissingInputExitsWithTwo)
{
  REQUIRE_CLI();
  TempDir dir("jlint_cli_missing");
  write_all(dir.path / "jlint.yaml", "rules:\n  - FinalLocalVariable\n");
  EXPECT_EQ(
    run_jlint(
      {"-c", (dir.path / "jlint.yaml").string(), (dir.path / "NoSuchFile.java").string()}),
    2);
}

TEST(CliTest, InvalidConfigExitsWithTwo)
{
  REQUIRE_CLI();
  TempDir dir("jlint_cli_bad_config");
  write_all(dir.path / "A.java", k_clean_source);
  write_all(dir.path / "jlint.yaml", "rules: FinalLocalVariable\n");
  EXPECT_EQ(
    run_jlint({"-c", (dir.path / "jlint.yaml").string(), (dir.path / "A.java").string()}), 2);
  EXPECT_EQ(
    run_jlint({"-c", (dir.path / "absent.yaml").string(), (dir.path / "A.java").string()}), 2);
}

// ============================================================================
// Lint results
// ============================================================================

TEST(CliTest, ExitCodeFollowsErrorSeverity)
{
  REQUIRE_CLI();
  TempDir dir("jlint_cli_exit");
  const fs::path errors = dir.path / "errors.yaml";
  const fs::path warnings = dir.path / "warnings.yaml";
  write_all(errors, "rules:\n  - FinalLocalVariable\n");
  write_all(warnings, "severity: warning\nrules:\n  - FinalLocalVariable\n");
  write_all(dir.path / "Clean.java", k_clean_source);
  write_all(dir.path / "Dirty.java", k_finality_source);

  const std::string clean = (dir.path / "Clean.java").string();
  const std::string dirty = (dir.path / "Dirty.java").string();

  EXPECT_EQ(run_jlint({"--no-color", "-c", errors.string(), clean}), 0);
  EXPECT_EQ(run_jlint({"--no-color", "-c", errors.string(), dirty}), 1);
  EXPECT_EQ(run_jlint({"--no-color", "-c", warnings.string(), dirty}), 0);
  EXPECT_EQ(run_jlint({"--no-color", "-j", "2", "-c", errors.string(), dir.path.string()}), 1);
}

TEST(CliTest, JsonReport)
{
  REQUIRE_CLI();
  TempDir dir("jlint_cli_json");
  const fs::path config = dir.path / "jlint.yaml";
  const fs::path out = dir.path / "report.json";
  write_all(config, "rules:\n  - FinalLocalVariable\n");
  write_all(dir.path / "A.java", k_finality_source);
  write_all(dir.path / "B.java", k_clean_source);

  ASSERT_EQ(
    run_jlint({"-f", "json", "-j", "2", "-c", config.string(), dir.path.string()}, out), 1);

  const auto report = nlohmann::json::parse(read_all(out));
  const auto & files = report.at("files");
  ASSERT_EQ(files.size(), 2U);
  EXPECT_EQ(fs::path(files[0].at("path").get<std::string>()).filename().string(), "A.java");
  EXPECT_EQ(files[0].at("status"), "ok");
  ASSERT_EQ(files[0].at("diagnostics").size(), 1U);

  const auto & diag = files[0].at("diagnostics")[0];
  EXPECT_EQ(diag.at("rule_name"), "FinalLocalVariable");
  EXPECT_EQ(diag.at("message"), "Variable 'x' should be declared final.");
  EXPECT_EQ(diag.at("line"), 3);
  EXPECT_EQ(diag.at("column"), 9);

  EXPECT_TRUE(files[1].at("diagnostics").empty());
}

TEST(CliTest, FixRewritesFiles)
{
  REQUIRE_CLI();
  TempDir dir("jlint_cli_fix");
  const fs::path config = dir.path / "jlint.yaml";
  const fs::path file = dir.path / "A.java";
  write_all(config, "severity: warning\nrules:\n  - MultipleVariableDeclarations\n");
  write_all(file, "class A {\n  int a, b;\n}\n");

  EXPECT_EQ(run_jlint({"--fix", "--no-color", "-c", config.string(), file.string()}), 0);
  EXPECT_EQ(read_all(file), "class A {\n  int a;\n  int b;\n}\n");
}
