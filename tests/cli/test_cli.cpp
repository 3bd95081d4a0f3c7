// test_cli.cpp - CLI integration tests for the mtx tool

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

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
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Run `mtx <args>` inside `dir`, capturing both streams.
CliResult run_cli(const fs::path & dir, const std::string & args)
{
  CliResult result;
#ifndef MATRIX_LANG_CLI_PATH
  (void)dir;
  (void)args;
  return result;
#else
  const fs::path out_file = dir / "stdout.txt";
  const fs::path err_file = dir / "stderr.txt";
  const std::string cmd = "cd " + shell_quote(dir.string()) + " && " +
                          shell_quote(MATRIX_LANG_CLI_PATH) + " " + args + " > " +
                          shell_quote(out_file.string()) + " 2> " + shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
#else
  result.exit_code = rc;
#endif
  result.out = read_all(out_file);
  result.err = read_all(err_file);
  return result;
#endif
}

}  // namespace

TEST(CliTest, RunPrintsOutputAndValue)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_run");
  write_all(dir / "prog.mtx", "println(\"hi\")\nlet x = 5 + 3\nx * 2\n");

  const auto r = run_cli(dir, "run prog.mtx --no-color");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "hi\n16\n");
  fs::remove_all(dir);
}

TEST(CliTest, RunReportsTypeErrors)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_type_error");
  write_all(dir / "bad.mtx", "println(1)\n1 + 2.0\n");

  const auto r = run_cli(dir, "run bad.mtx --no-color");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.out.empty()) << r.out;
  EXPECT_NE(r.err.find("TypeError: type mismatch: expected Int, found Float"), std::string::npos)
    << r.err;
  fs::remove_all(dir);
}

TEST(CliTest, CheckPrintsProgramType)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_check");
  write_all(dir / "prog.mtx", "println(\"not printed\")\n[1.0, 2.0]\n");

  const auto r = run_cli(dir, "check prog.mtx");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "OK: Array<Float>\n");
  fs::remove_all(dir);
}

TEST(CliTest, AstDumpsJson)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_ast");
  write_all(dir / "prog.mtx", "let x = 1\n");

  const auto r = run_cli(dir, "ast prog.mtx");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find("\"LetStmt\""), std::string::npos) << r.out;
  fs::remove_all(dir);
}

TEST(CliTest, InitThenRunProjectEntry)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_init");

  const auto init = run_cli(dir, "init demo");
  EXPECT_EQ(init.exit_code, 0) << init.err;
  EXPECT_TRUE(fs::exists(dir / "demo" / "mtx.yaml"));
  EXPECT_TRUE(fs::exists(dir / "demo" / "main.mtx"));

  const auto again = run_cli(dir, "init demo");
  EXPECT_EQ(again.exit_code, 1);

  const auto run = run_cli(dir / "demo", "run");
  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out, "49\n");
  fs::remove_all(dir);
}

TEST(CliTest, BadConfigFails)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_bad_config");
  write_all(dir / "mtx.yaml", "options:\n  max_call_depth: -5\n");
  write_all(dir / "main.mtx", "1\n");

  const auto r = run_cli(dir, "run");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("max_call_depth must be positive"), std::string::npos) << r.err;
  fs::remove_all(dir);
}

TEST(CliTest, UsageErrors)
{
#ifndef MATRIX_LANG_CLI_PATH
  GTEST_SKIP() << "MATRIX_LANG_CLI_PATH is not configured (mtx target missing?)";
#endif
  const fs::path dir = make_temp_dir("mtx_cli_usage");
  EXPECT_EQ(run_cli(dir, "frobnicate").exit_code, 2);
  EXPECT_EQ(run_cli(dir, "run --config").exit_code, 2);
  EXPECT_EQ(run_cli(dir, "--help").exit_code, 0);
  fs::remove_all(dir);
}
