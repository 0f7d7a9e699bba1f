// test_cli_transpile.cpp - CLI integration tests

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

struct CliRun
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Run the CLI inside `cwd` with `args` (already shell-quoted).
CliRun run_cli(const fs::path & cwd, const std::string & args)
{
  CliRun run;
#ifndef S2SQL_CLI_PATH
  (void)cwd;
  (void)args;
  return run;
#else
  const fs::path out_file = cwd / "stdout.txt";
  const fs::path err_file = cwd / "stderr.txt";
  const std::string cmd = "cd " + shell_quote(cwd.string()) + " && " +
                          shell_quote(S2SQL_CLI_PATH) + " " + args + " --no-color > " +
                          shell_quote(out_file.string()) + " 2> " +
                          shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    run.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    run.exit_code = WEXITSTATUS(rc);
  } else {
    run.exit_code = 128;
  }
#else
  run.exit_code = rc;
#endif

  run.out = read_all(out_file);
  run.err = read_all(err_file);
  return run;
#endif
}

}  // namespace

TEST(CliTranspileTest, TranspilesFileToMySql)
{
#ifndef S2SQL_CLI_PATH
  GTEST_SKIP() << "S2SQL_CLI_PATH is not configured (s2sql target missing?)";
#endif
  const fs::path dir = make_temp_dir("s2sql_cli_file");
  write_all(dir / "q.sql", "SELECT TO_DATE(x, 'YYYY-MM-DD') FROM t;\n");

  const auto run = run_cli(dir, "transpile q.sql --write mysql");
  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out, "SELECT STR_TO_DATE(x, '%Y-%m-%d') FROM t;\n");
}

TEST(CliTranspileTest, ExecuteFlagAndConfigDefaults)
{
#ifndef S2SQL_CLI_PATH
  GTEST_SKIP() << "S2SQL_CLI_PATH is not configured (s2sql target missing?)";
#endif
  const fs::path dir = make_temp_dir("s2sql_cli_config");
  write_all(dir / "s2sql.yaml", "transpile:\n  write: mysql\n");

  const auto run = run_cli(dir, "transpile -e " + shell_quote("SELECT x :> INT"));
  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out, "SELECT CAST(x AS INT);\n");

  // Command line wins over the file.
  const auto overridden =
    run_cli(dir, "transpile -e " + shell_quote("SELECT x :> INT") + " --write singlestore");
  EXPECT_EQ(overridden.out, "SELECT x :> INT;\n");
}

TEST(CliTranspileTest, ErrorsAreReportedOnStderr)
{
#ifndef S2SQL_CLI_PATH
  GTEST_SKIP() << "S2SQL_CLI_PATH is not configured (s2sql target missing?)";
#endif
  const fs::path dir = make_temp_dir("s2sql_cli_error");

  const auto run =
    run_cli(dir, "transpile -e " + shell_quote("SELECT TO_CHAR(d, 'D')") + " --write mysql");
  EXPECT_NE(run.exit_code, 0);
  EXPECT_NE(run.err.find("error[E0301]"), std::string::npos) << run.err;
  EXPECT_TRUE(run.out.empty());

  const auto bad_dialect = run_cli(dir, "transpile -e 1 --read oracle");
  EXPECT_NE(bad_dialect.exit_code, 0);
  EXPECT_NE(bad_dialect.err.find("E0401"), std::string::npos);
}

TEST(CliTranspileTest, FormatTimeAndDialects)
{
#ifndef S2SQL_CLI_PATH
  GTEST_SKIP() << "S2SQL_CLI_PATH is not configured (s2sql target missing?)";
#endif
  const fs::path dir = make_temp_dir("s2sql_cli_format");

  const auto fmt = run_cli(dir, "format-time " + shell_quote("HH24:MI") + " --write mysql");
  EXPECT_EQ(fmt.exit_code, 0) << fmt.err;
  EXPECT_EQ(fmt.out, "%H:%i\n");

  const auto dialects = run_cli(dir, "dialects");
  EXPECT_EQ(dialects.exit_code, 0);
  EXPECT_EQ(dialects.out, "mysql\nsinglestore\n");
}

TEST(CliTranspileTest, InitWritesConfigOnce)
{
#ifndef S2SQL_CLI_PATH
  GTEST_SKIP() << "S2SQL_CLI_PATH is not configured (s2sql target missing?)";
#endif
  const fs::path dir = make_temp_dir("s2sql_cli_init");

  EXPECT_EQ(run_cli(dir, "init").exit_code, 0);
  EXPECT_TRUE(fs::exists(dir / "s2sql.yaml"));
  EXPECT_NE(run_cli(dir, "init").exit_code, 0);
}
