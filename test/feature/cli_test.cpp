#include <catch2/catch.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static const std::string kairos_cli = STRINGIFY(KAIROS_CLI);

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static int
run_cli(const std::string& args) {
  std::string cmd = kairos_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "kairos_cli_stderr.txt";
  std::string cmd = kairos_cli + " " + args + " 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  std::ifstream in(tmp);
  stderr_output.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  fs::remove(tmp);
  return rc;
}

static int
run_cli_stdout(const std::string& args, std::string& stdout_output) {
  auto tmp = fs::temp_directory_path() / "kairos_cli_stdout.txt";
  std::string cmd =
      kairos_cli + " " + args + " >" + tmp.string() + " 2>/dev/null";
  int rc = exit_code(std::system(cmd.c_str()));
  std::ifstream in(tmp);
  stdout_output.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  fs::remove(tmp);
  return rc;
}

// ===== Usage =====

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and contains the program name", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.find("kairos") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown command exits 1", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("teleport '1 d'", err) == 1);
  CHECK(err.find("unknown command") != std::string::npos);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--frobnicate format '1 d'") == 1);
}

TEST_CASE("wrong operand count exits 1", "[cli]") {
  CHECK(run_cli("add '1 d'") == 1);
  CHECK(run_cli("format") == 1);
  CHECK(run_cli("-p") == 1);
}

// ===== Commands =====

TEST_CASE("format rewrites with the requested pattern", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("format '1 2 03:04:05' -p o", out);
  CHECK(rc == 0);
  CHECK(out == "1-183845000000000:0:0\n");

  rc = run_cli_stdout("format '90 min' --pattern T", out);
  CHECK(rc == 0);
  CHECK(out == "01:30:00\n");
}

TEST_CASE("operands after -- may start with a negative sign", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("format -- '-1 d'", out);
  CHECK(rc == 0);
  CHECK(out == "-0 1 00:00:00\n");
}

TEST_CASE("arithmetic commands", "[cli]") {
  std::string out;

  SECTION("add") {
    CHECK(run_cli_stdout("add '0 1' '0 1'", out) == 0);
    CHECK(out == "0 2 00:00:00\n");
  }
  SECTION("sub") {
    CHECK(run_cli_stdout("sub '1 d' '1 h' -p T", out) == 0);
    CHECK(out == "23:00:00\n");
  }
  SECTION("mul") {
    CHECK(run_cli_stdout("mul '1 h' 1.5", out) == 0);
    CHECK(out == "0 0 01:30:00\n");
  }
  SECTION("div") {
    CHECK(run_cli_stdout("div '1 d' 4 -p T", out) == 0);
    CHECK(out == "06:00:00\n");
  }
  SECTION("ratio") {
    CHECK(run_cli_stdout("ratio '1 d' '1 h'", out) == 0);
    CHECK(out == "24\n");
  }
  SECTION("mod") {
    CHECK(run_cli_stdout("mod '25 h' '1 d' -p T", out) == 0);
    CHECK(out == "01:00:00\n");
  }
  SECTION("cmp") {
    CHECK(run_cli_stdout("cmp 03:00 04:00", out) == 0);
    CHECK(out == "-1\n");
    CHECK(run_cli_stdout("cmp Infinity '1000000000 y'", out) == 0);
    CHECK(out == "1\n");
    CHECK(run_cli_stdout("cmp '60 min' '1 h'", out) == 0);
    CHECK(out == "0\n");
  }
}

TEST_CASE("parse prints the canonical fields", "[cli]") {
  std::string out;
  CHECK(run_cli_stdout("parse '1 h'", out) == 0);
  CHECK(out.find("total_nanoseconds: 3600000000000") != std::string::npos);
  CHECK(out.find("negative: false") != std::string::npos);
}

// ===== JSON output =====

TEST_CASE("--json writes durations as round-trip strings", "[cli]") {
  std::string out;
  CHECK(run_cli_stdout("--json add '1 h' '30 min'", out) == 0);
  CHECK(out == "\"0-5400000000000:0:0\"\n");
}

TEST_CASE("--json parse writes an object", "[cli]") {
  std::string out;
  CHECK(run_cli_stdout("--json parse '1 h'", out) == 0);
  CHECK(out.find("\"total_nanoseconds\":3600000000000") != std::string::npos);
  CHECK(out.find("\"aeons\":\"0\"") != std::string::npos);
}

// ===== Failures =====

TEST_CASE("unparseable operand exits 3", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("parse soon", err) == 3);
  CHECK(err.find("kairos parse") != std::string::npos);
}

TEST_CASE("modulus by zero prints an infinity", "[cli]") {
  std::string out;
  CHECK(run_cli_stdout("mod '1 h' 0", out) == 0);
  CHECK(out == "-Infinity\n");
}

TEST_CASE("oversized operand exits 3", "[cli]") {
  CHECK(run_cli("format '1e1000000 tP'") == 3);
}

TEST_CASE("non-numeric scalar exits 3", "[cli]") {
  CHECK(run_cli("mul '1 h' twice") == 3);
}
