/*
================================================================================
Fragment 5.0 — CLI: Main Entry Point (pythag_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the right-triangle engine.
  - Stands where the desktop window stands: collects the three raw fields,
    normalizes decimal commas, calls process_fields(), prints the record.

Usage:
  pythag_cli solve [--a <v>] [--b <v>] [--c <v>] [options]
  pythag_cli mode  [--a <v>] [--b <v>] [--c <v>]
  pythag_cli help

  An omitted field is submitted as blank.

Options:
  --json 0|1          JSON output instead of text (default 0)
  --comma 0|1         Treat ',' as decimal separator (default 1)
  --log-level <lvl>   debug|info|warn|error (env: PYTHAG_LOG_LEVEL)

Exit codes:
  0 - computed, or verified as right
  1 - invalid arguments
  2 - verified, NOT right
  3 - rejected (invalid input / impossible triangle)
================================================================================
*/

#include "engine/core/logging.hpp"
#include "engine/input/field_validator.hpp"
#include "engine/report/record_report.hpp"
#include "engine/triangle/solve.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

using namespace pythag;

namespace {

enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  NOT_RIGHT = 2,
  REJECTED = 3
};

struct Args {
  std::string command = "help";
  std::optional<std::string> a;
  std::optional<std::string> b;
  std::optional<std::string> c;
  bool json = false;
  bool comma = true;
  std::optional<LogLevel> log_level;
};

void print_help() {
  std::cout << R"(
pythag_cli - right-triangle solver / verifier

Usage:
  pythag_cli solve [--a <v>] [--b <v>] [--c <v>] [options]
  pythag_cli mode  [--a <v>] [--b <v>] [--c <v>]
  pythag_cli help

  a, b are legs, c is the hypotenuse. Leave exactly one out to compute it,
  give all three to verify (largest value is treated as hypotenuse).

Options:
  --json 0|1          JSON output (default 0)
  --comma 0|1         Accept ',' as decimal separator (default 1)
  --log-level <lvl>   debug|info|warn|error

Examples:
  pythag_cli solve --a 3 --b 4
  pythag_cli solve --b 4 --c 5 --json 1
  pythag_cli solve --a 4 --b 5 --c 3

Exit Codes:
  0 - Computed, or verified RIGHT
  1 - Invalid arguments
  2 - Verified, NOT right
  3 - Rejected
)";
}

bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc >= 2) a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--a") == 0 || std::strcmp(k, "--b") == 0 || std::strcmp(k, "--c") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      std::optional<std::string>& slot = (k[2] == 'a') ? a->a : (k[2] == 'b') ? a->b : a->c;
      slot = std::string(v);
      continue;
    }

    if (std::strcmp(k, "--json") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--json requires 0|1"; return false; }
      if (!parse_bool01(v, &a->json)) { *err = "--json must be 0 or 1"; return false; }
      continue;
    }

    if (std::strcmp(k, "--comma") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--comma requires 0|1"; return false; }
      if (!parse_bool01(v, &a->comma)) { *err = "--comma must be 0 or 1"; return false; }
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      LogLevel lvl = LogLevel::WARN;
      if (!parse_log_level(v, &lvl)) { *err = std::string("Unknown log level: ") + v; return false; }
      a->log_level = lvl;
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

// The engine only accepts '.'; users of comma locales type "3,5".
std::optional<std::string> normalize_decimal(const std::optional<std::string>& raw, bool comma) {
  if (!raw.has_value() || !comma) return raw;
  std::string s = *raw;
  for (char& ch : s) {
    if (ch == ',') ch = '.';
  }
  return s;
}

FieldMap to_field_map(const Args& a) {
  FieldMap m;
  m["a"] = normalize_decimal(a.a, a.comma);
  m["b"] = normalize_decimal(a.b, a.comma);
  m["c"] = normalize_decimal(a.c, a.comma);
  return m;
}

void apply_log_level(const Args& a) {
  if (a.log_level.has_value()) {
    set_log_level(*a.log_level);
    return;
  }
  if (const char* env = std::getenv("PYTHAG_LOG_LEVEL")) {
    LogLevel lvl = LogLevel::WARN;
    if (parse_log_level(env, &lvl)) {
      set_log_level(lvl);
    } else {
      log_warn(std::string("Ignoring unknown PYTHAG_LOG_LEVEL: ") + env);
    }
  }
}

const char* mode_label(Mode m) {
  switch (m) {
    case Mode::kSolve:  return "Calculate";
    case Mode::kVerify: return "Verify";
    default:            return "-";
  }
}

int cmd_mode(const Args& a) {
  const Mode m = detect_mode(to_field_map(a));
  log_debug(std::string("mode: ") + mode_to_string(m));
  std::cout << mode_label(m) << "\n";
  return ExitCode::SUCCESS;
}

int cmd_solve(const Args& a) {
  const TriangleRecord r = process_fields(to_field_map(a));

  if (a.json) {
    write_record_json(std::cout, r);
  } else {
    std::cout << format_record_text(r);
  }

  switch (r.outcome) {
    case Outcome::kComputed: return ExitCode::SUCCESS;
    case Outcome::kVerified: return r.is_right ? ExitCode::SUCCESS : ExitCode::NOT_RIGHT;
    default:                 return ExitCode::REJECTED;
  }
}

}  // namespace

int main(int argc, char** argv) {
  Args a;
  std::string err;
  if (!parse_args(argc, argv, &a, &err)) {
    std::cerr << "Error: " << err << "\n";
    std::cerr << "Run 'pythag_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  apply_log_level(a);

  if (a.command == "help" || a.command == "-h" || a.command == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (a.command == "solve") {
    return cmd_solve(a);
  }

  if (a.command == "mode") {
    return cmd_mode(a);
  }

  std::cerr << "Unknown command: " << a.command << "\n";
  std::cerr << "Run 'pythag_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
