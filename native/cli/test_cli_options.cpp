/*
 * test_cli_options.cpp — Tests for command-line parsing
 */

#include "cli/cli_options.h"
#include "test_harness.h"

using namespace forensics_lab;

static int tests_passed = 0;
static int tests_failed = 0;

static ParseStatus parse(const std::vector<const char *> &args, CliOptions *out,
                         std::string *err) {
  return parse_cli(static_cast<int>(args.size()), args.data(), out, err);
}

static void test_collect_full() {
  CliOptions o;
  std::string err;
  ParseStatus s = parse({"forensics_lab", "collect", "--case", "12",
                         "--investigator", "Ana", "--victim", "V", "--suspect",
                         "S", "--crime", "Fraud", "--root", "/cases", "--report",
                         "--upload-plan", "--quiet", "a.jpg", "b.pdf"},
                        &o, &err);
  ASSERT_TRUE(s == ParseStatus::OK, "Full collect line parses");
  ASSERT_TRUE(o.command == Command::COLLECT, "Command is collect");
  ASSERT_EQ(o.info.case_number, std::string("12"), "Case number");
  ASSERT_EQ(o.info.investigator, std::string("Ana"), "Investigator");
  ASSERT_EQ(o.info.crime_type, std::string("Fraud"), "Crime type");
  ASSERT_EQ(o.root_dir, std::string("/cases"), "Root");
  ASSERT_TRUE(o.report && o.upload_plan && o.quiet, "Flags set");
  ASSERT_FALSE(o.mock, "Mock not set");
  ASSERT_EQ(o.inputs.size(), (size_t)2, "Two inputs");
  ASSERT_EQ(o.inputs[1], std::string("b.pdf"), "Inputs keep order");
}

static void test_collect_errors() {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse({"forensics_lab"}, &o, &err) == ParseStatus::MISSING_COMMAND,
              "No command");
  ASSERT_TRUE(parse({"forensics_lab", "explode"}, &o, &err) ==
                  ParseStatus::UNKNOWN_COMMAND,
              "Unknown command");
  ASSERT_TRUE(parse({"forensics_lab", "collect", "a.jpg"}, &o, &err) ==
                  ParseStatus::MISSING_CASE,
              "Case is required");
  ASSERT_TRUE(parse({"forensics_lab", "collect", "--case", "1"}, &o, &err) ==
                  ParseStatus::NO_INPUTS,
              "Files or --mock required");
  ASSERT_TRUE(parse({"forensics_lab", "collect", "--case"}, &o, &err) ==
                  ParseStatus::MISSING_VALUE,
              "Dangling --case");
  ASSERT_TRUE(parse({"forensics_lab", "collect", "--case", "1", "--nope", "x"},
                    &o, &err) == ParseStatus::UNKNOWN_OPTION,
              "Unknown option");
  ASSERT_EQ(err, std::string("unknown option: --nope"),
            "Unknown option named");
  ASSERT_TRUE(parse({"forensics_lab", "verify"}, &o, &err) ==
                  ParseStatus::NO_INPUTS,
              "Verify needs digest files");
}

static void test_collect_special_inputs() {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse({"forensics_lab", "collect", "--case", "3", "--mock"}, &o,
                    &err) == ParseStatus::OK,
              "--mock alone is enough");
  ASSERT_TRUE(o.mock, "Mock set");
  ASSERT_TRUE(parse({"forensics_lab", "collect", "--case", "3", "--", "--odd",
                     "-"},
                    &o, &err) == ParseStatus::OK,
              "-- ends option parsing");
  ASSERT_EQ(o.inputs.size(), (size_t)2, "Dash-named files kept");
  ASSERT_EQ(o.inputs[0], std::string("--odd"), "Dash-named file");
}

static void test_resolve_config() {
  SessionConfig env;
  env.root_dir = "/home/x/forensics";
  env.verbose = true;

  CliOptions o;
  std::string err;
  parse({"forensics_lab", "verify", "a.sha256"}, &o, &err);
  SessionConfig same = resolve_config(o, env);
  ASSERT_EQ(same.root_dir, env.root_dir, "Environment root kept");
  ASSERT_TRUE(same.verbose, "Verbose kept");

  parse({"forensics_lab", "collect", "--case", "1", "--root", "/r", "--quiet",
         "f"},
        &o, &err);
  SessionConfig over = resolve_config(o, env);
  ASSERT_EQ(over.root_dir, std::string("/r"), "--root overrides");
  ASSERT_FALSE(over.verbose, "--quiet overrides");
}

extern "C" bool test_cli_options() {
  tests_passed = 0;
  tests_failed = 0;

  test_collect_full();
  test_collect_errors();
  test_collect_special_inputs();
  test_resolve_config();

  std::printf("  cli_options: %d passed, %d failed\n", tests_passed,
              tests_failed);
  return tests_failed == 0;
}
