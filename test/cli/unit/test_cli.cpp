/***
 * Name: test_cli
 * Purpose: Command-line parsing: options, values, conflicts and usage text.
 */
#include <gtest/gtest.h>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>
#include "nestport/driver/cli.h"

using namespace nestport;
using driver::CliOptions;

static bool parse(std::initializer_list<const char*> args, CliOptions& opts, std::string& err) {
  std::vector<const char*> argv{"nestport"};
  argv.insert(argv.end(), args.begin(), args.end());
  std::ostringstream diag;
  const bool is_ok = driver::ParseCli(static_cast<int>(argv.size()), argv.data(), opts, diag);
  err = diag.str();
  return is_ok;
}

TEST(CLI, Defaults) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"A.java"}, opts, err));
  ASSERT_EQ(opts.inputs.size(), 1u);
  EXPECT_EQ(opts.inputs[0], "A.java");
  EXPECT_TRUE(opts.output.empty());
  EXPECT_EQ(opts.jobs, 1);
  EXPECT_FALSE(opts.keep_going);
  EXPECT_FALSE(opts.metrics);
  EXPECT_EQ(opts.color, CliOptions::ColorMode::Auto);
  EXPECT_TRUE(err.empty());
}

TEST(CLI, ValueOptionsSeparateAndJoined) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"-o", "out.h", "A.java"}, opts, err));
  EXPECT_EQ(opts.output, "out.h");
  ASSERT_TRUE(parse({"-oout.h", "A.java"}, opts, err));
  EXPECT_EQ(opts.output, "out.h");
  ASSERT_TRUE(parse({"-j4", "A.java", "B.java"}, opts, err));
  EXPECT_EQ(opts.jobs, 4);
  ASSERT_TRUE(parse({"-j", "2", "A.java"}, opts, err));
  EXPECT_EQ(opts.jobs, 2);
  ASSERT_TRUE(parse({"--out-dir=gen", "A.java"}, opts, err));
  EXPECT_EQ(opts.out_dir, "gen");
  ASSERT_TRUE(parse({"--out-dir", "gen2", "A.java"}, opts, err));
  EXPECT_EQ(opts.out_dir, "gen2");
}

TEST(CLI, KnownTypesAccumulate) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"--known-type", "Widget", "--known-type=Gadget", "A.java"}, opts, err));
  std::vector<std::string> want = {"Widget", "Gadget"};
  EXPECT_EQ(opts.known_types, want);
}

TEST(CLI, Switches) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"-k", "--dump-ast", "--log-tokens", "A.java"}, opts, err));
  EXPECT_TRUE(opts.keep_going);
  EXPECT_TRUE(opts.dump_ast);
  EXPECT_TRUE(opts.log_tokens);
  ASSERT_TRUE(parse({"--keep-going", "A.java"}, opts, err));
  EXPECT_TRUE(opts.keep_going);
}

TEST(CLI, MetricsFormats) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"--metrics", "A.java"}, opts, err));
  EXPECT_TRUE(opts.metrics);
  EXPECT_EQ(opts.metrics_format, CliOptions::MetricsFormat::Text);
  ASSERT_TRUE(parse({"--metrics=json", "A.java"}, opts, err));
  EXPECT_EQ(opts.metrics_format, CliOptions::MetricsFormat::Json);
  EXPECT_FALSE(parse({"--metrics=xml", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: unknown metrics format 'xml' (expected json or text)\n");
}

TEST(CLI, ColorModes) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"--color", "A.java"}, opts, err));
  EXPECT_EQ(opts.color, CliOptions::ColorMode::Always);
  ASSERT_TRUE(parse({"--color=never", "A.java"}, opts, err));
  EXPECT_EQ(opts.color, CliOptions::ColorMode::Never);
  EXPECT_FALSE(parse({"--color=sometimes", "A.java"}, opts, err));
  EXPECT_NE(err.find("unknown color mode 'sometimes'"), std::string::npos);
}

TEST(CLI, EndOfOptions) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"--", "-weird.java", "B.java"}, opts, err));
  std::vector<std::string> want = {"-weird.java", "B.java"};
  EXPECT_EQ(opts.inputs, want);
}

TEST(CLI, HelpNeedsNoInputs) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"--help"}, opts, err));
  EXPECT_TRUE(opts.show_help);
  ASSERT_TRUE(parse({"-h"}, opts, err));
  EXPECT_TRUE(opts.show_help);
}

TEST(CLI, ReparseResetsOptions) {
  CliOptions opts;
  std::string err;
  ASSERT_TRUE(parse({"-k", "A.java"}, opts, err));
  ASSERT_TRUE(parse({"B.java"}, opts, err));
  EXPECT_FALSE(opts.keep_going);
  ASSERT_EQ(opts.inputs.size(), 1u);
  EXPECT_EQ(opts.inputs[0], "B.java");
}

TEST(CLIErrors, Rejections) {
  CliOptions opts;
  std::string err;
  EXPECT_FALSE(parse({}, opts, err));
  EXPECT_EQ(err, "nestport: error: no input files\n");

  EXPECT_FALSE(parse({"-o", "x.h", "A.java", "B.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: cannot specify -o with multiple input files\n");

  EXPECT_FALSE(parse({"-o", "x.h", "--out-dir", "gen", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: -o and --out-dir are mutually exclusive\n");

  EXPECT_FALSE(parse({"--frobnicate", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: unknown option '--frobnicate'\n");

  EXPECT_FALSE(parse({"-"}, opts, err));
  EXPECT_EQ(err, "nestport: error: reading source from stdin is not supported\n");

  EXPECT_FALSE(parse({"A.java", "-o"}, opts, err));
  EXPECT_EQ(err, "nestport: error: missing filename after '-o'\n");

  EXPECT_FALSE(parse({"--known-type=", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: empty type name after '--known-type'\n");
}

TEST(CLIErrors, BadJobCounts) {
  CliOptions opts;
  std::string err;
  EXPECT_FALSE(parse({"-j", "0", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: invalid job count '0': expected a positive number\n");
  EXPECT_FALSE(parse({"-jx", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: invalid job count 'x': invalid character in number\n");
  EXPECT_FALSE(parse({"-j", "99999999999", "A.java"}, opts, err));
  EXPECT_EQ(err, "nestport: error: invalid job count '99999999999': number out of range\n");
}

TEST(CLI, UsageNamesProgramBasename) {
  std::ostringstream out;
  driver::PrintUsage(out, "/usr/local/bin/nestport");
  const auto text = out.str();
  EXPECT_EQ(text.rfind("Usage: nestport [options] file...\n", 0), 0u);
  EXPECT_NE(text.find("--known-type <name>"), std::string::npos);
  EXPECT_NE(text.find("Exit status: 0 success, 1 translation errors, 2 usage or I/O errors."), std::string::npos);

  std::ostringstream fallback;
  driver::PrintUsage(fallback, nullptr);
  EXPECT_EQ(fallback.str().rfind("Usage: nestport ", 0), 0u);
}
