/***
 * Name: test_transpile
 * Purpose: Whole-file translation through the driver: output placement, diagnostics, exit status and -j ordering.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include "lexer/Lexer.h"
#include "nestport/driver/app.h"
#include "nestport/exceptions/file_read_error.h"
#include "nestport/metrics/metrics.h"
#include "nestport/stages/file_reader.h"
#include "nestport/support/fs.h"

using namespace nestport;
namespace fs = std::filesystem;

namespace {

class TranspileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() /
           ("nestport_" + std::string(info->name()) + "_" + std::to_string(static_cast<long>(::getpid())));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    opts_.color = driver::CliOptions::ColorMode::Never;
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string write(const std::string& name, const std::string& text) const {
    const auto path = (dir_ / name).string();
    std::ofstream(path, std::ios::binary) << text;
    return path;
  }

  static std::string slurp(const std::string& path) {
    std::string text;
    std::string err;
    EXPECT_TRUE(support::ReadFile(path, text, err)) << err;
    return text;
  }

  int run() {
    out_.str("");
    err_.str("");
    return driver::TranspileAll(opts_, out_, err_);
  }

  fs::path dir_;
  driver::CliOptions opts_;
  std::ostringstream out_;
  std::ostringstream err_;
};

}  // namespace

TEST_F(TranspileTest, WritesHeaderBesideInput) {
  const auto input = write("Hello.java", "class Hello { int x = 1; }\n");
  opts_.inputs = {input};
  EXPECT_EQ(run(), driver::kExitOk);
  EXPECT_TRUE(err_.str().empty()) << err_.str();
  const auto header = slurp((dir_ / "Hello.h").string());
  EXPECT_EQ(header.rfind("// Generated by nestport from " + input + ". Do not edit.\n", 0), 0u);
  EXPECT_NE(header.find("class Hello : public Object {\n"), std::string::npos);
}

TEST_F(TranspileTest, DashOutputGoesToStdout) {
  opts_.inputs = {write("A.java", "class A {}\n")};
  opts_.output = "-";
  EXPECT_EQ(run(), driver::kExitOk);
  EXPECT_NE(out_.str().find("class A : public Object {\n"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir_ / "A.h"));
}

TEST_F(TranspileTest, OutDirIsCreated) {
  opts_.inputs = {write("A.java", "class A {}\n"), write("B.java", "class B {}\n")};
  opts_.out_dir = (dir_ / "gen" / "include").string();
  EXPECT_EQ(run(), driver::kExitOk);
  EXPECT_TRUE(fs::exists(dir_ / "gen" / "include" / "A.h"));
  EXPECT_TRUE(fs::exists(dir_ / "gen" / "include" / "B.h"));
}

TEST_F(TranspileTest, TranslationErrorIsLocated) {
  const auto input = write("Bad.java", "class Bad {\n  42;\n}\n");
  opts_.inputs = {input};
  EXPECT_EQ(run(), driver::kExitTranslationError);
  EXPECT_EQ(err_.str(), input + ":2:3: error: no member declaration matches in body of 'Bad' ('42')\n"
                                "    42;\n"
                                "    ^\n");
  EXPECT_FALSE(fs::exists(dir_ / "Bad.h"));
}

TEST_F(TranspileTest, UnbalancedInputIsATranslationError) {
  opts_.inputs = {write("U.java", "class U {\n")};
  EXPECT_EQ(run(), driver::kExitTranslationError);
  EXPECT_NE(err_.str().find(":1:9: error: unclosed bracket at end of input ('{')"), std::string::npos) << err_.str();
}

TEST_F(TranspileTest, UnresolvedBaseIsATranslationError) {
  opts_.inputs = {write("E.java", "class E extends Nowhere {}\n")};
  EXPECT_EQ(run(), driver::kExitTranslationError);
  EXPECT_NE(err_.str().find("unresolved base type 'Nowhere' referenced by 'E'"), std::string::npos);

  opts_.known_types = {"Nowhere"};
  EXPECT_EQ(run(), driver::kExitOk);
}

TEST_F(TranspileTest, MissingInputIsAnIoError) {
  const auto missing = (dir_ / "Missing.java").string();
  opts_.inputs = {missing};
  EXPECT_EQ(run(), driver::kExitUsageOrIo);
  EXPECT_EQ(err_.str(), "nestport: error: failed to open file: " + missing + "\n");
}

TEST_F(TranspileTest, DirectoryInputIsAnIoError) {
  opts_.inputs = {dir_.string()};
  EXPECT_EQ(run(), driver::kExitUsageOrIo);
  EXPECT_EQ(err_.str(), "nestport: error: is a directory: " + dir_.string() + "\n");
}

TEST_F(TranspileTest, StopsAtFirstFailureWithoutKeepGoing) {
  opts_.inputs = {write("A.java", "class A { 1; }\n"), write("B.java", "class B {}\n")};
  EXPECT_EQ(run(), driver::kExitTranslationError);
  EXPECT_FALSE(fs::exists(dir_ / "B.h"));
}

TEST_F(TranspileTest, KeepGoingReportsInInputOrder) {
  opts_.inputs = {
      write("A.java", "class A {}\n"),
      write("B.java", "class B { 1; }\n"),
      write("C.java", "class C {}\n"),
      write("D.java", "class D { 2; }\n"),
      write("F.java", "class F {}\n"),
  };
  opts_.keep_going = true;
  opts_.jobs = 4;
  opts_.dump_ast = true;
  EXPECT_EQ(run(), driver::kExitTranslationError);

  EXPECT_EQ(out_.str(),
            "File package=<default>\n  ClassDecl class A\n"
            "File package=<default>\n  ClassDecl class C\n"
            "File package=<default>\n  ClassDecl class F\n");
  const auto err = err_.str();
  const auto first = err.find("B.java:1:11: error:");
  const auto second = err.find("D.java:1:11: error:");
  ASSERT_NE(first, std::string::npos) << err;
  ASSERT_NE(second, std::string::npos) << err;
  EXPECT_LT(first, second);
  EXPECT_TRUE(fs::exists(dir_ / "A.h"));
  EXPECT_TRUE(fs::exists(dir_ / "C.h"));
  EXPECT_TRUE(fs::exists(dir_ / "F.h"));
}

TEST_F(TranspileTest, WorstStatusWins) {
  opts_.inputs = {write("Bad.java", "class Bad { 1; }\n"), (dir_ / "Gone.java").string()};
  opts_.keep_going = true;
  EXPECT_EQ(run(), driver::kExitUsageOrIo);
}

TEST_F(TranspileTest, ParallelRunsMatchSerialOutput) {
  for (int i = 0; i < 12; ++i) {
    const auto name = "K" + std::to_string(i);
    opts_.inputs.push_back(write(name + ".java", "class " + name + " { Runnable r = new Runnable() { public void run() {} }; }\n"));
  }
  opts_.dump_ast = true;
  opts_.jobs = 1;
  ASSERT_EQ(run(), driver::kExitOk);
  const auto serial = out_.str();
  opts_.jobs = 8;
  ASSERT_EQ(run(), driver::kExitOk);
  EXPECT_EQ(out_.str(), serial);
}

TEST_F(TranspileTest, MetricsCountFiles) {
  metrics::Metrics::Enable(true);
  metrics::Metrics::Reset();
  opts_.inputs = {write("A.java", "class A {}\n"), write("B.java", "class B { 1; }\n")};
  opts_.keep_going = true;
  (void)run();
  const auto reg = metrics::Metrics::GetRegistry();
  metrics::Metrics::Reset();
  metrics::Metrics::Enable(false);
  EXPECT_EQ(reg.files_ok, 1u);
  EXPECT_EQ(reg.files_failed, 1u);
  EXPECT_GT(reg.tokens, 0u);
}

TEST_F(TranspileTest, ReaderTimesReadsAndReportsDirectories) {
  metrics::Metrics::Enable(true);
  metrics::Metrics::Reset();
  std::string source;
  std::string err;
  EXPECT_TRUE(stages::FileReader::Read(write("R.java", "class R {}\n"), source, err));
  EXPECT_EQ(source, "class R {}\n");
  EXPECT_FALSE(stages::FileReader::Read(dir_.string(), source, err));
  EXPECT_EQ(err, "is a directory: " + dir_.string());
  const auto reg = metrics::Metrics::GetRegistry();
  metrics::Metrics::Reset();
  metrics::Metrics::Enable(false);
  ASSERT_EQ(reg.durations_ns.size(), 2u);
  EXPECT_EQ(reg.durations_ns[0].first, metrics::Metrics::Phase::ReadFile);
}

TEST_F(TranspileTest, LexerReadsFiles) {
  const auto path = write("L.java", "class L {\n}\n");
  lex::Lexer lexer;
  lexer.pushFile(path);
  const auto& tokens = lexer.tokens();
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].file, path);
  EXPECT_EQ(tokens[3].line, 2);

  lex::Lexer missing;
  EXPECT_THROW(missing.pushFile((dir_ / "nope.java").string()), exceptions::FileReadError);
}
