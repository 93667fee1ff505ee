#include <gtest/gtest.h>

#include "codebox/reporters/json_reporter.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace codebox;
using codebox::reporters::JsonReporter;
using codebox::reporters::JsonReporterConfig;
using json = nlohmann::json;

TEST(JsonReporterTest, ValidationResult) {
  const auto result = analyzers::CodeValidator().Validate("import os\n");
  const auto j = JsonReporter().ToJson(result);
  EXPECT_FALSE(j["is_valid"].get<bool>());
  ASSERT_EQ(j["violations"].size(), result.Violations().size());
  EXPECT_EQ(j["violations"][0]["rule"], "import_not_allowed");
  EXPECT_EQ(j["violations"][0]["line"], 1);
  EXPECT_EQ(j["violations"][0]["column"], 0);
  EXPECT_TRUE(j["warnings"].is_array());
}

TEST(JsonReporterTest, RejectedResponse) {
  core::ExecutionResponse response;
  response.rejection_reason = "Code validation failed:\n- line 1, col 0: nope";
  response.message = *response.rejection_reason;
  analyzers::Violation violation;
  violation.kind = analyzers::RuleKind::DENYLISTED_BUILTIN;
  violation.description = "nope";
  response.violations.push_back(violation);

  const auto j = JsonReporter().ToJson(response);
  EXPECT_FALSE(j["success"].get<bool>());
  EXPECT_EQ(j["outcome"], "validation_rejected");
  EXPECT_TRUE(j["backend"].is_null());
  EXPECT_EQ(j["exit_code"], 1);
  EXPECT_EQ(j["rejection_reason"], response.message);
  ASSERT_EQ(j["violations"].size(), 1u);
  EXPECT_EQ(j["violations"][0]["rule"], "denylisted_builtin");
  EXPECT_EQ(j["message"], response.message);
}

TEST(JsonReporterTest, ExecutedResponseOmitsOptionalSections) {
  core::ExecutionResponse response;
  response.success = true;
  response.exit_code = 0;
  response.outcome = monitors::ExecutionOutcome::EXECUTED_SUCCESS;
  response.backend = "container-engine";
  response.stdout_output = "hi\n";
  response.message = "Execution successful (0.10s)";

  JsonReporterConfig config;
  config.include_output = false;
  config.include_message = false;
  const auto j = JsonReporter(config).ToJson(response);
  EXPECT_EQ(j["backend"], "container-engine");
  EXPECT_TRUE(j["rejection_reason"].is_null());
  EXPECT_FALSE(j.contains("stdout"));
  EXPECT_FALSE(j.contains("message"));
  EXPECT_FALSE(j.contains("violations"));
}

TEST(JsonReporterTest, ExecutionResult) {
  core::ExecutionResult result;
  result.exit_code = 124;
  result.timed_out = true;
  result.final_state = core::SandboxState::TIMED_OUT;
  result.error_message = "Execution timed out after 5 seconds";
  result.stdout_output = "partial";

  const auto j = JsonReporter().ToJson(result);
  EXPECT_EQ(j["state"], "timed_out");
  EXPECT_EQ(j["exit_code"], 124);
  EXPECT_TRUE(j["timed_out"].get<bool>());
  EXPECT_FALSE(j["cancelled"].get<bool>());
  EXPECT_TRUE(j["memory_used_mb"].is_null());
  EXPECT_EQ(j["error_message"], result.error_message);
  EXPECT_EQ(j["stdout"], "partial");

  result.memory_used_mb = 32.0;
  result.error_message.clear();
  const auto k = JsonReporter().ToJson(result);
  EXPECT_DOUBLE_EQ(k["memory_used_mb"].get<double>(), 32.0);
  EXPECT_FALSE(k.contains("error_message"));
}

TEST(JsonReporterTest, RenderHonoursFormatting) {
  const json document = {{"a", 1}};
  EXPECT_EQ(JsonReporter().Render(document), "{\n  \"a\": 1\n}");

  JsonReporterConfig compact;
  compact.pretty_print = false;
  EXPECT_EQ(JsonReporter(compact).Render(document), "{\"a\":1}");
}

TEST(JsonReporterTest, RenderReplacesInvalidUtf8) {
  const json document = {{"out", std::string("ok\xff")}};
  JsonReporterConfig compact;
  compact.pretty_print = false;
  EXPECT_NO_THROW(JsonReporter(compact).Render(document));
}

TEST(JsonReporterTest, SaveJson) {
  const auto path = std::filesystem::temp_directory_path() / "codebox_json_reporter_test.json";
  JsonReporter reporter;
  ASSERT_TRUE(reporter.SaveJson({{"total", 3}}, path));

  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  EXPECT_EQ(json::parse(contents.str())["total"], 3);
  std::filesystem::remove(path);

  EXPECT_FALSE(reporter.SaveJson({{"total", 3}}, "/nonexistent-dir/codebox/report.json"));
}
