#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "eval/evaluation_pipeline.hpp"
#include "eval/job_descriptor.hpp"
#include "test_support.hpp"

using namespace evalbox::eval;
using evalbox::testing::TempDir;
using evalbox::utils::ReadFile;

namespace {

// Records every command and answers from a responder.
class ScriptedRunner : public CommandRunner {
public:
    using Responder = std::function<CommandOutcome(const std::string&)>;

    explicit ScriptedRunner(Responder responder = {})
        : responder_(std::move(responder)) {}

    CommandOutcome Run(const std::string& command, std::chrono::seconds) override {
        commands.push_back(command);
        if (responder_) {
            return responder_(command);
        }
        return {0, "", ""};
    }
    std::string Name() const override { return "scripted"; }

    std::vector<std::string> commands;

private:
    Responder responder_;
};

bool Contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
}

const char* kPassingLog =
    ">>>>> Start Test Output\n"
    "PASSED tests/test_x.py::t1\n"
    "PASSED tests/test_x.py::t2\n"
    ">>>>> End Test Output\n";

class EvaluationPipelineTest : public ::testing::Test {
protected:
    EvaluationPipelineTest()
        : logger_(evalbox::testing::FileLogger(dir_ / "run.log"))
        , context_{*logger_, dir_.Path(), std::chrono::seconds(30), true} {}

    EvaluationRun MakeRun() const {
        EvaluationRun run;
        run.instance_id = "astropy__astropy-12907";
        run.repo = "astropy/astropy";
        run.model_patch = "diff --git a/x b/x";
        run.eval_script = "#!/bin/bash\nlocale-gen\npytest\n";
        run.local_code_space = "/testbed";
        run.fail_to_pass = {"tests/test_x.py::t1"};
        run.pass_to_pass = {"tests/test_x.py::t2"};
        return run;
    }

    TempDir dir_;
    std::shared_ptr<evalbox::utils::Logger> logger_;
    RunContext context_;
};

}  // namespace

TEST_F(EvaluationPipelineTest, NullPatchRunsNothing) {
    ScriptedRunner runner;
    EvaluationPipeline pipeline(context_, runner);
    auto run = MakeRun();
    run.model_patch.reset();

    const auto report = pipeline.Run(run);

    EXPECT_TRUE(report.patch_is_none);
    EXPECT_FALSE(report.patch_exists);
    EXPECT_FALSE(report.patch_successfully_applied);
    EXPECT_FALSE(report.resolved);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(EvaluationPipelineTest, ResolvesWhenAllTestsPass) {
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "/bin/bash ")) {
            return {0, kPassingLog, ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    EXPECT_TRUE(report.patch_exists);
    EXPECT_TRUE(report.patch_successfully_applied);
    EXPECT_TRUE(report.resolved);
    ASSERT_TRUE(report.tests_status.has_value());
    EXPECT_EQ(report.tests_status->fail_to_pass.success.size(), 1u);

    ASSERT_EQ(runner.commands.size(), 4u);
    EXPECT_EQ(runner.commands[0], "cd /testbed && git apply -v " + context_.PatchFile().string());
    EXPECT_EQ(runner.commands[1], "cd /testbed && git diff");
    EXPECT_EQ(runner.commands[2], "/bin/bash " + context_.DefaultEvalFile().string());
    EXPECT_EQ(runner.commands[3], "cd /testbed && git diff");

    EXPECT_EQ(ReadFile(context_.PatchFile()), "diff --git a/x b/x\n");
    EXPECT_TRUE(Contains(ReadFile(context_.DefaultEvalFile()), "locale-gen en_US.UTF-8\n"));
    EXPECT_EQ(ReadFile(context_.TestOutputFile()), kPassingLog);
}

TEST_F(EvaluationPipelineTest, FallsBackToFuzzyPatch) {
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "git apply")) {
            return {1, "", "error: patch failed"};
        }
        if (Contains(command, "/bin/bash ")) {
            return {0, kPassingLog, ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    ASSERT_GE(runner.commands.size(), 2u);
    EXPECT_EQ(runner.commands[1],
              "cd /testbed && patch --batch --fuzz=5 -p1 -i " + context_.PatchFile().string());
    EXPECT_TRUE(report.resolved);
}

TEST_F(EvaluationPipelineTest, StopsWhenNoPatchStrategyApplies) {
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "git apply") || Contains(command, "patch --batch")) {
            return {1, "", "rejected"};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    EXPECT_FALSE(report.patch_is_none);
    EXPECT_TRUE(report.patch_exists);
    EXPECT_FALSE(report.patch_successfully_applied);
    EXPECT_FALSE(report.resolved);
    EXPECT_EQ(runner.commands.size(), 2u);
    EXPECT_TRUE(Contains(ReadFile(dir_ / "run.log"), ">>>>> Patch Apply Failed"));
}

TEST_F(EvaluationPipelineTest, ApplyPatchThrowsWhenBothStrategiesFail) {
    ScriptedRunner runner([](const std::string&) -> CommandOutcome { return {1, "", "no"}; });
    EvaluationPipeline pipeline(context_, runner);
    EXPECT_THROW(pipeline.ApplyPatch(MakeRun()), EvaluationError);
}

TEST_F(EvaluationPipelineTest, FailingPassToPassIsUnresolved) {
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "/bin/bash ")) {
            return {1, "PASSED tests/test_x.py::t1\nFAILED tests/test_x.py::t2\n", ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    EXPECT_TRUE(report.patch_successfully_applied);
    EXPECT_FALSE(report.resolved);
}

TEST_F(EvaluationPipelineTest, LogWithoutResultsLeavesPatchUnapplied) {
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "/bin/bash ")) {
            return {2, ">>>>> Tests Errored\n", ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    EXPECT_TRUE(report.patch_exists);
    EXPECT_FALSE(report.patch_successfully_applied);
    EXPECT_FALSE(report.tests_status.has_value());
}

TEST_F(EvaluationPipelineTest, UsesExistingScriptFile) {
    const auto script = dir_ / "existing_eval.sh";
    evalbox::utils::WriteFile(script, "echo existing\n");
    ScriptedRunner runner;
    EvaluationPipeline pipeline(context_, runner);
    auto run = MakeRun();
    run.eval_script = script.string();

    pipeline.Run(run);

    EXPECT_NE(std::find(runner.commands.begin(), runner.commands.end(), "/bin/bash " + script.string()),
              runner.commands.end());
    EXPECT_FALSE(std::filesystem::exists(context_.DefaultEvalFile()));
}

TEST_F(EvaluationPipelineTest, NotesDiffChangedByTests) {
    int diffs = 0;
    ScriptedRunner runner([&diffs](const std::string& command) -> CommandOutcome {
        if (Contains(command, "git diff")) {
            return {0, diffs++ == 0 ? "before" : "after", ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    pipeline.Run(MakeRun());

    EXPECT_TRUE(Contains(ReadFile(dir_ / "run.log"), "Git diff changed after running eval script"));
}

TEST_F(EvaluationPipelineTest, OmitsTestsStatusWhenNotRequested) {
    context_.include_tests_status = false;
    ScriptedRunner runner([](const std::string& command) -> CommandOutcome {
        if (Contains(command, "/bin/bash ")) {
            return {0, kPassingLog, ""};
        }
        return {0, "", ""};
    });
    EvaluationPipeline pipeline(context_, runner);

    const auto report = pipeline.Run(MakeRun());

    EXPECT_TRUE(report.resolved);
    EXPECT_FALSE(report.tests_status.has_value());
}

TEST(JobDescriptorTest, ParsesEncodedTestLists) {
    const auto details = nlohmann::json::parse(R"({
        "instance_id": "django__django-1",
        "repo": "django/django",
        "version": "4.0",
        "model_patch": null,
        "script": "pytest",
        "test_cmd": "pytest -rA",
        "FAIL_TO_PASS": "[\"t1\", \"t2\"]",
        "PASS_TO_PASS": ["t3"]
    })");

    const auto run = ParseEvaluationRun(details);

    EXPECT_EQ(run.instance_id, "django__django-1");
    EXPECT_EQ(run.repo, "django/django");
    EXPECT_FALSE(run.model_patch.has_value());
    EXPECT_EQ(run.eval_script, "pytest");
    EXPECT_EQ(run.fail_to_pass, (std::vector<std::string>{"t1", "t2"}));
    EXPECT_EQ(run.pass_to_pass, std::vector<std::string>{"t3"});
    EXPECT_TRUE(run.fail_to_fail.empty());
}

TEST(JobDescriptorTest, ReadsOptionalFailBuckets) {
    const auto run = ParseEvaluationRun(nlohmann::json::parse(R"({
        "instance_id": "a",
        "FAIL_TO_FAIL": "[\"f1\"]",
        "PASS_TO_FAIL": ["p1"]
    })"));

    EXPECT_EQ(run.fail_to_fail, std::vector<std::string>{"f1"});
    EXPECT_EQ(run.pass_to_fail, std::vector<std::string>{"p1"});
}

TEST(JobDescriptorTest, RejectsMalformedDescriptors) {
    EXPECT_THROW(ParseEvaluationRun(nlohmann::json::parse(R"({"repo": "x"})")), EvaluationError);
    EXPECT_THROW(ParseEvaluationRun(nlohmann::json::parse(R"({"instance_id": "a", "FAIL_TO_PASS": "[oops"})")),
                 EvaluationError);
    EXPECT_THROW(ParseEvaluationRun(nlohmann::json::parse(R"({"instance_id": "a", "PASS_TO_PASS": [1]})")),
                 EvaluationError);
    EXPECT_THROW(LoadEvaluationRun("/nonexistent/evalbox/details.json"), EvaluationError);
}

TEST(JobDescriptorTest, LoadsFromFile) {
    TempDir dir;
    evalbox::utils::WriteFile(dir / "details.json",
                              R"({"instance_id": "a", "model_patch": "p", "FAIL_TO_PASS": "[]"})");
    const auto run = LoadEvaluationRun((dir / "details.json").string());
    EXPECT_EQ(run.model_patch.value_or(""), "p");
    EXPECT_TRUE(run.fail_to_pass.empty());
}

TEST(JobDescriptorTest, ReportJsonIsKeyedByInstance) {
    EvalReport report;
    report.instance_id = "a";
    report.patch_exists = true;

    const auto json = ReportToJson(report);

    ASSERT_TRUE(json.contains("a"));
    EXPECT_EQ(json["a"]["patch_is_None"], false);
    EXPECT_EQ(json["a"]["patch_exists"], true);
    EXPECT_EQ(json["a"]["patch_successfully_applied"], false);
    EXPECT_EQ(json["a"]["resolved"], false);
    EXPECT_FALSE(json["a"].contains("tests_status"));
}
