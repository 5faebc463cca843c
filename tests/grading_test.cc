#include <gtest/gtest.h>

#include <string>

#include "eval/grading.hpp"
#include "eval/log_parser.hpp"

using namespace evalbox::eval;

TEST(LogParserTest, ReadsLeadingAndTrailingStatusWords) {
    const auto statuses = ParseLogPytest(
        "collected 4 items\n"
        "PASSED tests/test_a.py::test_one\n"
        "FAILED tests/test_a.py::test_two - AssertionError: boom\n"
        "tests/test_b.py::test_three SKIPPED\n"
        "tests/test_b.py::test_four XFAIL\n"
        "ERROR tests/test_c.py::test_five\n"
        "PASSED\n");

    ASSERT_EQ(statuses.size(), 5u);
    EXPECT_EQ(statuses.at("tests/test_a.py::test_one"), TestStatus::kPassed);
    EXPECT_EQ(statuses.at("tests/test_a.py::test_two"), TestStatus::kFailed);
    EXPECT_EQ(statuses.at("tests/test_b.py::test_three"), TestStatus::kSkipped);
    EXPECT_EQ(statuses.at("tests/test_b.py::test_four"), TestStatus::kXFail);
    EXPECT_EQ(statuses.at("tests/test_c.py::test_five"), TestStatus::kError);
}

TEST(LogParserTest, OnlyParsesBetweenOutputMarkers) {
    const auto [statuses, found] = GetLogsEvalFromText(
        "PASSED setup_noise\n"
        ">>>>> Start Test Output\n"
        "PASSED t1\n"
        ">>>>> End Test Output\n"
        "FAILED teardown_noise\n");

    EXPECT_TRUE(found);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses.at("t1"), TestStatus::kPassed);
}

TEST(LogParserTest, FailureMarkersMeanNotFound) {
    for (const char* marker : {kApplyPatchFail, kResetFailed, kTestsError, kTestsTimeout}) {
        const auto [statuses, found] = GetLogsEvalFromText(std::string("PASSED t1\n") + marker + "\n");
        EXPECT_FALSE(found) << marker;
        EXPECT_TRUE(statuses.empty());
    }
}

TEST(LogParserTest, LogWithoutStatusLinesIsNotFound) {
    EXPECT_FALSE(GetLogsEvalFromText("nothing to see here\n").second);
    EXPECT_FALSE(GetLogsEval("/nonexistent/evalbox/test_output.txt").second);
}

TEST(GradingTest, FailOnlyRepositories) {
    EXPECT_EQ(SelectEvalType("chartjs/Chart.js"), EvalType::kFailOnly);
    EXPECT_EQ(SelectEvalType("processing/p5.js"), EvalType::kFailOnly);
    EXPECT_EQ(SelectEvalType("markedjs/marked"), EvalType::kFailOnly);
    EXPECT_EQ(SelectEvalType("django/django"), EvalType::kPassAndFail);
}

TEST(GradingTest, PassToPassFailureIsUnresolved) {
    const TestStatusMap statuses = {{"t1", TestStatus::kPassed}, {"t2", TestStatus::kFailed}};

    const auto report = GetEvalTestsReport(statuses, {"t1"}, {"t2"}, EvalType::kPassAndFail);

    EXPECT_EQ(report.fail_to_pass.success, std::vector<std::string>{"t1"});
    EXPECT_EQ(report.pass_to_pass.failure, std::vector<std::string>{"t2"});
    EXPECT_EQ(GetResolutionStatus(report), ResolvedStatus::kNo);
}

TEST(GradingTest, AllExpectationsMetIsFullyResolved) {
    const TestStatusMap statuses = {{"t1", TestStatus::kPassed}, {"t2", TestStatus::kXFail}};
    const auto report = GetEvalTestsReport(statuses, {"t1"}, {"t2"}, EvalType::kPassAndFail);
    EXPECT_EQ(GetResolutionStatus(report), ResolvedStatus::kFull);
}

TEST(GradingTest, SomeFailToPassIsPartial) {
    const TestStatusMap statuses = {{"t1", TestStatus::kPassed}, {"p", TestStatus::kPassed}};
    const auto report = GetEvalTestsReport(statuses, {"t1", "t3"}, {"p"}, EvalType::kPassAndFail);
    EXPECT_DOUBLE_EQ(ComputeRate(report.fail_to_pass), 0.5);
    EXPECT_EQ(GetResolutionStatus(report), ResolvedStatus::kPartial);
}

TEST(GradingTest, MissingTestCountsAsFailure) {
    const auto report = GetEvalTestsReport({}, {"t1"}, {"t2"}, EvalType::kPassAndFail);
    EXPECT_EQ(report.fail_to_pass.failure, std::vector<std::string>{"t1"});
    EXPECT_EQ(report.pass_to_pass.failure, std::vector<std::string>{"t2"});
}

TEST(GradingTest, FailOnlyModeTreatsSkippedPassToPassAsSuccess) {
    const TestStatusMap statuses = {{"t1", TestStatus::kPassed}, {"t2", TestStatus::kSkipped}};

    const auto fail_only = GetEvalTestsReport(statuses, {"t1"}, {"t2"}, EvalType::kFailOnly);
    const auto strict = GetEvalTestsReport(statuses, {"t1"}, {"t2"}, EvalType::kPassAndFail);

    EXPECT_EQ(GetResolutionStatus(fail_only), ResolvedStatus::kFull);
    EXPECT_EQ(GetResolutionStatus(strict), ResolvedStatus::kNo);
}

TEST(GradingTest, EmptyExpectationsResolve) {
    const auto report = GetEvalTestsReport({{"x", TestStatus::kPassed}}, {}, {}, EvalType::kPassAndFail);
    EXPECT_DOUBLE_EQ(ComputeRate(report.fail_to_pass), 1.0);
    EXPECT_EQ(GetResolutionStatus(report), ResolvedStatus::kFull);
}

TEST(GradingTest, FailToFailAndPassToFailAreReportedOnly) {
    const TestStatusMap statuses = {
        {"t1", TestStatus::kPassed}, {"f1", TestStatus::kFailed}, {"f2", TestStatus::kPassed},
        {"p1", TestStatus::kError}};

    const auto report = GetEvalTestsReport(statuses, {"t1"}, {}, EvalType::kPassAndFail, {"f1", "f2"}, {"p1"});

    EXPECT_EQ(report.fail_to_fail.success, std::vector<std::string>{"f2"});
    EXPECT_EQ(report.fail_to_fail.failure, std::vector<std::string>{"f1"});
    EXPECT_EQ(report.pass_to_fail.failure, std::vector<std::string>{"p1"});
    EXPECT_EQ(GetResolutionStatus(report), ResolvedStatus::kFull);
    EXPECT_EQ(TestsReportToJson(report)["FAIL_TO_FAIL"]["failure"][0], "f1");
}

TEST(GradingTest, TestsReportJsonHasAllBuckets) {
    TestsReport report;
    report.fail_to_pass.success = {"t1"};
    const auto json = TestsReportToJson(report);
    EXPECT_EQ(json["FAIL_TO_PASS"]["success"][0], "t1");
    EXPECT_TRUE(json.contains("PASS_TO_PASS"));
    EXPECT_TRUE(json.contains("FAIL_TO_FAIL"));
    EXPECT_TRUE(json.contains("PASS_TO_FAIL"));
}
