#include "eval/grading.hpp"

namespace evalbox::eval {

const std::set<std::string>& FailOnlyRepos() {
    static const std::set<std::string> kRepos = {
        "chartjs/Chart.js",
        "processing/p5.js",
        "markedjs/marked"
    };
    return kRepos;
}

EvalType SelectEvalType(const std::string& repo) {
    return FailOnlyRepos().count(repo) ? EvalType::kFailOnly : EvalType::kPassAndFail;
}

const char* ToString(ResolvedStatus status) {
    switch (status) {
        case ResolvedStatus::kNo: return "RESOLVED_NO";
        case ResolvedStatus::kPartial: return "RESOLVED_PARTIAL";
        case ResolvedStatus::kFull: return "RESOLVED_FULL";
    }
    return "UNKNOWN";
}

bool TestPassed(const std::string& test, const TestStatusMap& statuses) {
    const auto it = statuses.find(test);
    return it != statuses.end()
        && (it->second == TestStatus::kPassed || it->second == TestStatus::kXFail);
}

bool TestFailed(const std::string& test, const TestStatusMap& statuses) {
    const auto it = statuses.find(test);
    return it == statuses.end()
        || it->second == TestStatus::kFailed
        || it->second == TestStatus::kError;
}

TestsReport GetEvalTestsReport(const TestStatusMap& statuses,
                               const std::vector<std::string>& fail_to_pass,
                               const std::vector<std::string>& pass_to_pass,
                               EvalType eval_type,
                               const std::vector<std::string>& fail_to_fail,
                               const std::vector<std::string>& pass_to_fail) {
    const auto classify = [&statuses](const std::vector<std::string>& tests, TestBucket& bucket) {
        for (const auto& test : tests) {
            (TestPassed(test, statuses) ? bucket.success : bucket.failure).push_back(test);
        }
    };
    TestsReport report;
    for (const auto& test : fail_to_pass) {
        if (TestPassed(test, statuses)) {
            report.fail_to_pass.success.push_back(test);
        } else {
            report.fail_to_pass.failure.push_back(test);
        }
    }
    for (const auto& test : pass_to_pass) {
        const bool ok = eval_type == EvalType::kPassAndFail
            ? TestPassed(test, statuses)
            : !TestFailed(test, statuses);
        if (ok) {
            report.pass_to_pass.success.push_back(test);
        } else {
            report.pass_to_pass.failure.push_back(test);
        }
    }
    classify(fail_to_fail, report.fail_to_fail);
    classify(pass_to_fail, report.pass_to_fail);
    return report;
}

double ComputeRate(const TestBucket& bucket) {
    const auto total = bucket.success.size() + bucket.failure.size();
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(bucket.success.size()) / static_cast<double>(total);
}

ResolvedStatus GetResolutionStatus(const TestsReport& report) {
    const double f2p = ComputeRate(report.fail_to_pass);
    const double p2p = ComputeRate(report.pass_to_pass);
    if (f2p == 1.0 && p2p == 1.0) {
        return ResolvedStatus::kFull;
    }
    if (f2p < 1.0 && f2p > 0.0 && p2p == 1.0) {
        return ResolvedStatus::kPartial;
    }
    return ResolvedStatus::kNo;
}

nlohmann::json TestsReportToJson(const TestsReport& report) {
    const auto bucket = [](const TestBucket& value) {
        return nlohmann::json{{"success", value.success}, {"failure", value.failure}};
    };
    return {
        {"FAIL_TO_PASS", bucket(report.fail_to_pass)},
        {"PASS_TO_PASS", bucket(report.pass_to_pass)},
        {"FAIL_TO_FAIL", bucket(report.fail_to_fail)},
        {"PASS_TO_FAIL", bucket(report.pass_to_fail)}
    };
}

}  // namespace evalbox::eval
